#pragma once

#include "buyplan/econ/Product.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace buyplan::econ {

inline constexpr double kWeeksPerMonth = 4.33;
inline constexpr double kDaysPerMonth = 30.0;
inline constexpr double kDaysPerWeek = 7.0;

struct ChurnConfig {
  double defaultPayoutDays{14.0};
  double businessPayoutDays{42.0};

  // <= 0 disables the cap.
  double churnCapWeeks{0.0};
};

// Per-supplier overrides supplied with a request.
struct ChurnOverride {
  std::optional<double> leadDays;
  std::optional<double> payoutDays;
};

using ChurnSettings = std::map<std::string, ChurnOverride, std::less<>>;

struct ChurnTerms {
  double leadDays{0.0};
  double payoutDays{14.0};
};

// Title mentions dell, lenovo, microsoft, hp, dock(s) or monitor (any case).
bool isBusinessElectronics(std::string_view title);

double payoutDaysForTitle(std::string_view title, const ChurnConfig& cfg);

// Lead days from the supplier override (0 otherwise); payout days from the
// override when present, else from the title rule.
ChurnTerms resolveChurnTerms(const Product& p, const ChurnSettings& settings, const ChurnConfig& cfg);

// monthlySales / sellerCount / 30, or 0.
double dailySales(double monthlySales, double sellerCount);

// ceil(units / dailySales), or 0 when dailySales <= 0.
double daysOfStock(double units, double dailySalesValue);

// (lead + stock + payout) / 7 + queuedWeeks, capped when capWeeks > 0.
double churnWeeks(double leadDays, double daysOfStockValue, double payoutDays,
                  double queuedWeeks = 0.0, double capWeeks = 0.0);

// (roi / churnWeeks) * 4.33, or 0 when churnWeeks <= 0.
double monthlyRoi(double roi, double churnWeeksValue);

// profit / cost, or 0 when cost <= 0.
double computeRoi(double profit, double cost);

struct ChurnBreakdown {
  double dailySales{0.0};
  double daysOfStock{0.0};
  double churnWeeks{0.0};
};

// Churn for holding `units` of `p`.
ChurnBreakdown churnForUnits(const Product& p, double units, const ChurnTerms& terms, const ChurnConfig& cfg);

// Cost-weighted churn weeks; a single entry returns its own churn.
struct WeightedChurnEntry {
  double churnWeeks{0.0};
  double weight{0.0};
};
double weightedChurnWeeks(const std::vector<WeightedChurnEntry>& entries);

} // namespace buyplan::econ
