#include "buyplan/econ/ChurnModel.h"

#include "buyplan/core/Numeric.h"

#include <array>
#include <cmath>

namespace buyplan::econ {

bool isBusinessElectronics(std::string_view title) {
  // "docks" is covered by "dock".
  static constexpr std::array<std::string_view, 6> kWords = {
    "dell", "lenovo", "microsoft", "hp", "dock", "monitor"
  };
  for (std::string_view w : kWords) {
    if (core::containsIgnoreCase(title, w)) return true;
  }
  return false;
}

double payoutDaysForTitle(std::string_view title, const ChurnConfig& cfg) {
  return isBusinessElectronics(title) ? cfg.businessPayoutDays : cfg.defaultPayoutDays;
}

ChurnTerms resolveChurnTerms(const Product& p, const ChurnSettings& settings, const ChurnConfig& cfg) {
  ChurnTerms t;
  t.payoutDays = payoutDaysForTitle(p.title, cfg);

  const auto it = settings.find(p.supplierKey);
  if (it != settings.end()) {
    if (it->second.leadDays && *it->second.leadDays >= 0.0) t.leadDays = *it->second.leadDays;
    if (it->second.payoutDays && *it->second.payoutDays >= 0.0) t.payoutDays = *it->second.payoutDays;
  }
  return t;
}

double dailySales(double monthlySales, double sellerCount) {
  if (!(monthlySales > 0.0) || !(sellerCount > 0.0)) return 0.0;
  return monthlySales / sellerCount / kDaysPerMonth;
}

double daysOfStock(double units, double dailySalesValue) {
  if (!(dailySalesValue > 0.0) || !(units > 0.0)) return 0.0;
  return std::ceil(units / dailySalesValue);
}

double churnWeeks(double leadDays, double daysOfStockValue, double payoutDays,
                  double queuedWeeks, double capWeeks) {
  double weeks = (leadDays + daysOfStockValue + payoutDays) / kDaysPerWeek;
  if (queuedWeeks > 0.0) weeks += queuedWeeks;
  if (capWeeks > 0.0 && weeks > capWeeks) weeks = capWeeks;
  return weeks;
}

double monthlyRoi(double roi, double churnWeeksValue) {
  if (!(churnWeeksValue > 0.0)) return 0.0;
  return (roi / churnWeeksValue) * kWeeksPerMonth;
}

double computeRoi(double profit, double cost) {
  if (!(cost > 0.0)) return 0.0;
  return core::safeDivide(profit, cost);
}

ChurnBreakdown churnForUnits(const Product& p, double units, const ChurnTerms& terms, const ChurnConfig& cfg) {
  ChurnBreakdown b;
  b.dailySales = dailySales(p.monthlySales, p.sellerCount);
  b.daysOfStock = daysOfStock(units, b.dailySales);
  b.churnWeeks = churnWeeks(terms.leadDays, b.daysOfStock, terms.payoutDays, p.queuedWeeks, cfg.churnCapWeeks);
  return b;
}

double weightedChurnWeeks(const std::vector<WeightedChurnEntry>& entries) {
  if (entries.empty()) return 0.0;
  if (entries.size() == 1) return entries.front().churnWeeks;

  double num = 0.0;
  double den = 0.0;
  for (const WeightedChurnEntry& e : entries) {
    num += e.churnWeeks * e.weight;
    den += e.weight;
  }
  return den > 0.0 ? num / den : 0.0;
}

} // namespace buyplan::econ
