#pragma once

#include "buyplan/econ/ShipmentPricer.h"

#include <cstdint>
#include <vector>

namespace buyplan::econ {

// How much stock a single order may hold.
enum class StockHorizon : std::uint8_t {
  TwoMonths   = 0,  // 60 days
  ThreeMonths = 1   // 90 days
};

int horizonDays(StockHorizon h);

// Which option represents a SKU when bundles are seeded.
enum class OptionPick : std::uint8_t {
  BestMonthlyRoi    = 0,
  LargestAffordable = 1
};

struct OptionConfig {
  StockHorizon horizon{StockHorizon::ThreeMonths};
  int maxOptionsPerSku{20};
  OptionPick pick{OptionPick::LargestAffordable};
};

struct CaseCaps {
  int maxCasesByBudget{0};
  int maxCasesBySales{0};
  int maxCases{0};  // min of the above and maxOptionsPerSku
};

// floor(budget / caseCost) and floor(floor(dailySales * horizon) / caseSize).
// Without a sales velocity the stock cap falls back to the budget cap.
CaseCaps caseCaps(const Product& p, double budget, const OptionConfig& cfg);

// Options for 1..maxCases cases, each priced as a standalone single-SKU shipment.
// Empty when even one case exceeds `budget`.
std::vector<PurchaseOption> buildOptions(const Product& p,
                                         const SupplierTerms& supplier,
                                         double budget,
                                         const PricingContext& ctx,
                                         const OptionConfig& cfg);

// nullptr for an empty list. BestMonthlyRoi keeps the first of equal options.
const PurchaseOption* pickOption(const std::vector<PurchaseOption>& options, OptionPick pick);

} // namespace buyplan::econ
