#pragma once

#include "buyplan/econ/EngineConfig.h"
#include "buyplan/econ/PlanInputs.h"

#include <string>
#include <vector>

namespace buyplan::econ {

inline constexpr const char* kEngineVersion = "3.1.0";

struct AllocatedProduct {
  std::string sku;
  std::string title;
  int unitsToOrder{0};
  int caseSize{1};

  double supplierPrice{0.0};
  double amazonPrice{0.0};
  double landedCostPerUnit{0.0};
  double profitPerUnit{0.0};
  double roi{0.0};
  double monthlyROI{0.0};
  double churnWeeks{0.0};

  double totalCost{0.0};     // ASF
  double totalProfit{0.0};

  double monthlySales{0.0};
  double sellers{1.0};
};

struct SupplierFreight {
  double freightCost{0.0};
  double currencyFee{0.0};
  double shippingAndFees{0.0};
  double totalWeightKg{0.0};
  double totalCbm{0.0};
  int totalBoxes{0};
  int pallets{0};
  std::string method;  // method of the last bundle priced for this supplier
};

struct SupplierSummary {
  double costBSF{0.0};
  double costASF{0.0};
  double expectedProfit{0.0};
  double roi{0.0};
  double churnWeeks{0.0};
  double monthlyROI{0.0};
};

struct SupplierAllocation {
  std::string supplierKey;
  std::string supplierName;
  SupplierFreight freight;
  SupplierSummary summary;
  std::vector<AllocatedProduct> products;
};

struct AllocationSummary {
  int totalUnits{0};
  double totalCostASF{0.0};
  double expectedProfit{0.0};
  double remainingBudget{0.0};
  double roi{0.0};
  double weightedChurnWeeks{0.0};
  double monthlyROI{0.0};
};

struct AllocationResult {
  std::string engineVersion{kEngineVersion};
  AllocationSummary summary;
  std::vector<SupplierAllocation> suppliers;

  // Diagnostics.
  std::size_t eligibleProducts{0};
  std::size_t bundleCandidates{0};
  OptimizerPath optimizerPath{OptimizerPath::Empty};
};

struct PlanResult {
  bool ok{false};
  PlanError error;
  AllocationResult allocation;
};

// Monolithic allocation: options -> supplier bundles -> global budget optimizer.
// Fails with an Input error for a non-positive budget or an empty product list.
// When no product is eligible the result is ok and empty.
PlanResult generatePlan(const PlanInputs& inputs, const EngineConfig& cfg);

} // namespace buyplan::econ
