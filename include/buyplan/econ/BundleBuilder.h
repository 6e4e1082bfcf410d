#pragma once

#include "buyplan/econ/OptionBuilder.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace buyplan::econ {

struct BundleConfig {
  int seedCount{5};
  int maxBundlesPerSupplier{8};

  // A combined bundle must keep at least this fraction of the current monthly ROI.
  double roiTolerance{0.95};

  // Per-supplier spend ceiling; <= 0 means the global budget.
  double supplierBudgetCap{5000.0};
};

// min(globalBudget, supplierBudgetCap) when the cap is set.
double supplierBudgetFor(double globalBudget, const BundleConfig& cfg);

struct BundleLine {
  std::size_t productIndex{0};  // index into the product list the bundle was built from
  PurchaseOption option;
};

// A supplier-scoped set of options priced as one shipment.
struct Bundle {
  std::string supplierKey;
  std::string supplierName;
  std::vector<BundleLine> lines;

  FreightQuote freight;
  double costBSF{0.0};
  double currencyFee{0.0};
  double shippingAndFees{0.0};
  double totalCostASF{0.0};
  double totalProfit{0.0};
  double churnWeeks{0.0};
  double monthlyROI{0.0};

  bool meetsMoq{true};
};

// Prices `items` (product index + units) as one shipment from `supplier`.
Bundle priceBundle(const std::vector<Product>& products,
                   const std::vector<std::pair<std::size_t, int>>& items,
                   const SupplierTerms& supplier,
                   const PricingContext& ctx);

// Builds the candidate bundles for one supplier.
//
// Every SKU contributes its picked option. Single-SKU bundles are kept when they
// clear MOQ. The top `seedCount` SKUs each seed a greedy combination that adds
// other SKUs while the combined shipment stays within `supplierBudget`, clears
// MOQ and keeps roiTolerance of the current monthly ROI. Results are
// de-duplicated, ranked by monthly ROI and truncated to maxBundlesPerSupplier.
std::vector<Bundle> buildSupplierBundles(const std::vector<Product>& products,
                                         const std::vector<std::size_t>& supplierProducts,
                                         const SupplierTerms& supplier,
                                         double supplierBudget,
                                         const PricingContext& ctx,
                                         const OptionConfig& optionCfg,
                                         const BundleConfig& bundleCfg);

} // namespace buyplan::econ
