#include "buyplan/econ/PlanEngine.h"

#include "buyplan/core/Log.h"
#include "buyplan/core/Numeric.h"

#include <cmath>
#include <map>

namespace buyplan::econ {

static AllocatedProduct allocatedProduct(const Product& p, const PurchaseOption& o) {
  AllocatedProduct a;
  a.sku = p.sku;
  a.title = p.title;
  a.unitsToOrder = o.units;
  a.caseSize = p.caseSize;
  a.supplierPrice = p.supplierPrice;
  a.amazonPrice = p.amazonPrice;
  a.landedCostPerUnit = o.landedCostPerUnit;
  a.profitPerUnit = o.profitPerUnit;
  a.roi = o.roi;
  a.monthlyROI = o.monthlyROI;
  a.churnWeeks = o.churnWeeks;
  a.totalCost = o.costASF;
  a.totalProfit = o.totalProfit;
  a.monthlySales = p.monthlySales;
  a.sellers = p.sellerCount;
  return a;
}

static void summarizeSupplier(SupplierAllocation& s) {
  SupplierSummary sum;
  if (s.products.empty()) {
    s.summary = sum;
    return;
  }

  double costBSF = 0.0;
  double profit = 0.0;
  std::vector<WeightedChurnEntry> churn;
  for (const AllocatedProduct& p : s.products) {
    const double bsf = p.supplierPrice * (double)p.unitsToOrder;
    costBSF += bsf;
    profit += p.totalProfit;
    churn.push_back(WeightedChurnEntry{p.churnWeeks, bsf});
  }

  const double costASF = costBSF + s.freight.shippingAndFees;
  const double roi = computeRoi(profit, costASF);
  const double churnWeeksValue = weightedChurnWeeks(churn);

  sum.costBSF = core::roundMoney(costBSF);
  sum.costASF = core::roundMoney(costASF);
  sum.expectedProfit = core::roundMoney(profit);
  sum.roi = core::roundRatio(roi);
  sum.churnWeeks = core::roundMoney(churnWeeksValue);
  sum.monthlyROI = core::roundRatio(monthlyRoi(roi, churnWeeksValue));
  s.summary = sum;
}

PlanResult generatePlan(const PlanInputs& inputs, const EngineConfig& cfg) {
  PlanResult r;
  const double budget = inputs.budget;

  if (!std::isfinite(budget) || !(budget > 0.0)) {
    r.error = inputError("Budget is missing or invalid");
    return r;
  }
  if (inputs.products.empty()) {
    r.error = inputError("Products array is missing or empty");
    return r;
  }

  AllocationResult& out = r.allocation;
  out.summary.remainingBudget = core::roundMoney(budget);

  const std::vector<Product> products = eligibleProducts(inputs.products);
  out.eligibleProducts = products.size();
  if (products.empty()) {
    BUYPLAN_LOG_WARN("[plan] no eligible products out of " + std::to_string(inputs.products.size()));
    r.ok = true;
    return r;
  }

  const SupplierMap supplierMap = buildSupplierMap(inputs.suppliers);

  // Suppliers in first-seen order.
  std::vector<std::string> supplierOrder;
  std::map<std::string, std::vector<std::size_t>> bySupplier;
  for (std::size_t i = 0; i < products.size(); ++i) {
    auto& list = bySupplier[products[i].supplierKey];
    if (list.empty()) supplierOrder.push_back(products[i].supplierKey);
    list.push_back(i);
  }

  const PricingContext ctx{inputs.freightCurves, inputs.freightConfig, inputs.churnSettings, cfg.churn,
                           FreightPricing::Exact};
  const double supplierBudget = supplierBudgetFor(budget, cfg.bundle);

  std::vector<Bundle> bundles;
  for (const std::string& key : supplierOrder) {
    const std::vector<std::size_t>& idx = bySupplier[key];
    const SupplierTerms terms = supplierTermsFor(supplierMap, key, products[idx.front()].supplierName);
    std::vector<Bundle> b = buildSupplierBundles(products, idx, terms, supplierBudget, ctx, cfg.option, cfg.bundle);
    for (Bundle& x : b) bundles.push_back(std::move(x));
  }
  out.bundleCandidates = bundles.size();

  const OptimizerResult opt = optimizeBudget(bundles, budget, cfg.optimizer);
  out.optimizerPath = opt.path;

  std::map<std::string, std::size_t> slotFor;
  for (std::size_t bi : opt.selected) {
    const Bundle& b = bundles[bi];
    auto it = slotFor.find(b.supplierKey);
    if (it == slotFor.end()) {
      SupplierAllocation s;
      s.supplierKey = b.supplierKey;
      s.supplierName = b.supplierName;
      out.suppliers.push_back(std::move(s));
      it = slotFor.emplace(b.supplierKey, out.suppliers.size() - 1).first;
    }

    SupplierAllocation& s = out.suppliers[it->second];
    s.freight.freightCost += b.freight.freightCost;
    s.freight.currencyFee += b.currencyFee;
    s.freight.shippingAndFees = s.freight.freightCost + s.freight.currencyFee;
    s.freight.totalWeightKg += b.freight.totalWeightKg;
    s.freight.totalCbm += b.freight.totalCbm;
    s.freight.totalBoxes += b.freight.boxCount;
    s.freight.pallets += b.freight.palletCount;
    s.freight.method = toString(b.freight.method);

    for (const BundleLine& l : b.lines) s.products.push_back(allocatedProduct(products[l.productIndex], l.option));
  }

  double totalBSF = 0.0;
  std::vector<WeightedChurnEntry> churn;
  for (SupplierAllocation& s : out.suppliers) {
    s.freight.freightCost = core::roundMoney(s.freight.freightCost);
    s.freight.currencyFee = core::roundMoney(s.freight.currencyFee);
    s.freight.shippingAndFees = core::roundMoney(s.freight.shippingAndFees);
    s.freight.totalWeightKg = core::roundMoney(s.freight.totalWeightKg);
    s.freight.totalCbm = core::roundCbm(s.freight.totalCbm);
    summarizeSupplier(s);

    for (const AllocatedProduct& p : s.products) {
      out.summary.totalUnits += p.unitsToOrder;
      const double bsf = p.supplierPrice * (double)p.unitsToOrder;
      totalBSF += bsf;
      churn.push_back(WeightedChurnEntry{p.churnWeeks, bsf});
    }
  }

  out.summary.totalCostASF = opt.totalCostASF;
  out.summary.expectedProfit = opt.totalProfit;
  out.summary.remainingBudget = opt.remainingBudget;
  out.summary.roi = core::roundRatio(computeRoi(opt.totalProfit, opt.totalCostASF));
  // Global churn is always cost-weighted, even for a single product.
  double churnNum = 0.0;
  for (const WeightedChurnEntry& e : churn) churnNum += e.churnWeeks * e.weight;
  out.summary.weightedChurnWeeks = totalBSF > 0.0 ? core::roundMoney(churnNum / totalBSF) : 0.0;
  out.summary.monthlyROI = opt.monthlyROI;

  BUYPLAN_LOG_INFO("[plan] " + std::to_string(products.size()) + " eligible products, " +
                   std::to_string(bundles.size()) + " bundles, " + std::to_string(out.suppliers.size()) +
                   " suppliers selected, spend " + std::to_string(out.summary.totalCostASF));
  r.ok = true;
  return r;
}

} // namespace buyplan::econ
