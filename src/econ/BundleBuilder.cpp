#include "buyplan/econ/BundleBuilder.h"

#include "buyplan/core/Log.h"

#include <algorithm>
#include <set>
#include <utility>

namespace buyplan::econ {

double supplierBudgetFor(double globalBudget, const BundleConfig& cfg) {
  if (cfg.supplierBudgetCap > 0.0) return std::min(globalBudget, cfg.supplierBudgetCap);
  return globalBudget;
}

static bool clearsMoq(double costASF, double moq) {
  return moq <= 0.0 || costASF >= moq;
}

Bundle priceBundle(const std::vector<Product>& products,
                   const std::vector<std::pair<std::size_t, int>>& items,
                   const SupplierTerms& supplier,
                   const PricingContext& ctx) {
  std::vector<ShipmentItem> shipment;
  std::vector<std::size_t> indices;
  shipment.reserve(items.size());
  for (const auto& [idx, units] : items) {
    if (idx >= products.size() || units <= 0) continue;
    shipment.push_back(ShipmentItem{&products[idx], units});
    indices.push_back(idx);
  }

  const PricedShipment priced = priceShipment(shipment, supplier, ctx);

  Bundle b;
  b.supplierKey = supplier.supplierKey;
  b.supplierName = supplier.name;
  if (b.supplierName.empty() && !indices.empty()) b.supplierName = products[indices.front()].supplierName;

  b.freight = priced.freight;
  b.costBSF = priced.costBSF;
  b.currencyFee = priced.currencyFee;
  b.shippingAndFees = priced.shippingAndFees;
  b.totalCostASF = priced.totalCostASF;
  b.totalProfit = priced.totalProfit;
  b.churnWeeks = priced.churnWeeks;
  b.monthlyROI = priced.monthlyROI;
  b.meetsMoq = clearsMoq(b.totalCostASF, supplier.moqGBP);

  for (std::size_t i = 0; i < priced.lines.size() && i < indices.size(); ++i) {
    b.lines.push_back(BundleLine{indices[i], priced.lines[i]});
  }
  return b;
}

static std::string bundleSignature(const Bundle& b) {
  std::vector<std::string> parts;
  parts.reserve(b.lines.size());
  for (const BundleLine& l : b.lines) parts.push_back(l.option.sku + ":" + std::to_string(l.option.units));
  std::sort(parts.begin(), parts.end());

  std::string sig;
  for (const std::string& p : parts) {
    sig += p;
    sig += ';';
  }
  return sig;
}

namespace {

struct SkuCandidate {
  std::size_t productIndex{0};
  int units{0};
  Bundle single;
};

} // namespace

std::vector<Bundle> buildSupplierBundles(const std::vector<Product>& products,
                                         const std::vector<std::size_t>& supplierProducts,
                                         const SupplierTerms& supplier,
                                         double supplierBudget,
                                         const PricingContext& ctx,
                                         const OptionConfig& optionCfg,
                                         const BundleConfig& bundleCfg) {
  const double moq = supplier.moqGBP;

  std::vector<SkuCandidate> candidates;
  candidates.reserve(supplierProducts.size());

  for (std::size_t idx : supplierProducts) {
    if (idx >= products.size()) continue;
    const std::vector<PurchaseOption> options = buildOptions(products[idx], supplier, supplierBudget, ctx, optionCfg);
    const PurchaseOption* pick = pickOption(options, optionCfg.pick);
    if (!pick) continue;

    SkuCandidate c;
    c.productIndex = idx;
    c.units = pick->units;
    c.single = priceBundle(products, {{idx, pick->units}}, supplier, ctx);
    if (c.single.lines.empty()) continue;
    candidates.push_back(std::move(c));
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const SkuCandidate& a, const SkuCandidate& b) {
    return a.single.monthlyROI > b.single.monthlyROI;
  });

  std::vector<Bundle> all;
  for (const SkuCandidate& c : candidates) {
    if (c.single.meetsMoq) all.push_back(c.single);
  }

  const std::size_t seeds = std::min(candidates.size(), (std::size_t)std::max(0, bundleCfg.seedCount));
  for (std::size_t s = 0; s < seeds; ++s) {
    Bundle current = candidates[s].single;
    std::vector<std::pair<std::size_t, int>> items = {{candidates[s].productIndex, candidates[s].units}};

    for (std::size_t j = 0; j < candidates.size(); ++j) {
      if (j == s) continue;
      const SkuCandidate& cand = candidates[j];

      // Cheap pre-check before re-pricing the combined shipment.
      if (current.totalCostASF + cand.single.totalCostASF > supplierBudget) continue;

      std::vector<std::pair<std::size_t, int>> trial = items;
      trial.emplace_back(cand.productIndex, cand.units);
      Bundle combined = priceBundle(products, trial, supplier, ctx);

      if (combined.totalCostASF > supplierBudget) continue;
      if (!clearsMoq(combined.totalCostASF, moq)) continue;
      if (combined.monthlyROI < current.monthlyROI * bundleCfg.roiTolerance) continue;

      current = std::move(combined);
      items = std::move(trial);
    }

    if (items.size() > 1 && current.meetsMoq) all.push_back(std::move(current));
  }

  std::set<std::string> seen;
  std::vector<Bundle> unique;
  unique.reserve(all.size());
  for (Bundle& b : all) {
    if (seen.insert(bundleSignature(b)).second) unique.push_back(std::move(b));
  }

  std::stable_sort(unique.begin(), unique.end(), [](const Bundle& a, const Bundle& b) {
    return a.monthlyROI > b.monthlyROI;
  });
  const std::size_t keep = (std::size_t)std::max(0, bundleCfg.maxBundlesPerSupplier);
  if (unique.size() > keep) unique.resize(keep);

  BUYPLAN_LOG_DEBUG("[bundles] supplier '" + supplier.supplierKey + "': " + std::to_string(candidates.size()) +
                    " sku candidates, " + std::to_string(unique.size()) + " bundles");
  return unique;
}

} // namespace buyplan::econ
