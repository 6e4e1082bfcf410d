#include "buyplan/econ/OptionBuilder.h"

#include <algorithm>
#include <cmath>

namespace buyplan::econ {

int horizonDays(StockHorizon h) {
  switch (h) {
    case StockHorizon::TwoMonths:   return 60;
    case StockHorizon::ThreeMonths: return 90;
  }
  return 90;
}

CaseCaps caseCaps(const Product& p, double budget, const OptionConfig& cfg) {
  CaseCaps caps;
  const int caseSize = std::max(1, p.caseSize);
  const double caseCost = p.supplierPrice * (double)caseSize;
  if (!(caseCost > 0.0) || !(budget > 0.0)) return caps;

  caps.maxCasesByBudget = (int)std::floor(budget / caseCost);

  const double daily = dailySales(p.monthlySales, p.sellerCount);
  const double maxUnitsBySales = daily > 0.0
    ? std::floor(daily * (double)horizonDays(cfg.horizon))
    : (double)caps.maxCasesByBudget * (double)caseSize;
  caps.maxCasesBySales = (int)std::floor(maxUnitsBySales / (double)caseSize);

  caps.maxCases = std::min({caps.maxCasesByBudget, caps.maxCasesBySales, std::max(0, cfg.maxOptionsPerSku)});
  return caps;
}

std::vector<PurchaseOption> buildOptions(const Product& p,
                                         const SupplierTerms& supplier,
                                         double budget,
                                         const PricingContext& ctx,
                                         const OptionConfig& cfg) {
  std::vector<PurchaseOption> out;
  const CaseCaps caps = caseCaps(p, budget, cfg);
  if (caps.maxCases <= 0) return out;

  const int caseSize = std::max(1, p.caseSize);
  out.reserve((std::size_t)caps.maxCases);

  for (int cases = 1; cases <= caps.maxCases; ++cases) {
    const int units = cases * caseSize;
    if ((double)units * p.supplierPrice > budget) break;

    const PricedShipment priced = priceShipment({ShipmentItem{&p, units}}, supplier, ctx);
    if (priced.lines.empty()) break;

    PurchaseOption o = priced.lines.front();
    o.cases = cases;
    out.push_back(std::move(o));
  }
  return out;
}

const PurchaseOption* pickOption(const std::vector<PurchaseOption>& options, OptionPick pick) {
  if (options.empty()) return nullptr;

  if (pick == OptionPick::LargestAffordable) return &options.back();

  const PurchaseOption* best = &options.front();
  for (const PurchaseOption& o : options) {
    if (o.monthlyROI > best->monthlyROI) best = &o;
  }
  return best;
}

} // namespace buyplan::econ
