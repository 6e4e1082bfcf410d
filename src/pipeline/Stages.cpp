#include "buyplan/pipeline/Stages.h"

#include "buyplan/core/Log.h"
#include "buyplan/core/Numeric.h"
#include "buyplan/econ/ShipmentPricer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <set>

namespace buyplan::pipeline {

namespace {

constexpr double kBudgetEpsilon = 1e-6;

std::string money(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

void logStage(int stage, const std::string& msg) {
  BUYPLAN_LOG_INFO("[pipeline][stage " + std::to_string(stage) + "] " + msg);
}

bool budgetUsable(double budget) {
  return std::isfinite(budget) && budget > 0.0;
}

template <class T>
StageRun<T> fail(econ::PlanError e) {
  StageRun<T> run;
  run.error = std::move(e);
  return run;
}

// Products grouped by supplier key, suppliers in first-seen order.
struct SupplierGroups {
  std::vector<std::string> order;
  std::map<std::string, std::vector<std::size_t>> members;
};

SupplierGroups groupBySupplier(const std::vector<econ::Product>& products) {
  SupplierGroups g;
  for (std::size_t i = 0; i < products.size(); ++i) {
    auto& list = g.members[products[i].supplierKey];
    if (list.empty()) g.order.push_back(products[i].supplierKey);
    list.push_back(i);
  }
  return g;
}

// Cases of `p` that fit the stock horizon (at least one).
int horizonCases(const econ::Product& p, const econ::OptionConfig& cfg) {
  const int caseSize = std::max(1, p.caseSize);
  const double daily = econ::dailySales(p.monthlySales, p.sellerCount);
  const double units = std::floor(daily * (double)econ::horizonDays(cfg.horizon));
  const int cases = (int)std::floor(units / (double)caseSize);
  return std::max(1, std::min(cases, std::max(1, cfg.maxOptionsPerSku)));
}

econ::PricingContext pricingContext(const PipelineData& data, const econ::EngineConfig& cfg,
                                    econ::FreightPricing pricing) {
  return econ::PricingContext{data.freightCurves, data.freightConfig, data.churnSettings, cfg.churn, pricing};
}

bool shipmentItems(const MoqBlock& block, const PipelineData& data, std::vector<econ::ShipmentItem>& out) {
  out.clear();
  for (const BlockLine& l : block.lines) {
    if (l.productIndex >= data.products.size()) return false;
    out.push_back(econ::ShipmentItem{&data.products[l.productIndex], l.units});
  }
  return true;
}

// Higher marginal ROI first; within a SKU the lower case number first.
bool betterCase(const CaseItem& a, const CaseItem& b) {
  if (a.marginalRoi != b.marginalRoi) return a.marginalRoi > b.marginalRoi;
  if (a.caseNumber != b.caseNumber) return a.caseNumber < b.caseNumber;
  if (a.supplierKey != b.supplierKey) return a.supplierKey < b.supplierKey;
  return a.sku < b.sku;
}

std::string caseKey(const CaseItem& c) {
  return c.supplierKey + '\n' + c.sku;
}

SubstitutionSnapshot snapshotOf(const std::vector<CaseItem>& cases) {
  SubstitutionSnapshot s;
  double total = 0.0;
  double roiSum = 0.0;
  for (const CaseItem& c : cases) {
    total += c.asfCost;
    roiSum += c.marginalRoi;
  }
  s.caseCount = (int)cases.size();
  s.totalASF = core::roundMoney(total);
  s.avgMarginalRoi = cases.empty() ? 0.0 : core::roundRatio(roiSum / (double)cases.size());
  return s;
}

double averageMarginal(const std::vector<CaseItem>& cases) {
  if (cases.empty()) return 0.0;
  double sum = 0.0;
  for (const CaseItem& c : cases) sum += c.marginalRoi;
  return sum / (double)cases.size();
}

} // namespace

// ------------------------------
// Stage 0

StageRun<Stage0Output> loadStage(const econ::PlanInputs& inputs, PipelineData* outData) {
  StageRun<Stage0Output> run;
  if (!outData) {
    run.error = econ::inputError("no data slot to load into", 0);
    return run;
  }

  PipelineData data;
  const econ::SupplierMap suppliers = econ::buildSupplierMap(inputs.suppliers);
  data.suppliers.reserve(suppliers.size());
  for (const auto& [key, terms] : suppliers) data.suppliers.push_back(terms);

  data.products = econ::eligibleProducts(inputs.products);
  data.freightCurves = inputs.freightCurves;
  data.freightConfig = inputs.freightConfig;
  data.hasFreightConfig = inputs.hasFreightConfig;
  for (const auto& [key, o] : inputs.churnSettings) {
    data.churnSettings[core::normalizeSupplierKey(key)] = o;
  }

  Stage0Output& out = run.output;
  out.suppliersLoaded = (int)inputs.suppliers.size();
  out.productsLoaded = (int)inputs.products.size();
  out.productsEligible = (int)data.products.size();
  out.hasFreightConfig = data.hasFreightConfig;

  *outData = std::move(data);

  logStage(0, std::to_string(out.suppliersLoaded) + " suppliers, " + std::to_string(out.productsLoaded) +
              " products (" + std::to_string(out.productsEligible) + " eligible)" +
              (out.hasFreightConfig ? "" : ", no freight config"));
  run.ok = true;
  return run;
}

// ------------------------------
// Stage 1

StageRun<Stage1Output> buildMoqBlocks(const PipelineData& data, const econ::EngineConfig& cfg) {
  if (data.products.empty()) {
    return fail<Stage1Output>(econ::stageDependencyError(1, "stage 0 loaded no eligible products"));
  }

  StageRun<Stage1Output> run;
  Stage1Output& out = run.output;

  const econ::SupplierMap supplierMap = econ::buildSupplierMap(data.suppliers);
  const SupplierGroups groups = groupBySupplier(data.products);

  for (const std::string& key : groups.order) {
    const std::vector<std::size_t>& idx = groups.members.at(key);
    const econ::SupplierTerms terms = econ::supplierTermsFor(supplierMap, key, data.products[idx.front()].supplierName);

    struct Ranked {
      std::size_t index{0};
      double proxy{0.0};
      int maxCases{1};
    };
    std::vector<Ranked> ranked;
    ranked.reserve(idx.size());
    for (std::size_t i : idx) {
      const econ::Product& p = data.products[i];
      const double roi = econ::computeRoi(econ::profitPerUnitBSF(p), p.supplierPrice);
      const econ::ChurnTerms churnTerms = econ::resolveChurnTerms(p, data.churnSettings, cfg.churn);
      const econ::ChurnBreakdown churn = econ::churnForUnits(p, (double)p.caseSize, churnTerms, cfg.churn);
      ranked.push_back(Ranked{i, econ::monthlyRoi(roi, churn.churnWeeks), horizonCases(p, cfg.option)});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Ranked& a, const Ranked& b) { return a.proxy > b.proxy; });

    MoqBlock block;
    block.supplierKey = terms.supplierKey;
    block.supplierName = terms.name;
    block.moqGBP = terms.moqGBP;

    std::vector<int> caps;
    double running = 0.0;
    for (const Ranked& r : ranked) {
      // The top product is always taken, even when one case already meets MOQ.
      if (block.moqGBP > 0.0 && !block.lines.empty() && running >= block.moqGBP) break;

      const econ::Product& p = data.products[r.index];
      BlockLine l;
      l.productIndex = r.index;
      l.sku = p.sku;
      l.title = p.title;
      l.caseSize = p.caseSize;
      l.cases = 1;
      l.supplierPrice = p.supplierPrice;
      l.proxyMonthlyROI = core::roundRatio(r.proxy);
      running += p.supplierPrice * (double)p.caseSize;
      block.lines.push_back(std::move(l));
      caps.push_back(r.maxCases);
    }

    // Still short of MOQ: one more case per line, round robin, within the stock horizon.
    bool grew = true;
    while (block.moqGBP > 0.0 && running < block.moqGBP && grew) {
      grew = false;
      for (std::size_t i = 0; i < block.lines.size() && running < block.moqGBP; ++i) {
        BlockLine& l = block.lines[i];
        if (l.cases >= caps[i]) continue;
        ++l.cases;
        running += l.supplierPrice * (double)l.caseSize;
        grew = true;
      }
    }

    double proxySum = 0.0;
    for (BlockLine& l : block.lines) {
      l.units = l.cases * l.caseSize;
      l.costBSF = core::roundMoney(l.supplierPrice * (double)l.units);
      block.totalUnits += l.units;
      block.totalCases += l.cases;
      proxySum += l.proxyMonthlyROI;
    }
    block.totalBSF = core::roundMoney(running);
    block.avgProxyROI = block.lines.empty() ? 0.0 : core::roundRatio(proxySum / (double)block.lines.size());
    block.meetsMoq = block.moqGBP <= 0.0 || running + kBudgetEpsilon >= block.moqGBP;

    if (!block.meetsMoq) {
      BUYPLAN_LOG_DEBUG("[pipeline][stage 1] supplier '" + block.supplierKey + "' can't reach MOQ " +
                        money(block.moqGBP) + " within the stock horizon");
    }

    out.includedSkus += (int)block.lines.size();
    out.totalBSF += block.totalBSF;
    out.blocks.push_back(std::move(block));
  }

  std::stable_sort(out.blocks.begin(), out.blocks.end(),
                   [](const MoqBlock& a, const MoqBlock& b) { return a.avgProxyROI > b.avgProxyROI; });

  out.supplierCount = (int)out.blocks.size();
  out.productCount = (int)data.products.size();
  out.totalBSF = core::roundMoney(out.totalBSF);

  logStage(1, std::to_string(out.supplierCount) + " blocks, " + std::to_string(out.includedSkus) +
              " SKUs, BSF " + money(out.totalBSF));
  run.ok = true;
  return run;
}

// ------------------------------
// Stage 2

StageRun<Stage2Output> estimateBlockAsf(const Stage1Output& blocks,
                                        const PipelineData& data,
                                        const econ::EngineConfig& cfg) {
  if (blocks.blocks.empty()) {
    return fail<Stage2Output>(econ::stageDependencyError(2, "stage 1 produced no MOQ blocks"));
  }

  StageRun<Stage2Output> run;
  Stage2Output& out = run.output;

  const econ::SupplierMap supplierMap = econ::buildSupplierMap(data.suppliers);
  const econ::PricingContext ctx = pricingContext(data, cfg, econ::FreightPricing::Estimated);

  std::vector<econ::ShipmentItem> items;
  for (const MoqBlock& block : blocks.blocks) {
    if (!shipmentItems(block, data, items)) {
      return fail<Stage2Output>(
        econ::stageDependencyError(2, "block '" + block.supplierKey + "' refers to a product stage 0 did not load"));
    }

    const econ::SupplierTerms terms = econ::supplierTermsFor(supplierMap, block.supplierKey, block.supplierName);
    const econ::PricedShipment priced = econ::priceShipment(items, terms, ctx);

    double profitBSF = 0.0;
    for (const BlockLine& l : block.lines) {
      profitBSF += (double)l.units * econ::profitPerUnitBSF(data.products[l.productIndex]);
    }

    EstimatedBlock e;
    e.block = block;
    e.estimatedFreight = priced.freight.freightCost;
    e.freightMethod = econ::toString(priced.freight.method);
    e.currencyFee = priced.currencyFee;
    e.freightMultiplier = priced.freightMultiplier;
    e.estimatedASF = core::roundMoney(block.totalBSF * priced.freightMultiplier);
    e.profitBSF = core::roundMoney(profitBSF);
    e.estimatedProfit = core::roundMoney(profitBSF - priced.shippingAndFees);
    e.churnWeeks = priced.churnWeeks;
    e.estimatedMonthlyROI =
      core::roundRatio(econ::monthlyRoi(econ::computeRoi(e.estimatedProfit, e.estimatedASF), e.churnWeeks));

    out.totalBSF += block.totalBSF;
    out.totalASF += e.estimatedASF;
    out.totalFreight += e.estimatedFreight;
    out.totalCurrencyFee += e.currencyFee;
    out.blocks.push_back(std::move(e));
  }

  out.totalBSF = core::roundMoney(out.totalBSF);
  out.totalASF = core::roundMoney(out.totalASF);
  out.totalFreight = core::roundMoney(out.totalFreight);
  out.totalCurrencyFee = core::roundMoney(out.totalCurrencyFee);

  logStage(2, std::to_string(out.blocks.size()) + " blocks, estimated ASF " + money(out.totalASF) +
              " (freight " + money(out.totalFreight) + ", fees " + money(out.totalCurrencyFee) + ")");
  run.ok = true;
  return run;
}

// ------------------------------
// Stage 3

StageRun<Stage3Output> rankSuppliers(const Stage2Output& estimated) {
  if (estimated.blocks.empty()) {
    return fail<Stage3Output>(econ::stageDependencyError(3, "stage 2 produced no estimated blocks"));
  }

  StageRun<Stage3Output> run;
  std::vector<RankedSupplier>& ranked = run.output.ranked;
  ranked.reserve(estimated.blocks.size());
  for (std::size_t i = 0; i < estimated.blocks.size(); ++i) {
    const EstimatedBlock& e = estimated.blocks[i];
    ranked.push_back(RankedSupplier{i, e.block.supplierKey, e.block.supplierName, e.estimatedMonthlyROI,
                                    e.estimatedASF});
  }
  std::stable_sort(ranked.begin(), ranked.end(), [](const RankedSupplier& a, const RankedSupplier& b) {
    return a.estimatedMonthlyROI > b.estimatedMonthlyROI;
  });

  logStage(3, std::to_string(ranked.size()) + " suppliers ranked, top '" + ranked.front().supplierKey + "'");
  run.ok = true;
  return run;
}

// ------------------------------
// Stage 4

StageRun<Stage4Output> allocateBudget(const Stage3Output& ranked, double budget) {
  if (ranked.ranked.empty()) {
    return fail<Stage4Output>(econ::stageDependencyError(4, "stage 3 ranked no suppliers"));
  }
  if (!budgetUsable(budget)) {
    return fail<Stage4Output>(econ::inputError("Budget is missing or invalid", 4));
  }

  StageRun<Stage4Output> run;
  Stage4Output& out = run.output;
  out.budget = budget;

  double remaining = budget;
  for (const RankedSupplier& r : ranked.ranked) {
    if (!(r.estimatedASF > 0.0)) {
      out.rejected.push_back(RejectedSupplier{r, "non_positive_asf"});
    } else if (r.estimatedASF <= remaining + kBudgetEpsilon) {
      out.selected.push_back(r);
      remaining -= r.estimatedASF;
    } else {
      out.rejected.push_back(RejectedSupplier{r, "insufficient_budget"});
    }
  }

  out.spentASF = core::roundMoney(budget - remaining);
  out.remainingASF = core::roundMoney(remaining);

  logStage(4, std::to_string(out.selected.size()) + " selected, " + std::to_string(out.rejected.size()) +
              " rejected, spent " + money(out.spentASF) + " of " + money(budget));
  run.ok = true;
  return run;
}

// ------------------------------
// Stage 5

StageRun<Stage5Output> computeExactAsf(const Stage2Output& estimated,
                                       const Stage4Output& selection,
                                       const PipelineData& data,
                                       const econ::EngineConfig& cfg) {
  if (selection.selected.empty()) {
    return fail<Stage5Output>(econ::stageDependencyError(5, "stage 4 selected no suppliers"));
  }

  StageRun<Stage5Output> run;
  Stage5Output& out = run.output;

  const econ::SupplierMap supplierMap = econ::buildSupplierMap(data.suppliers);
  const econ::PricingContext ctx = pricingContext(data, cfg, econ::FreightPricing::Exact);

  std::vector<econ::ShipmentItem> items;
  for (const RankedSupplier& r : selection.selected) {
    if (r.blockIndex >= estimated.blocks.size() ||
        estimated.blocks[r.blockIndex].block.supplierKey != r.supplierKey) {
      return fail<Stage5Output>(
        econ::stageDependencyError(5, "supplier '" + r.supplierKey + "' has no matching stage 2 block"));
    }
    const MoqBlock& block = estimated.blocks[r.blockIndex].block;
    if (!shipmentItems(block, data, items)) {
      return fail<Stage5Output>(
        econ::stageDependencyError(5, "block '" + block.supplierKey + "' refers to a product stage 0 did not load"));
    }

    const econ::SupplierTerms terms = econ::supplierTermsFor(supplierMap, block.supplierKey, block.supplierName);
    const econ::PricedShipment priced = econ::priceShipment(items, terms, ctx);

    ExactSupplier s;
    s.supplierKey = block.supplierKey;
    s.supplierName = block.supplierName;
    s.blockIndex = r.blockIndex;
    s.freight = priced.freight;
    s.costBSF = priced.costBSF;
    s.currencyFee = priced.currencyFee;
    s.freightMultiplier = priced.freightMultiplier;
    s.exactASF = priced.totalCostASF;
    s.profitLand = priced.totalProfit;
    const double roi = econ::computeRoi(priced.totalProfit, priced.totalCostASF);
    s.roi = core::roundRatio(roi);
    s.churnWeeks = priced.churnWeeks;
    s.exactMonthlyROI = core::roundRatio(econ::monthlyRoi(roi, priced.churnWeeks));

    if (!s.freight.regression.found && !s.freight.regression.message.empty()) {
      BUYPLAN_LOG_DEBUG("[pipeline][stage 5] '" + s.supplierKey + "': " + s.freight.regression.message);
    }

    out.totalBSF += s.costBSF;
    out.totalASF += s.exactASF;
    out.totalFreight += s.freight.freightCost;
    out.totalCurrencyFee += s.currencyFee;
    out.suppliers.push_back(std::move(s));
  }

  out.totalBSF = core::roundMoney(out.totalBSF);
  out.totalASF = core::roundMoney(out.totalASF);
  out.totalFreight = core::roundMoney(out.totalFreight);
  out.totalCurrencyFee = core::roundMoney(out.totalCurrencyFee);

  logStage(5, std::to_string(out.suppliers.size()) + " suppliers, exact ASF " + money(out.totalASF) +
              " (freight " + money(out.totalFreight) + ")");
  run.ok = true;
  return run;
}

// ------------------------------
// Stage 6

StageRun<Stage6Output> reallocateCases(const Stage5Output& exact,
                                       const Stage2Output& estimated,
                                       const PipelineData& data,
                                       double budget,
                                       const econ::EngineConfig& cfg) {
  if (exact.suppliers.empty()) {
    return fail<Stage6Output>(econ::stageDependencyError(6, "stage 5 priced no suppliers"));
  }
  if (!budgetUsable(budget)) {
    return fail<Stage6Output>(econ::inputError("Budget is missing or invalid", 6));
  }

  StageRun<Stage6Output> run;
  Stage6Output& out = run.output;

  std::vector<CaseItem> selected;
  std::vector<CaseItem> dropped;

  for (const ExactSupplier& s : exact.suppliers) {
    if (s.blockIndex >= estimated.blocks.size() || estimated.blocks[s.blockIndex].block.supplierKey != s.supplierKey) {
      return fail<Stage6Output>(
        econ::stageDependencyError(6, "supplier '" + s.supplierKey + "' has no matching stage 2 block"));
    }
    const MoqBlock& block = estimated.blocks[s.blockIndex].block;

    for (const BlockLine& l : block.lines) {
      if (l.productIndex >= data.products.size()) {
        return fail<Stage6Output>(
          econ::stageDependencyError(6, "block '" + block.supplierKey + "' refers to a product stage 0 did not load"));
      }
      const econ::Product& p = data.products[l.productIndex];
      const double landed = econ::computeLandedCostPerUnit(p.supplierPrice, s.freightMultiplier);
      const double unitProfit = econ::profitPerUnitASF(p, landed);
      const double roi = econ::computeRoi(unitProfit, landed);
      const econ::ChurnTerms terms = econ::resolveChurnTerms(p, data.churnSettings, cfg.churn);

      const int maxCases = std::max(l.cases, econ::caseCaps(p, budget, cfg.option).maxCases);
      double previous = 0.0;
      for (int k = 1; k <= maxCases; ++k) {
        const econ::ChurnBreakdown churn = econ::churnForUnits(p, (double)(k * l.caseSize), terms, cfg.churn);

        CaseItem c;
        c.supplierKey = s.supplierKey;
        c.supplierName = s.supplierName;
        c.sku = p.sku;
        c.title = p.title;
        c.productIndex = l.productIndex;
        c.caseNumber = k;
        c.units = l.caseSize;
        c.asfCost = core::roundMoney((double)l.caseSize * landed);
        c.profit = core::roundMoney((double)l.caseSize * unitProfit);
        // A later case never ranks above an earlier one of the same SKU.
        c.marginalRoi = core::roundRatio(econ::monthlyRoi(roi, churn.churnWeeks));
        if (k > 1) c.marginalRoi = std::min(c.marginalRoi, previous);
        previous = c.marginalRoi;

        (k <= l.cases ? selected : dropped).push_back(std::move(c));
      }
    }
  }
  out.poolSize = (int)(selected.size() + dropped.size());

  double total = 0.0;
  for (const CaseItem& c : selected) total += c.asfCost;

  // Over budget: shed the worst cases.
  std::sort(selected.begin(), selected.end(), betterCase);
  while (!selected.empty() && total > budget + kBudgetEpsilon) {
    total -= selected.back().asfCost;
    dropped.push_back(std::move(selected.back()));
    selected.pop_back();
  }

  std::map<std::string, int> held;
  for (const CaseItem& c : selected) held[caseKey(c)] = std::max(held[caseKey(c)], c.caseNumber);

  // Under budget: take the best affordable case that extends a held run.
  std::sort(dropped.begin(), dropped.end(), betterCase);
  bool added = true;
  while (added) {
    added = false;
    for (std::size_t i = 0; i < dropped.size(); ++i) {
      const CaseItem& c = dropped[i];
      if (!(c.marginalRoi > 0.0)) continue;
      if (total + c.asfCost > budget + kBudgetEpsilon) continue;
      const std::string key = caseKey(c);
      if (c.caseNumber != held[key] + 1) continue;

      total += c.asfCost;
      held[key] = c.caseNumber;
      selected.push_back(c);
      dropped.erase(dropped.begin() + (std::ptrdiff_t)i);
      added = true;
      break;
    }
  }

  std::sort(selected.begin(), selected.end(), betterCase);
  for (const CaseItem& c : selected) out.totalUnits += c.units;
  out.totalASF = core::roundMoney(total);
  out.cases = std::move(selected);
  out.dropped = std::move(dropped);

  logStage(6, std::to_string(out.cases.size()) + " of " + std::to_string(out.poolSize) + " cases kept, " +
              std::to_string(out.totalUnits) + " units, ASF " + money(out.totalASF));
  run.ok = true;
  return run;
}

// ------------------------------
// Stage 7

StageRun<Stage7Output> substituteSuppliers(const Stage6Output& cases,
                                           const Stage4Output& selection,
                                           const Stage2Output& estimated,
                                           double budget,
                                           const econ::PipelineConfig& cfg) {
  if (cases.cases.empty()) {
    return fail<Stage7Output>(econ::stageDependencyError(7, "stage 6 kept no cases"));
  }
  if (estimated.blocks.empty()) {
    return fail<Stage7Output>(econ::stageDependencyError(7, "stage 2 produced no estimated blocks"));
  }
  if (!budgetUsable(budget)) {
    return fail<Stage7Output>(econ::inputError("Budget is missing or invalid", 7));
  }

  StageRun<Stage7Output> run;
  Stage7Output& out = run.output;

  std::set<std::string> selectedKeys;
  for (const RankedSupplier& r : selection.selected) selectedKeys.insert(r.supplierKey);

  std::vector<const EstimatedBlock*> candidates;
  for (const EstimatedBlock& e : estimated.blocks) {
    if (!selectedKeys.count(e.block.supplierKey)) candidates.push_back(&e);
  }
  std::stable_sort(candidates.begin(), candidates.end(), [](const EstimatedBlock* a, const EstimatedBlock* b) {
    return a->estimatedMonthlyROI > b->estimatedMonthlyROI;
  });

  std::vector<CaseItem> current = cases.cases;
  out.before = snapshotOf(current);

  std::size_t next = 0;
  while (out.iterations < cfg.substitutionIterations && next < candidates.size() && !current.empty()) {
    ++out.iterations;
    const EstimatedBlock& cand = *candidates[next++];

    std::size_t worst = 0;
    for (std::size_t i = 1; i < current.size(); ++i) {
      if (current[i].marginalRoi < current[worst].marginalRoi) worst = i;
    }

    double total = 0.0;
    for (const CaseItem& c : current) total += c.asfCost;
    const double withoutWorst = total - current[worst].asfCost;
    if (withoutWorst + cand.estimatedASF > budget + kBudgetEpsilon) continue;

    CaseItem block;
    block.supplierKey = cand.block.supplierKey;
    block.supplierName = cand.block.supplierName;
    block.sku = "BLOCK";
    block.title = "MOQ Block";
    block.caseNumber = 1;
    block.units = cand.block.totalUnits;
    block.asfCost = cand.estimatedASF;
    block.profit = cand.estimatedProfit;
    block.marginalRoi = cand.estimatedMonthlyROI;

    std::vector<CaseItem> trial = current;
    const CaseItem removed = trial[worst];
    trial.erase(trial.begin() + (std::ptrdiff_t)worst);
    trial.push_back(block);

    if (averageMarginal(trial) > averageMarginal(current)) {
      out.swaps.push_back(Substitution{removed.supplierKey, removed.sku, block.supplierKey, block.asfCost});
      current = std::move(trial);
      out.improved = true;
    }
  }

  out.after = snapshotOf(current);

  logStage(7, std::string(out.improved ? "improved" : "no improvement") + " after " +
              std::to_string(out.iterations) + " iterations, avg marginal ROI " +
              std::to_string(out.before.avgMarginalRoi) + " -> " + std::to_string(out.after.avgMarginalRoi));
  run.ok = true;
  return run;
}

// ------------------------------
// Stage 8

StageRun<Stage8Output> finalizePlan(const Stage6Output& cases, double budget) {
  if (cases.cases.empty()) {
    return fail<Stage8Output>(econ::stageDependencyError(8, "stage 6 kept no cases"));
  }
  if (!budgetUsable(budget)) {
    return fail<Stage8Output>(econ::inputError("Budget is missing or invalid", 8));
  }

  StageRun<Stage8Output> run;
  Stage8Output& out = run.output;

  std::map<std::string, std::size_t> supplierSlot;
  std::vector<std::map<std::string, std::size_t>> skuSlots;
  std::vector<std::vector<double>> skuRoiWeight;

  double used = 0.0;
  double profit = 0.0;
  double roiWeighted = 0.0;

  for (const CaseItem& c : cases.cases) {
    auto it = supplierSlot.find(c.supplierKey);
    if (it == supplierSlot.end()) {
      FinalSupplier s;
      s.supplierKey = c.supplierKey;
      s.supplierName = c.supplierName;
      out.suppliers.push_back(std::move(s));
      skuSlots.emplace_back();
      skuRoiWeight.emplace_back();
      it = supplierSlot.emplace(c.supplierKey, out.suppliers.size() - 1).first;
    }
    const std::size_t si = it->second;
    FinalSupplier& s = out.suppliers[si];

    auto kt = skuSlots[si].find(c.sku);
    if (kt == skuSlots[si].end()) {
      FinalSku k;
      k.sku = c.sku;
      k.title = c.title;
      s.skus.push_back(std::move(k));
      skuRoiWeight[si].push_back(0.0);
      kt = skuSlots[si].emplace(c.sku, s.skus.size() - 1).first;
    }
    FinalSku& k = s.skus[kt->second];

    ++k.cases;
    k.units += c.units;
    k.asfCost += c.asfCost;
    k.profit += c.profit;
    skuRoiWeight[si][kt->second] += c.marginalRoi * c.asfCost;

    s.totalUnits += c.units;
    s.totalASF += c.asfCost;
    s.expectedProfit += c.profit;

    used += c.asfCost;
    profit += c.profit;
    roiWeighted += c.marginalRoi * c.asfCost;
    out.summary.totalUnits += c.units;
  }

  for (std::size_t si = 0; si < out.suppliers.size(); ++si) {
    FinalSupplier& s = out.suppliers[si];
    for (std::size_t ki = 0; ki < s.skus.size(); ++ki) {
      FinalSku& k = s.skus[ki];
      k.roi = core::roundRatio(econ::computeRoi(k.profit, k.asfCost));
      k.monthlyROI = k.asfCost > 0.0 ? core::roundRatio(skuRoiWeight[si][ki] / k.asfCost) : 0.0;
      k.asfCost = core::roundMoney(k.asfCost);
      k.profit = core::roundMoney(k.profit);
    }
    s.averageROI = core::roundRatio(econ::computeRoi(s.expectedProfit, s.totalASF));
    s.totalASF = core::roundMoney(s.totalASF);
    s.expectedProfit = core::roundMoney(s.expectedProfit);
  }

  FinalSummary& sum = out.summary;
  sum.budget = budget;
  sum.budgetUsed = core::roundMoney(used);
  sum.budgetRemaining = core::roundMoney(budget - used);
  sum.expectedProfit = core::roundMoney(profit);
  sum.averageROI = core::roundRatio(econ::computeRoi(profit, used));
  sum.monthlyROI = used > 0.0 ? core::roundRatio(roiWeighted / used) : 0.0;

  logStage(8, std::to_string(out.suppliers.size()) + " suppliers, " + std::to_string(sum.totalUnits) +
              " units, used " + money(sum.budgetUsed) + " of " + money(budget) + ", profit " +
              money(sum.expectedProfit));
  run.ok = true;
  return run;
}

} // namespace buyplan::pipeline
