#include "buyplan/econ/BudgetOptimizer.h"

#include "buyplan/core/Log.h"
#include "buyplan/core/Numeric.h"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace buyplan::econ {

// Absorbs binary noise when summing 2-decimal currency values.
static constexpr double kBudgetEpsilon = 1e-6;

const char* toString(OptimizerPath p) {
  switch (p) {
    case OptimizerPath::Empty:      return "empty";
    case OptimizerPath::Exhaustive: return "exhaustive";
    case OptimizerPath::Greedy:     return "greedy";
  }
  return "?";
}

bool bundlesOverlap(const Bundle& a, const Bundle& b) {
  if (a.supplierKey != b.supplierKey) return false;
  for (const BundleLine& la : a.lines) {
    for (const BundleLine& lb : b.lines) {
      if (la.option.sku == lb.option.sku) return true;
    }
  }
  return false;
}

static void finalizeResult(OptimizerResult& r, const std::vector<Bundle>& bundles, double budget) {
  double cost = 0.0;
  double profit = 0.0;
  double weighted = 0.0;
  for (std::size_t i : r.selected) {
    const Bundle& b = bundles[i];
    cost += b.totalCostASF;
    profit += b.totalProfit;
    weighted += b.monthlyROI * b.totalCostASF;
  }
  r.totalCostASF = core::roundMoney(cost);
  r.totalProfit = core::roundMoney(profit);
  r.monthlyROI = cost > 0.0 ? core::roundRatio(weighted / cost) : 0.0;
  r.remainingBudget = core::roundMoney(budget - cost);
}

static std::vector<std::size_t> exhaustiveSearch(const std::vector<Bundle>& bundles,
                                                 const std::vector<std::size_t>& cand,
                                                 double budget,
                                                 bool allowOverlap) {
  const std::size_t n = cand.size();

  std::vector<std::uint32_t> conflicts(n, 0u);
  if (!allowOverlap) {
    for (std::size_t i = 0; i < n; ++i) {
      for (std::size_t j = i + 1; j < n; ++j) {
        if (bundlesOverlap(bundles[cand[i]], bundles[cand[j]])) {
          conflicts[i] |= (1u << j);
          conflicts[j] |= (1u << i);
        }
      }
    }
  }

  double bestScore = -std::numeric_limits<double>::infinity();
  std::uint32_t bestMask = 0u;

  const std::uint32_t end = (std::uint32_t)1u << n;
  for (std::uint32_t mask = 1u; mask < end; ++mask) {
    double cost = 0.0;
    double weighted = 0.0;
    bool feasible = true;

    for (std::size_t i = 0; i < n; ++i) {
      if (!(mask & (1u << i))) continue;
      if (conflicts[i] & mask) {
        feasible = false;
        break;
      }
      const Bundle& b = bundles[cand[i]];
      cost += b.totalCostASF;
      if (cost > budget + kBudgetEpsilon) {
        feasible = false;
        break;
      }
      weighted += b.monthlyROI * b.totalCostASF;
    }
    if (!feasible || !(cost > 0.0)) continue;

    const double roi = weighted / cost;
    const double score = roi * 1000.0 + (cost / budget) * 100.0;
    if (score > bestScore) {
      bestScore = score;
      bestMask = mask;
    }
  }

  std::vector<std::size_t> selected;
  for (std::size_t i = 0; i < n; ++i) {
    if (bestMask & (1u << i)) selected.push_back(cand[i]);
  }
  return selected;
}

static std::vector<std::size_t> greedySearch(const std::vector<Bundle>& bundles,
                                             std::vector<std::size_t> cand,
                                             double budget,
                                             bool allowOverlap) {
  std::stable_sort(cand.begin(), cand.end(), [&](std::size_t a, std::size_t b) {
    return bundles[a].monthlyROI > bundles[b].monthlyROI;
  });

  auto conflictsWith = [&](std::size_t idx, const std::vector<std::size_t>& chosen, std::size_t ignoreSlot) {
    if (allowOverlap) return false;
    for (std::size_t k = 0; k < chosen.size(); ++k) {
      if (k == ignoreSlot) continue;
      if (bundlesOverlap(bundles[idx], bundles[chosen[k]])) return true;
    }
    return false;
  };

  std::vector<std::size_t> selected;
  double remaining = budget;
  for (std::size_t idx : cand) {
    const double cost = bundles[idx].totalCostASF;
    if (cost > remaining + kBudgetEpsilon) continue;
    if (conflictsWith(idx, selected, selected.size())) continue;
    selected.push_back(idx);
    remaining -= cost;
  }

  // Single backward sweep: replace a pick with a larger one of no worse ROI.
  if (!selected.empty() && remaining > 0.0) {
    for (std::size_t slot = selected.size(); slot-- > 0;) {
      const Bundle& current = bundles[selected[slot]];
      const double available = remaining + current.totalCostASF;

      for (std::size_t idx : cand) {
        const Bundle& b = bundles[idx];
        if (b.totalCostASF > available + kBudgetEpsilon) continue;
        if (!(b.totalCostASF > current.totalCostASF)) continue;
        if (b.monthlyROI < current.monthlyROI) continue;
        if (std::find(selected.begin(), selected.end(), idx) != selected.end()) continue;
        if (conflictsWith(idx, selected, slot)) continue;

        selected[slot] = idx;
        remaining = available - b.totalCostASF;
        break;
      }
    }
  }
  return selected;
}

OptimizerResult optimizeBudget(const std::vector<Bundle>& bundles, double budget, const OptimizerConfig& cfg) {
  OptimizerResult r;
  r.remainingBudget = core::roundMoney(std::max(0.0, budget));
  if (!(budget > 0.0) || bundles.empty()) return r;

  std::vector<std::size_t> cand;
  for (std::size_t i = 0; i < bundles.size(); ++i) {
    const double cost = bundles[i].totalCostASF;
    if (cost > 0.0 && cost <= budget) cand.push_back(i);
  }
  r.candidateCount = cand.size();
  if (cand.empty()) return r;

  const int limit = std::clamp(cfg.exhaustiveLimit, 0, kMaxExhaustiveCandidates);
  if ((int)cand.size() <= limit) {
    r.path = OptimizerPath::Exhaustive;
    r.selected = exhaustiveSearch(bundles, cand, budget, cfg.allowOverlappingBundles);
  } else {
    r.path = OptimizerPath::Greedy;
    r.selected = greedySearch(bundles, cand, budget, cfg.allowOverlappingBundles);
  }

  finalizeResult(r, bundles, budget);
  BUYPLAN_LOG_INFO(std::string("[optimizer] ") + toString(r.path) + " over " + std::to_string(cand.size()) +
                   " bundles selected " + std::to_string(r.selected.size()));
  return r;
}

} // namespace buyplan::econ
