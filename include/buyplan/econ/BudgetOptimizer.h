#pragma once

#include "buyplan/econ/BundleBuilder.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace buyplan::econ {

// Exhaustive search never runs above this many candidates.
inline constexpr int kMaxExhaustiveCandidates = 24;

struct OptimizerConfig {
  // Candidate count at or below which every subset is scored (clamped to 24).
  int exhaustiveLimit{20};

  // When false, two bundles buying the same supplier SKU are never selected together.
  bool allowOverlappingBundles{false};
};

enum class OptimizerPath : std::uint8_t {
  Empty      = 0,
  Exhaustive = 1,
  Greedy     = 2
};

const char* toString(OptimizerPath p);

struct OptimizerResult {
  // Indices into the bundle list passed to optimizeBudget(), in selection order.
  std::vector<std::size_t> selected;

  double totalCostASF{0.0};
  double totalProfit{0.0};
  double monthlyROI{0.0};     // budget-weighted: sum(roi * cost) / sum(cost)
  double remainingBudget{0.0};

  OptimizerPath path{OptimizerPath::Empty};
  std::size_t candidateCount{0};
};

bool bundlesOverlap(const Bundle& a, const Bundle& b);

// Selects a subset of bundles maximizing budget-weighted monthly ROI without
// exceeding `budget`.
//
// Candidates are the bundles with 0 < cost <= budget. Up to exhaustiveLimit
// candidates every non-empty subset is scored as
//   monthlyROI * 1000 + (cost / budget) * 100
// and the first best subset wins. Above that a greedy pass takes bundles by
// monthly ROI, then a single backward sweep swaps each pick for a strictly more
// expensive unselected bundle of equal or better ROI that still fits. The greedy
// path is a heuristic, not an exact knapsack.
OptimizerResult optimizeBudget(const std::vector<Bundle>& bundles, double budget, const OptimizerConfig& cfg);

} // namespace buyplan::econ
