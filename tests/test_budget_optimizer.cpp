#include "buyplan/econ/BudgetOptimizer.h"
#include "tests/test_harness.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace buyplan;

static econ::Bundle makeBundle(const std::string& supplierKey, const std::string& sku, double cost, double monthlyRoi) {
  econ::Bundle b;
  b.supplierKey = supplierKey;
  b.supplierName = supplierKey;
  econ::BundleLine line;
  line.option.sku = sku;
  line.option.costASF = cost;
  b.lines.push_back(line);
  b.totalCostASF = cost;
  b.totalProfit = cost * 0.2;
  b.monthlyROI = monthlyRoi;
  return b;
}

static bool contains(const std::vector<std::size_t>& v, std::size_t x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

int test_budget_optimizer() {
  int failures = 0;

  const econ::OptimizerConfig defaults{};

  // ---- Two suppliers that exactly fill the budget are both taken ----
  {
    const std::vector<econ::Bundle> bundles = {
      makeBundle("alpha", "S1", 600.0, 0.5),
      makeBundle("beta", "S2", 400.0, 0.5),
    };
    const econ::OptimizerResult r = econ::optimizeBudget(bundles, 1000.0, defaults);
    CHECK(r.path == econ::OptimizerPath::Exhaustive);
    CHECK(r.selected.size() == 2);
    CHECK(std::abs(r.totalCostASF - 1000.0) < 1e-9);
    CHECK(std::abs(r.remainingBudget) < 1e-9);
    CHECK(std::abs(r.totalProfit - 200.0) < 1e-9);
    CHECK(std::abs(r.monthlyROI - 0.5) < 1e-9);
  }

  // ---- Never over budget; unaffordable bundles are not candidates ----
  {
    const std::vector<econ::Bundle> bundles = {
      makeBundle("alpha", "S1", 700.0, 0.6),
      makeBundle("beta", "S2", 400.0, 0.7),
      makeBundle("gamma", "S3", 1200.0, 2.0),
    };
    const econ::OptimizerResult r = econ::optimizeBudget(bundles, 1000.0, defaults);
    CHECK(r.candidateCount == 2);
    CHECK(r.selected.size() == 1);
    CHECK(!contains(r.selected, 2));
    CHECK(r.totalCostASF <= 1000.0);
    // 0.7*1000 + 40 beats 0.6*1000 + 70.
    CHECK(contains(r.selected, 1));
  }

  // ---- Overlapping bundles from one supplier ----
  {
    const std::vector<econ::Bundle> bundles = {
      makeBundle("alpha", "S1", 300.0, 0.6),
      makeBundle("alpha", "S1", 500.0, 0.6),
    };
    CHECK(econ::bundlesOverlap(bundles[0], bundles[1]));
    CHECK(!econ::bundlesOverlap(bundles[0], makeBundle("beta", "S1", 300.0, 0.6)));

    const econ::OptimizerResult exclusive = econ::optimizeBudget(bundles, 1000.0, defaults);
    CHECK(exclusive.selected.size() == 1);
    CHECK(contains(exclusive.selected, 1));

    econ::OptimizerConfig overlap;
    overlap.allowOverlappingBundles = true;
    const econ::OptimizerResult both = econ::optimizeBudget(bundles, 1000.0, overlap);
    CHECK(both.selected.size() == 2);
  }

  // ---- Greedy path above the exhaustive limit ----
  {
    std::vector<econ::Bundle> bundles;
    for (int i = 0; i < 25; ++i) {
      bundles.push_back(makeBundle("s" + std::to_string(i), "SKU" + std::to_string(i), 100.0, 0.1 + 0.01 * i));
    }
    const econ::OptimizerResult r = econ::optimizeBudget(bundles, 1000.0, defaults);
    CHECK(r.path == econ::OptimizerPath::Greedy);
    CHECK(r.candidateCount == 25);
    CHECK(r.selected.size() == 10);
    CHECK(r.totalCostASF <= 1000.0 + 1e-9);
    CHECK(!r.selected.empty() && r.selected.front() == 24);
    for (std::size_t idx : r.selected) CHECK(idx >= 15);
  }

  // ---- Greedy backward sweep swaps a pick for a larger one of equal ROI ----
  {
    const std::vector<econ::Bundle> bundles = {
      makeBundle("alpha", "S1", 200.0, 0.5),
      makeBundle("beta", "S2", 500.0, 0.5),
    };
    econ::OptimizerConfig greedyOnly;
    greedyOnly.exhaustiveLimit = 0;
    const econ::OptimizerResult r = econ::optimizeBudget(bundles, 600.0, greedyOnly);
    CHECK(r.path == econ::OptimizerPath::Greedy);
    CHECK(r.selected.size() == 1);
    CHECK(contains(r.selected, 1));
    CHECK(std::abs(r.remainingBudget - 100.0) < 1e-9);
  }

  // ---- Degenerate inputs ----
  {
    const std::vector<econ::Bundle> bundles = {makeBundle("alpha", "S1", 100.0, 0.5)};
    const econ::OptimizerResult none = econ::optimizeBudget(bundles, 0.0, defaults);
    CHECK(none.path == econ::OptimizerPath::Empty);
    CHECK(none.selected.empty());

    const econ::OptimizerResult empty = econ::optimizeBudget({}, 500.0, defaults);
    CHECK(empty.selected.empty());
    CHECK(std::abs(empty.remainingBudget - 500.0) < 1e-9);

    CHECK(std::string(econ::toString(econ::OptimizerPath::Greedy)) == "greedy");
  }

  return failures;
}
