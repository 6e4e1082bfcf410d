#include "buyplan/econ/OptionBuilder.h"
#include "tests/test_harness.h"

#include <cmath>
#include <vector>

using namespace buyplan;

static bool near(double a, double b, double eps = 1e-9) { return std::abs(a - b) <= eps; }

int test_option_builder() {
  int failures = 0;

  const std::vector<econ::FreightCurve> curves;
  const econ::FreightConfig freeFreight{};
  const econ::ChurnSettings churnSettings;
  const econ::ChurnConfig churnCfg{};
  const econ::PricingContext ctx{curves, freeFreight, churnSettings, churnCfg};

  econ::SupplierTerms uk;
  uk.supplierKey = "londonwholesale";
  uk.name = "London Wholesale";
  uk.country = "UK";
  uk.isUK = true;

  // ---- Budget 1000, one unit per case, zero freight ----
  {
    econ::Product p;
    p.sku = "B000TEST01";
    p.title = "Stainless steel water bottle";
    p.supplierKey = uk.supplierKey;
    p.supplierPrice = 100.0;
    p.amazonPrice = 160.0;
    p.amazonFees = 20.0;
    p.vatPerUnit = 10.0;
    p.monthlySales = 300.0;
    p.sellerCount = 1.0;

    econ::OptionConfig cfg;
    const econ::CaseCaps caps = econ::caseCaps(p, 1000.0, cfg);
    CHECK(caps.maxCasesByBudget == 10);
    CHECK(caps.maxCasesBySales == 900);
    CHECK(caps.maxCases == 10);

    const std::vector<econ::PurchaseOption> options = econ::buildOptions(p, uk, 1000.0, ctx, cfg);
    CHECK(options.size() == 10);

    const econ::PurchaseOption* largest = econ::pickOption(options, econ::OptionPick::LargestAffordable);
    CHECK(largest != nullptr);
    if (largest) {
      CHECK(largest->units == 10);
      CHECK(largest->cases == 10);
      CHECK(near(largest->costASF, 1000.0));
      CHECK(near(largest->profitPerUnit, 30.0));
      CHECK(near(largest->totalProfit, 300.0));
      CHECK(near(largest->roi, 0.3));
      CHECK(largest->freightMultiplier == 1.0);
      CHECK(largest->currencyFee == 0.0);
    }

    // Every option here holds one day of stock, so monthly ROI ties and the
    // first option wins.
    const econ::PurchaseOption* best = econ::pickOption(options, econ::OptionPick::BestMonthlyRoi);
    CHECK(best != nullptr && best->units == 1);

    CHECK(econ::pickOption({}, econ::OptionPick::BestMonthlyRoi) == nullptr);
  }

  // ---- Case quantization ----
  {
    econ::Product p;
    p.sku = "CASE6";
    p.title = "Notebook pack";
    p.supplierKey = uk.supplierKey;
    p.supplierPrice = 10.0;
    p.amazonPrice = 25.0;
    p.amazonFees = 5.0;
    p.monthlySales = 6.0;
    p.caseSize = 6;

    econ::OptionConfig cfg;

    // One case costs 60: nothing fits 50.
    CHECK(econ::buildOptions(p, uk, 50.0, ctx, cfg).empty());

    // 0.2 units/day for 90 days -> 18 units -> 3 cases.
    const std::vector<econ::PurchaseOption> three = econ::buildOptions(p, uk, 250.0, ctx, cfg);
    CHECK(three.size() == 3);
    for (std::size_t i = 0; i < three.size(); ++i) {
      CHECK(three[i].cases == (int)i + 1);
      CHECK(three[i].units == ((int)i + 1) * 6);
    }

    cfg.horizon = econ::StockHorizon::TwoMonths;
    CHECK(econ::buildOptions(p, uk, 250.0, ctx, cfg).size() == 2);

    cfg.horizon = econ::StockHorizon::ThreeMonths;
    cfg.maxOptionsPerSku = 1;
    CHECK(econ::buildOptions(p, uk, 250.0, ctx, cfg).size() == 1);

    // No sales velocity: the stock cap follows the budget cap.
    p.monthlySales = 0.0;
    const econ::CaseCaps caps = econ::caseCaps(p, 250.0, econ::OptionConfig{});
    CHECK(caps.maxCasesByBudget == 4);
    CHECK(caps.maxCasesBySales == 4);
  }

  // ---- Non-UK supplier: freight and FX fee land on the unit cost ----
  {
    econ::SupplierTerms cn;
    cn.supplierKey = "shenzhenco";
    cn.country = "China";
    cn.freightMode = "Sea";

    econ::FreightConfig freight;
    freight.minCharge = 50.0;
    const econ::PricingContext paid{curves, freight, churnSettings, churnCfg};

    econ::Product p;
    p.sku = "CN1";
    p.title = "Desk lamp";
    p.supplierKey = cn.supplierKey;
    p.supplierPrice = 10.0;
    p.amazonPrice = 40.0;
    p.amazonFees = 6.0;
    p.monthlySales = 120.0;
    p.caseSize = 6;

    const std::vector<econ::PurchaseOption> options = econ::buildOptions(p, cn, 60.0, paid, econ::OptionConfig{});
    CHECK(options.size() == 1);
    if (!options.empty()) {
      const econ::PurchaseOption& o = options.front();
      CHECK(near(o.freightCost, 50.0));
      CHECK(near(o.currencyFee, 0.4));
      CHECK(near(o.freightMultiplier, 1.84));
      CHECK(near(o.landedCostPerUnit, 18.4));
      CHECK(near(o.costASF, 110.4));
      // The ASF cost may exceed the budget; only the BSF cost is capped.
      CHECK(o.costBSF <= 60.0);
    }
  }

  return failures;
}
