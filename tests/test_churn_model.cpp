#include "buyplan/econ/ChurnModel.h"
#include "tests/test_harness.h"

#include <cmath>

using namespace buyplan;

static bool near(double a, double b, double eps = 1e-9) { return std::abs(a - b) <= eps; }

int test_churn_model() {
  int failures = 0;

  const econ::ChurnConfig cfg{};

  // ---- Payout rule ----
  CHECK(econ::isBusinessElectronics("Dell Latitude 5420"));
  CHECK(econ::isBusinessElectronics("27in MONITOR stand"));
  CHECK(econ::isBusinessElectronics("USB-C Docks x2"));
  CHECK(!econ::isBusinessElectronics("Garden hose 20m"));
  CHECK(econ::payoutDaysForTitle("Lenovo ThinkPad", cfg) == 42.0);
  CHECK(econ::payoutDaysForTitle("Garden hose 20m", cfg) == 14.0);

  // ---- Velocity + stock days ----
  CHECK(near(econ::dailySales(300.0, 2.0), 5.0));
  CHECK(econ::dailySales(0.0, 2.0) == 0.0);
  CHECK(econ::dailySales(300.0, 0.0) == 0.0);
  CHECK(econ::daysOfStock(12.0, 5.0) == 3.0);
  CHECK(econ::daysOfStock(10.0, 5.0) == 2.0);
  CHECK(econ::daysOfStock(10.0, 0.0) == 0.0);

  // ---- Churn weeks ----
  CHECK(near(econ::churnWeeks(7.0, 21.0, 14.0), 6.0));
  CHECK(near(econ::churnWeeks(7.0, 21.0, 14.0, 1.0), 7.0));
  CHECK(near(econ::churnWeeks(7.0, 21.0, 14.0, 1.0, 5.0), 5.0));
  // A cap above the raw value changes nothing.
  CHECK(near(econ::churnWeeks(7.0, 21.0, 14.0, 0.0, 10.0), 6.0));

  // ---- Monthly ROI ----
  CHECK(near(econ::monthlyRoi(0.3, 6.0), 0.3 / 6.0 * 4.33));
  CHECK(econ::monthlyRoi(0.3, 0.0) == 0.0);
  CHECK(near(econ::computeRoi(30.0, 100.0), 0.3));
  CHECK(econ::computeRoi(30.0, 0.0) == 0.0);

  // ---- Overrides ----
  {
    econ::Product p;
    p.title = "Dell WD19 dock";
    p.supplierKey = "acme";

    econ::ChurnSettings settings;
    econ::ChurnOverride o;
    o.leadDays = 10.0;
    settings["acme"] = o;

    econ::ChurnTerms t = econ::resolveChurnTerms(p, settings, cfg);
    CHECK(t.leadDays == 10.0);
    CHECK(t.payoutDays == 42.0);

    settings["acme"].payoutDays = 7.0;
    t = econ::resolveChurnTerms(p, settings, cfg);
    CHECK(t.payoutDays == 7.0);

    // No entry for this supplier: title rule, no lead time.
    p.supplierKey = "other";
    t = econ::resolveChurnTerms(p, settings, cfg);
    CHECK(t.leadDays == 0.0);
    CHECK(t.payoutDays == 42.0);
  }

  // ---- Churn for a quantity ----
  {
    econ::Product p;
    p.monthlySales = 300.0;
    p.sellerCount = 2.0;
    p.queuedWeeks = 0.5;

    const econ::ChurnTerms terms{7.0, 14.0};
    const econ::ChurnBreakdown b = econ::churnForUnits(p, 12.0, terms, cfg);
    CHECK(near(b.dailySales, 5.0));
    CHECK(b.daysOfStock == 3.0);
    CHECK(near(b.churnWeeks, 24.0 / 7.0 + 0.5));

    econ::ChurnConfig capped = cfg;
    capped.churnCapWeeks = 2.0;
    CHECK(near(econ::churnForUnits(p, 12.0, terms, capped).churnWeeks, 2.0));
  }

  // ---- Weighted churn ----
  CHECK(econ::weightedChurnWeeks({}) == 0.0);
  CHECK(econ::weightedChurnWeeks({{4.0, 0.0}}) == 4.0);
  CHECK(near(econ::weightedChurnWeeks({{4.0, 100.0}, {8.0, 300.0}}), 7.0));

  return failures;
}
