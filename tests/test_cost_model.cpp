#include "buyplan/econ/CostModel.h"
#include "tests/test_harness.h"

#include <cmath>
#include <string>
#include <vector>

using namespace buyplan;

static bool near(double a, double b, double eps = 1e-9) { return std::abs(a - b) <= eps; }

static econ::ShipmentLine makeLine(int units, int caseSize, double weightKg, double l = 0, double w = 0, double h = 0) {
  econ::ShipmentLine line;
  line.units = units;
  line.caseSize = caseSize;
  line.dims.weightKg = weightKg;
  line.dims.lengthCm = l;
  line.dims.widthCm = w;
  line.dims.heightCm = h;
  return line;
}

static econ::FreightCurve seaPalletCurve(const std::string& id, double minKg, double maxKg, double intercept, double slope) {
  econ::FreightCurve c;
  c.curveId = id;
  c.region = "China";
  c.mode = "Sea";
  c.packaging = "Pallet";
  c.minKg = minKg;
  c.maxKg = maxKg;
  c.intercept = intercept;
  c.slope = slope;
  return c;
}

static econ::SupplierTerms chinaSeaSupplier() {
  econ::SupplierTerms s;
  s.supplierKey = "shenzhenco";
  s.name = "Shenzhen Co";
  s.country = "China";
  s.region = "China";
  s.freightMode = "Sea";
  s.packagingType = "Pallet";
  return s;
}

int test_cost_model() {
  int failures = 0;

  // ---- Shipment geometry: partial cases round up ----
  {
    const std::vector<econ::ShipmentLine> lines = {makeLine(25, 10, 2.5, 50, 40, 30)};
    CHECK(near(econ::computeTotalWeight(lines, 0.0), 7.5));
    CHECK(near(econ::computeTotalWeight(lines, 0.1), 8.25));
    CHECK(near(econ::computeTotalCBM(lines), 0.18));

    // Missing dimensions contribute nothing.
    const std::vector<econ::ShipmentLine> bare = {makeLine(10, 1, 0.0)};
    CHECK(econ::computeTotalWeight(bare, 0.5) == 0.0);
    CHECK(econ::computeTotalCBM(bare) == 0.0);
  }

  // ---- Box / pallet counts ----
  {
    econ::FreightConfig cfg;
    CHECK(econ::boxCountFor(8.25, cfg) == 1);
    CHECK(econ::boxCountFor(45.0, cfg) == 3);
    CHECK(econ::boxCountFor(0.0, cfg) == 0);
    CHECK(econ::palletCountFor(0.18, cfg) == 1);
    CHECK(econ::palletCountFor(2.5, cfg) == 3);
    CHECK(econ::palletCountFor(0.0, cfg) == 0);
  }

  // ---- Generic rate model ----
  {
    econ::FreightConfig cfg;
    cfg.ratePerKG = 1.5;
    cfg.ratePerCBM = 200.0;
    cfg.minCharge = 50.0;
    cfg.boxSurcharge = 2.0;
    cfg.palletSurcharge = 30.0;
    cfg.handlingFee = 5.0;

    // max(150, 100, 50) + 5 boxes * 2 + 5
    CHECK(near(econ::computeFreightGeneric(100.0, 0.5, cfg, "Box", 5, 1), 165.0));
    // Pallet surcharge instead of box surcharge.
    CHECK(near(econ::computeFreightGeneric(100.0, 0.5, cfg, "pallet", 5, 1), 185.0));
    // Minimum charge wins for a tiny shipment; no packaging surcharge.
    CHECK(near(econ::computeFreightGeneric(1.0, 0.001, cfg, "", 1, 1), 55.0));
  }

  // ---- Currency fee + freight multiplier ----
  {
    CHECK(near(econ::computeCurrencyFee(1000.0, false), 6.7));
    CHECK(econ::computeCurrencyFee(1000.0, true) == 0.0);
    CHECK(econ::computeCurrencyFee(0.0, false) == 0.0);

    CHECK(near(econ::computeFreightMultiplier(1000.0, 100.0, 6.7), 1.1067));
    CHECK(econ::computeFreightMultiplier(0.0, 100.0, 6.7) == 1.0);
    CHECK(near(econ::computeLandedCostPerUnit(10.0, 1.1067), 11.07));
  }

  // ---- Fuel surcharge parsing ----
  {
    CHECK(near(econ::fuelSurchargeFor("12%", 100.0, 50.0), 12.0));
    CHECK(near(econ::fuelSurchargeFor("1%", 200.0, 50.0), 2.0));
    CHECK(near(econ::fuelSurchargeFor("0.5 %", 200.0, 50.0), 1.0));
    CHECK(near(econ::fuelSurchargeFor("\xC2\xA3" "0.15/kg", 100.0, 50.0), 7.5));
    CHECK(econ::fuelSurchargeFor("n/a", 100.0, 50.0) == 0.0);
    CHECK(econ::fuelSurchargeFor("", 100.0, 50.0) == 0.0);
  }

  // ---- Curve cost ----
  {
    econ::FreightCurve reg = seaPalletCurve("R1", 0.0, 1000.0, 50.0, 2.0);
    reg.baseFuelSurcharge = "10%";
    const auto cost = econ::computeFreightFromCurve(reg, 100.0, 0.0);
    CHECK(cost.has_value());
    if (cost) {
      CHECK(near(cost->base, 250.0));
      CHECK(near(cost->fuelSurcharge, 25.0));
      CHECK(near(cost->total, 275.0));
    }

    econ::FreightCurve pw;
    pw.curveId = "P1";
    pw.points = {{100.0, 200.0}, {0.0, 0.0}};
    const auto mid = econ::computeFreightFromCurve(pw, 50.0, 0.0);
    CHECK(mid.has_value() && near(mid->total, 100.0));
    // Beyond the last point the last y is used.
    const auto high = econ::computeFreightFromCurve(pw, 500.0, 0.0);
    CHECK(high.has_value() && near(high->total, 200.0));
    // No usable input.
    CHECK(!econ::computeFreightFromCurve(pw, 0.0, 0.0).has_value());

    pw.useCBM = true;
    const auto byCbm = econ::computeFreightFromCurve(pw, 0.0, 25.0);
    CHECK(byCbm.has_value() && near(byCbm->total, 50.0));
  }

  // ---- Curve lookup ----
  {
    econ::FreightCurve blank;
    blank.curveId = "BLANK";
    blank.mode = "Air";

    econ::FreightCurve indiaAirBox;
    indiaAirBox.curveId = "IN-AIR-BOX";
    indiaAirBox.region = "India";
    indiaAirBox.mode = "Air";
    indiaAirBox.packaging = "Box";

    const std::vector<econ::FreightCurve> curves = {
      seaPalletCurve("SEA-LOW", 0.0, 100.0, 10.0, 1.0),
      seaPalletCurve("SEA-HIGH", 100.01, 500.0, 20.0, 0.5),
      blank,
      indiaAirBox,
    };

    const econ::FreightCurve* c = econ::findRegressionCurve(curves, "china", "SEA", "pallet", 250.0);
    CHECK(c && c->curveId == "SEA-HIGH");
    c = econ::findRegressionCurve(curves, "China", "Sea", "Pallet", 50.0);
    CHECK(c && c->curveId == "SEA-LOW");

    // Above every range: no row qualifies.
    CHECK(econ::findRegressionCurve(curves, "China", "Sea", "Pallet", 900.0) == nullptr);

    // A row with blank region and packaging never stands in for a specific one.
    c = econ::findRegressionCurve(curves, "India", "air", "Box", 12.0);
    CHECK(c && c->curveId == "IN-AIR-BOX");
    CHECK(econ::findRegressionCurve({blank}, "EU", "Air", "Box", 100.0) == nullptr);
    CHECK(econ::findRegressionCurve({blank}, "", "Air", "Box", 100.0) == nullptr);

    // An empty request region accepts rows from any region.
    c = econ::findRegressionCurve(curves, "", "Sea", "Pallet", 50.0);
    CHECK(c && c->curveId == "SEA-LOW");

    // Pallet outside sea freight falls into the "Any" bucket.
    CHECK(econ::packagingBucket("Pallet", "Sea") == "Pallet");
    CHECK(econ::packagingBucket("Pallet", "Road") == "Any");
    CHECK(econ::packagingBucket("box", "Air") == "Box");
    CHECK(econ::packagingBucket("", "Sea") == "Any");
  }

  // ---- Shipment pricing ----
  {
    const econ::SupplierTerms supplier = chinaSeaSupplier();
    const std::vector<econ::ShipmentLine> lines = {makeLine(10, 10, 50.0)};
    econ::FreightConfig cfg;
    cfg.minCharge = 40.0;
    cfg.handlingFee = 2.0;

    const std::vector<econ::FreightCurve> curves = {seaPalletCurve("CN-SEA", 0.0, 1000.0, 100.0, 1.0)};
    const econ::FreightQuote q = econ::computeShipment(lines, supplier, curves, cfg);
    CHECK(q.method == econ::FreightMethod::Regression);
    CHECK(q.regression.found);
    CHECK(q.regression.curveId == "CN-SEA");
    CHECK(near(q.totalWeightKg, 50.0));
    CHECK(near(q.freightCost, 150.0));

    // A curve miss is recorded, then the generic model prices the shipment.
    econ::FreightCurve air;
    air.curveId = "AIR";
    air.mode = "Air";
    const econ::FreightQuote miss = econ::computeShipment(lines, supplier, {air}, cfg);
    CHECK(miss.method == econ::FreightMethod::Generic);
    CHECK(!miss.regression.found);
    CHECK(miss.regression.message.rfind("No regression curve found for region=\"China\", mode=\"Sea\"", 0) == 0);
    CHECK(near(miss.freightCost, 42.0));

    // Estimated pricing never consults curves.
    const econ::FreightQuote est = econ::computeShipment(lines, supplier, curves, cfg, econ::FreightPricing::Estimated);
    CHECK(est.method == econ::FreightMethod::Generic);
    CHECK(near(est.freightCost, 42.0));

    // Empty shipment.
    const econ::FreightQuote none = econ::computeShipment({}, supplier, curves, cfg);
    CHECK(none.method == econ::FreightMethod::None);
    CHECK(none.freightCost == 0.0);
  }

  // ---- UK origin ----
  {
    econ::SupplierTerms uk;
    uk.supplierKey = "londonwholesale";
    uk.country = "UK";
    uk.isUK = true;
    uk.freightMode = "Road";

    econ::FreightConfig cfg;
    cfg.domesticUkRatePerBox = 5.0;

    const std::vector<econ::ShipmentLine> lines = {makeLine(10, 10, 50.0)};
    const std::vector<econ::FreightCurve> curves = {seaPalletCurve("CN-SEA", 0.0, 1000.0, 100.0, 1.0)};
    const econ::FreightQuote q = econ::computeShipment(lines, uk, curves, cfg);
    CHECK(q.method == econ::FreightMethod::DomesticUk);
    CHECK(q.boxCount == 3);
    CHECK(near(q.freightCost, 15.0));

    // Without a domestic rate the generic model applies (all zero here).
    cfg.domesticUkRatePerBox = 0.0;
    const econ::FreightQuote g = econ::computeShipment(lines, uk, curves, cfg);
    CHECK(g.method == econ::FreightMethod::Generic);
    CHECK(g.freightCost == 0.0);
  }

  // ---- Supplier map ----
  {
    econ::SupplierTerms a;
    a.name = "Acme Ltd.";
    a.country = "United Kingdom (UK)";
    a.moqGBP = -5.0;
    econ::SupplierTerms blank;

    const econ::SupplierMap map = econ::buildSupplierMap({a, blank});
    CHECK(map.size() == 1);
    const econ::SupplierTerms t = econ::supplierTermsFor(map, "ACME LTD");
    CHECK(t.supplierKey == "acmeltd");
    CHECK(t.isUK);
    CHECK(t.moqGBP == 0.0);

    const econ::SupplierTerms unknown = econ::supplierTermsFor(map, "Nobody Inc", "Nobody Inc");
    CHECK(unknown.supplierKey == "nobodyinc");
    CHECK(unknown.name == "Nobody Inc");
    CHECK(!unknown.isUK);

    CHECK(econ::isUkCountry("uk"));
    CHECK(econ::isUkCountry("Great Britain"));
    CHECK(econ::isUkCountry("Northern Ireland"));
    CHECK(econ::isUkCountry("GB-ENG"));
    CHECK(!econ::isUkCountry("Ukraine"));
    CHECK(!econ::isUkCountry("Ireland"));
    CHECK(!econ::isUkCountry("Duke Islands"));
    CHECK(!econ::isUkCountry(""));

    econ::SupplierTerms kyiv;
    kyiv.name = "Kyiv Textiles";
    kyiv.country = "Ukraine";
    CHECK(!econ::supplierTermsFor(econ::buildSupplierMap({kyiv}), "kyivtextiles").isUK);
  }

  return failures;
}
