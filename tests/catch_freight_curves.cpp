#include <catch2/catch_test_macros.hpp>

#include "buyplan/econ/CostModel.h"

#include <cmath>
#include <string>
#include <vector>

using namespace buyplan;

static econ::FreightCurve band(const std::string& id, double minKg, double maxKg, double intercept, double slope) {
  econ::FreightCurve c;
  c.curveId = id;
  c.region = "Vietnam";
  c.mode = "Sea";
  c.packaging = "Pallet";
  c.minKg = minKg;
  c.maxKg = maxKg;
  c.intercept = intercept;
  c.slope = slope;
  return c;
}

static bool near(double a, double b) { return std::abs(a - b) <= 1e-9; }

TEST_CASE("Weight bands pick the row whose range contains the shipment") {
  const std::vector<econ::FreightCurve> curves = {
    band("LCL-S", 100.0, 500.0, 150.0, 0.8),
    band("LCL-M", 500.01, 2000.0, 300.0, 0.5),
    band("FCL", 2000.01, 20000.0, 1800.0, 0.1),
  };

  const econ::FreightCurve* c = econ::findRegressionCurve(curves, "Vietnam", "Sea", "Pallet", 750.0);
  REQUIRE(c != nullptr);
  REQUIRE(c->curveId == "LCL-M");

  c = econ::findRegressionCurve(curves, "vietnam ", "sea", "PALLET", 2500.0);
  REQUIRE(c != nullptr);
  REQUIRE(c->curveId == "FCL");
}

TEST_CASE("A shipment lighter than every band uses the band with the lowest minimum") {
  const std::vector<econ::FreightCurve> curves = {
    band("LCL-M", 500.01, 2000.0, 300.0, 0.5),
    band("LCL-S", 100.0, 500.0, 150.0, 0.8),
  };

  const econ::FreightCurve* c = econ::findRegressionCurve(curves, "Vietnam", "Sea", "Pallet", 40.0);
  REQUIRE(c != nullptr);
  REQUIRE(c->curveId == "LCL-S");

  const auto cost = econ::computeFreightFromCurve(*c, 40.0, 0.0);
  REQUIRE(cost.has_value());
  REQUIRE(near(cost->total, 182.0));
}

TEST_CASE("Rows for another region, mode or packaging never match") {
  const std::vector<econ::FreightCurve> curves = {band("LCL-S", 0.0, 500.0, 150.0, 0.8)};

  REQUIRE(econ::findRegressionCurve(curves, "China", "Sea", "Pallet", 200.0) == nullptr);
  REQUIRE(econ::findRegressionCurve(curves, "Vietnam", "Air", "Pallet", 200.0) == nullptr);
  REQUIRE(econ::findRegressionCurve(curves, "Vietnam", "Sea", "Box", 200.0) == nullptr);
  // A supplier without a region accepts any row region.
  REQUIRE(econ::findRegressionCurve(curves, "", "Sea", "Pallet", 200.0) != nullptr);
}

TEST_CASE("Per-kg fuel surcharges scale with weight") {
  econ::FreightCurve c = band("LCL-S", 0.0, 500.0, 100.0, 1.0);
  c.baseFuelSurcharge = "\xC2\xA3" "0.20/kg";

  const auto cost = econ::computeFreightFromCurve(c, 200.0, 0.0);
  REQUIRE(cost.has_value());
  REQUIRE(near(cost->base, 300.0));
  REQUIRE(near(cost->fuelSurcharge, 40.0));
  REQUIRE(near(cost->total, 340.0));
}

TEST_CASE("Piecewise curves interpolate between sorted points") {
  econ::FreightCurve c;
  c.curveId = "PW";
  c.points = {{500.0, 900.0}, {100.0, 300.0}, {200.0, 400.0}};

  REQUIRE(c.piecewise());
  REQUIRE(near(econ::computeFreightFromCurve(c, 150.0, 0.0)->total, 350.0));
  REQUIRE(near(econ::computeFreightFromCurve(c, 350.0, 0.0)->total, 650.0));
  REQUIRE(near(econ::computeFreightFromCurve(c, 50.0, 0.0)->total, 300.0));
  REQUIRE_FALSE(econ::computeFreightFromCurve(c, -1.0, 0.0).has_value());
}

TEST_CASE("A curve that prices at zero falls back to the generic model") {
  econ::SupplierTerms s;
  s.supplierKey = "saigonhome";
  s.region = "Vietnam";
  s.freightMode = "Sea";
  s.packagingType = "Pallet";

  econ::ShipmentLine line;
  line.units = 20;
  line.caseSize = 10;
  line.dims.weightKg = 100.0;

  econ::FreightConfig cfg;
  cfg.ratePerKG = 1.0;

  const std::vector<econ::FreightCurve> curves = {band("ZERO", 0.0, 1000.0, 0.0, 0.0)};
  const econ::FreightQuote q = econ::computeShipment({line}, s, curves, cfg);
  REQUIRE(q.method == econ::FreightMethod::Generic);
  REQUIRE_FALSE(q.regression.found);
  REQUIRE(q.regression.curveId == "ZERO");
  REQUIRE(near(q.freightCost, 200.0));
}
