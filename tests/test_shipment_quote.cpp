#include "buyplan/econ/ShipmentQuote.h"
#include "tests/test_harness.h"

#include <cmath>
#include <string>

using namespace buyplan;

static bool near(double a, double b, double eps = 1e-9) { return std::abs(a - b) <= eps; }

static econ::QuoteLine quoteLine(const std::string& sku, double price, int caseSize, double caseKg, int units) {
  econ::QuoteLine l;
  l.product.sku = sku;
  l.product.title = "Storage box " + sku;
  l.product.supplierName = "Ningbo Plastics";
  l.product.supplierPrice = price;
  l.product.amazonPrice = price * 3.0;
  l.product.amazonFees = 4.0;
  l.product.monthlySales = 90.0;
  l.product.caseSize = caseSize;
  l.product.dims.weightKg = caseKg;
  l.unitsToOrder = units;
  return l;
}

int test_shipment_quote() {
  int failures = 0;

  econ::SupplierTerms cn;
  cn.supplierKey = "ningboplastics";
  cn.name = "Ningbo Plastics";
  cn.country = "China";
  cn.region = "China";
  cn.warehouse = "Ningbo";
  cn.freightMode = "Sea";
  cn.packagingType = "Pallet";

  econ::FreightCurve curve;
  curve.curveId = "CN-SEA-PALLET";
  curve.region = "China";
  curve.mode = "Sea";
  curve.packaging = "Pallet";
  curve.minKg = 0.0;
  curve.maxKg = 1000.0;
  curve.intercept = 100.0;
  curve.slope = 1.0;

  econ::PlanInputs inputs;
  inputs.freightCurves = {curve};
  const econ::EngineConfig cfg{};

  // ---- Two lines priced as one shipment ----
  {
    // 2 cases x 12kg + 2 cases x 6kg = 36kg -> 136 freight on a 400 order.
    const std::vector<econ::QuoteLine> lines = {
      quoteLine("P1", 10.0, 10, 12.0, 20),
      quoteLine("P2", 20.0, 5, 6.0, 10),
    };
    const econ::ShipmentQuote q = econ::quoteShipment(cn, lines, inputs, cfg);
    CHECK(q.ok);
    CHECK(q.method == "regression");
    CHECK(q.regression.found);
    CHECK(q.regression.curveId == "CN-SEA-PALLET");

    CHECK(near(q.shipmentTotals.totalWeightKg, 36.0));
    CHECK(q.shipmentTotals.warehouse == "Ningbo");
    CHECK(q.shipmentTotals.freightMode == "Sea");

    CHECK(near(q.productCostBSF, 400.0));
    CHECK(near(q.freight.costBSF, 136.0));
    CHECK(near(q.freight.currencyFee, 2.68));
    CHECK(near(q.freight.costASF, 138.68));

    CHECK(q.products.size() == 2);
    if (q.products.size() == 2) {
      CHECK(near(q.products[0].freightMultiplier, 1.3467));
      CHECK(near(q.products[0].landedCostPerUnit, 13.47));
      CHECK(near(q.products[1].landedCostPerUnit, 26.93));
      CHECK(q.products[0].unitsToOrder == 20);
      CHECK(near(q.products[0].dailySalesAvg, 3.0));
      CHECK(q.products[0].daysOfStock == 7.0);
    }
  }

  // ---- Zero-unit lines are ignored ----
  {
    const std::vector<econ::QuoteLine> lines = {
      quoteLine("P1", 10.0, 10, 12.0, 20),
      quoteLine("P2", 20.0, 5, 6.0, 0),
    };
    const econ::ShipmentQuote q = econ::quoteShipment(cn, lines, inputs, cfg);
    CHECK(q.ok);
    CHECK(q.products.size() == 1);
  }

  // ---- Nothing to quote ----
  {
    const econ::ShipmentQuote q = econ::quoteShipment(cn, {quoteLine("P1", 10.0, 10, 12.0, 0)}, inputs, cfg);
    CHECK(!q.ok);
    CHECK(q.error.kind == econ::PlanErrorKind::Input);
    CHECK(q.error.message == "No products provided");
  }

  // ---- Curve miss falls back to generic rates ----
  {
    econ::PlanInputs air = inputs;
    air.freightCurves.front().mode = "Air";
    air.freightConfig.minCharge = 75.0;

    const econ::ShipmentQuote q = econ::quoteShipment(cn, {quoteLine("P1", 10.0, 10, 12.0, 20)}, air, cfg);
    CHECK(q.ok);
    CHECK(q.method == "generic");
    CHECK(!q.regression.found);
    CHECK(!q.regression.message.empty());
    CHECK(near(q.freight.costBSF, 75.0));
  }

  return failures;
}
