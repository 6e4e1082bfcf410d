#include "buyplan/econ/ShipmentQuote.h"

#include "buyplan/core/Log.h"
#include "buyplan/core/Numeric.h"
#include "buyplan/econ/ShipmentPricer.h"

#include <algorithm>

namespace buyplan::econ {

ShipmentQuote quoteShipment(const SupplierTerms& supplier,
                            const std::vector<QuoteLine>& lines,
                            const PlanInputs& inputs,
                            const EngineConfig& cfg) {
  ShipmentQuote q;
  q.supplierKey = supplier.supplierKey;
  q.supplierName = supplier.name;

  std::vector<Product> products;
  std::vector<int> units;
  for (const QuoteLine& l : lines) {
    if (l.unitsToOrder <= 0) continue;
    Product p = l.product;
    p.caseSize = std::max(1, p.caseSize);
    p.sellerCount = std::max(1.0, p.sellerCount);
    if (p.supplierKey.empty()) p.supplierKey = core::normalizeSupplierKey(p.supplierName);
    products.push_back(std::move(p));
    units.push_back(l.unitsToOrder);
  }
  if (products.empty()) {
    q.error = inputError("No products provided");
    return q;
  }

  std::vector<ShipmentItem> items;
  items.reserve(products.size());
  for (std::size_t i = 0; i < products.size(); ++i) items.push_back(ShipmentItem{&products[i], units[i]});

  const PricingContext ctx{inputs.freightCurves, inputs.freightConfig, inputs.churnSettings, cfg.churn,
                           FreightPricing::Exact};
  const PricedShipment priced = priceShipment(items, supplier, ctx);

  q.method = toString(priced.freight.method);
  q.regression = priced.freight.regression;

  q.shipmentTotals.totalWeightKg = priced.freight.totalWeightKg;
  q.shipmentTotals.totalCbm = priced.freight.totalCbm;
  q.shipmentTotals.boxCount = priced.freight.boxCount;
  q.shipmentTotals.palletCount = priced.freight.palletCount;
  q.shipmentTotals.warehouse = supplier.warehouse;
  q.shipmentTotals.country = supplier.country;
  q.shipmentTotals.freightMode = supplier.freightMode;
  q.shipmentTotals.packagingType = supplier.packagingType;

  q.freight.costBSF = priced.freight.baseFreight;
  q.freight.fuelSurcharge = priced.freight.fuelSurcharge;
  q.freight.currencyFee = priced.currencyFee;
  q.freight.costASF = core::roundMoney(priced.freight.freightCost + priced.currencyFee);
  q.productCostBSF = priced.costBSF;

  for (std::size_t i = 0; i < priced.lines.size(); ++i) {
    const PurchaseOption& o = priced.lines[i];
    const Product& p = products[i];

    QuotedProduct qp;
    qp.sku = p.sku;
    qp.title = p.title;
    qp.unitsToOrder = o.units;
    qp.supplierPrice = p.supplierPrice;
    qp.freightMultiplier = o.freightMultiplier;
    qp.landedCostPerUnit = o.landedCostPerUnit;
    qp.profitPerUnit = o.profitPerUnit;
    qp.roi = o.roi;
    qp.monthlyROI = o.monthlyROI;
    qp.totalCost = o.costASF;
    qp.expectedProfit = o.totalProfit;
    qp.dailySalesAvg = core::roundMoney(o.dailySales);
    qp.daysOfStock = o.daysOfStock;
    qp.churnWeeks = o.churnWeeks;
    q.products.push_back(std::move(qp));
  }

  BUYPLAN_LOG_INFO("[quote] supplier '" + supplier.supplierKey + "': " + std::to_string(q.products.size()) +
                   " lines, freight " + q.method + (q.regression.found ? " (curve " + q.regression.curveId + ")" : ""));
  q.ok = true;
  return q;
}

} // namespace buyplan::econ
