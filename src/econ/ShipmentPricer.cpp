#include "buyplan/econ/ShipmentPricer.h"

#include "buyplan/core/Numeric.h"

#include <algorithm>

namespace buyplan::econ {

PricedShipment priceShipment(const std::vector<ShipmentItem>& items,
                             const SupplierTerms& supplier,
                             const PricingContext& ctx) {
  PricedShipment out;

  std::vector<ShipmentItem> valid;
  valid.reserve(items.size());
  for (const ShipmentItem& it : items) {
    if (it.product && it.units > 0) valid.push_back(it);
  }
  if (valid.empty()) return out;

  std::vector<ShipmentLine> shipLines;
  shipLines.reserve(valid.size());
  double costBSF = 0.0;
  for (const ShipmentItem& it : valid) {
    shipLines.push_back(shipmentLine(*it.product, it.units));
    costBSF += (double)it.units * it.product->supplierPrice;
  }

  out.freight = computeShipment(shipLines, supplier, ctx.curves, ctx.freight, ctx.pricing);
  out.costBSF = core::roundMoney(costBSF);
  out.currencyFee = computeCurrencyFee(costBSF, supplier.isUK);
  out.shippingAndFees = core::roundMoney(out.freight.freightCost + out.currencyFee);
  out.freightMultiplier = computeFreightMultiplier(costBSF, out.freight.freightCost, out.currencyFee);
  out.totalCostASF = core::roundMoney(costBSF + out.freight.freightCost + out.currencyFee);

  double profitSum = 0.0;
  double roiWeighted = 0.0;
  double lineAsf = 0.0;
  std::vector<WeightedChurnEntry> churnEntries;
  churnEntries.reserve(valid.size());

  for (const ShipmentItem& it : valid) {
    const Product& p = *it.product;

    PurchaseOption o;
    o.sku = p.sku;
    o.units = it.units;
    o.cases = (it.units + std::max(1, p.caseSize) - 1) / std::max(1, p.caseSize);
    o.costBSF = core::roundMoney((double)it.units * p.supplierPrice);
    o.freightMultiplier = out.freightMultiplier;
    o.landedCostPerUnit = computeLandedCostPerUnit(p.supplierPrice, out.freightMultiplier);

    const double profit = profitPerUnitASF(p, o.landedCostPerUnit);
    const double roi = computeRoi(profit, o.landedCostPerUnit);

    const ChurnTerms terms = resolveChurnTerms(p, ctx.churnSettings, ctx.churn);
    const ChurnBreakdown churn = churnForUnits(p, (double)it.units, terms, ctx.churn);

    o.profitPerUnit = core::roundMoney(profit);
    o.roi = core::roundRatio(roi);
    o.dailySales = churn.dailySales;
    o.daysOfStock = churn.daysOfStock;
    o.churnWeeks = core::roundMoney(churn.churnWeeks);
    o.monthlyROI = core::roundRatio(monthlyRoi(roi, churn.churnWeeks));
    o.costASF = core::roundMoney((double)it.units * o.landedCostPerUnit);
    o.totalProfit = core::roundMoney((double)it.units * profit);

    o.freightCost = out.freight.freightCost;
    o.currencyFee = out.currencyFee;
    o.shippingAndFees = out.shippingAndFees;

    profitSum += o.totalProfit;
    roiWeighted += o.monthlyROI * o.costASF;
    lineAsf += o.costASF;
    churnEntries.push_back(WeightedChurnEntry{churn.churnWeeks, (double)it.units * p.supplierPrice});

    out.lines.push_back(std::move(o));
  }

  out.totalProfit = core::roundMoney(profitSum);
  out.roi = core::roundRatio(computeRoi(out.totalProfit, out.totalCostASF));
  out.churnWeeks = core::roundMoney(weightedChurnWeeks(churnEntries));
  out.monthlyROI = lineAsf > 0.0 ? core::roundRatio(roiWeighted / lineAsf) : 0.0;
  return out;
}

} // namespace buyplan::econ
