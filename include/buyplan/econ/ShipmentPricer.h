#pragma once

#include "buyplan/econ/ChurnModel.h"
#include "buyplan/econ/CostModel.h"

#include <string>
#include <vector>

namespace buyplan::econ {

// Everything a shipment price depends on besides the shipment itself.
struct PricingContext {
  const std::vector<FreightCurve>& curves;
  const FreightConfig& freight;
  const ChurnSettings& churnSettings;
  const ChurnConfig& churn;
  FreightPricing pricing{FreightPricing::Exact};
};

// One SKU at one quantity, priced inside a shipment. Recomputed whenever the
// shipment composition changes.
struct PurchaseOption {
  std::string sku;
  int cases{0};
  int units{0};

  double costBSF{0.0};
  double freightMultiplier{1.0};
  double landedCostPerUnit{0.0};
  double profitPerUnit{0.0};
  double roi{0.0};

  double dailySales{0.0};
  double daysOfStock{0.0};
  double churnWeeks{0.0};
  double monthlyROI{0.0};

  double costASF{0.0};
  double totalProfit{0.0};

  // Shipment-level figures of the shipment this option was priced in.
  double freightCost{0.0};
  double currencyFee{0.0};
  double shippingAndFees{0.0};
};

struct ShipmentItem {
  const Product* product{nullptr};
  int units{0};
};

struct PricedShipment {
  FreightQuote freight;

  double costBSF{0.0};
  double currencyFee{0.0};
  double shippingAndFees{0.0};
  double freightMultiplier{1.0};
  double totalCostASF{0.0};
  double totalProfit{0.0};

  double roi{0.0};
  double churnWeeks{0.0};   // BSF-weighted
  double monthlyROI{0.0};   // costASF-weighted over lines

  // One entry per item, same order.
  std::vector<PurchaseOption> lines;
};

// Prices all items as one shipment from `supplier`. Every line is landed with
// the combined shipment multiplier. Items without a product or with no units
// are skipped.
PricedShipment priceShipment(const std::vector<ShipmentItem>& items,
                             const SupplierTerms& supplier,
                             const PricingContext& ctx);

} // namespace buyplan::econ
