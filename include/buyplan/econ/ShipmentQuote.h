#pragma once

#include "buyplan/econ/EngineConfig.h"
#include "buyplan/econ/PlanInputs.h"

#include <string>
#include <vector>

namespace buyplan::econ {

// A fixed order line: the caller already decided the quantity.
struct QuoteLine {
  Product product;
  int unitsToOrder{0};
};

struct QuotedProduct {
  std::string sku;
  std::string title;
  int unitsToOrder{0};

  double supplierPrice{0.0};
  double freightMultiplier{1.0};
  double landedCostPerUnit{0.0};
  double profitPerUnit{0.0};
  double roi{0.0};
  double monthlyROI{0.0};
  double totalCost{0.0};
  double expectedProfit{0.0};

  double dailySalesAvg{0.0};
  double daysOfStock{0.0};
  double churnWeeks{0.0};
};

struct ShipmentTotals {
  double totalWeightKg{0.0};
  double totalCbm{0.0};
  int boxCount{0};
  int palletCount{0};
  std::string warehouse;
  std::string country;
  std::string freightMode;
  std::string packagingType;
};

struct QuoteFreight {
  double costBSF{0.0};        // freight base cost
  double fuelSurcharge{0.0};
  double currencyFee{0.0};
  double costASF{0.0};        // base + fuel + currency fee
};

struct ShipmentQuote {
  bool ok{false};
  PlanError error;

  std::string supplierKey;
  std::string supplierName;
  std::string method;

  ShipmentTotals shipmentTotals;
  QuoteFreight freight;
  RegressionInfo regression;
  double productCostBSF{0.0};
  std::vector<QuotedProduct> products;
};

// Prices a fixed set of order lines from one supplier as one shipment.
// Lines with no units are ignored; an empty order is an Input error.
ShipmentQuote quoteShipment(const SupplierTerms& supplier,
                            const std::vector<QuoteLine>& lines,
                            const PlanInputs& inputs,
                            const EngineConfig& cfg);

} // namespace buyplan::econ
