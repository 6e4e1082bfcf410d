#pragma once

#include "buyplan/econ/Product.h"
#include "buyplan/econ/Supplier.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace buyplan::econ {

// Fixed FX fee charged on non-UK supplier spend.
inline constexpr double kCurrencyFeeRate = 0.0067;

// ------------------------------
// Freight inputs

struct CurvePoint {
  double x{0.0};
  double y{0.0};
};

// One freight curve row. Two tabulations are supported:
//  - regression: cost = intercept + slope * weightKg, plus a fuel surcharge
//  - piecewise:  `points` non-empty, linear interpolation on weight (or CBM)
//
// Rows match a request on region, mode and packaging bucket. Only an empty
// request region or mode acts as a wildcard. Missing kg bounds always pass.
struct FreightCurve {
  std::string curveId;
  std::string region;
  std::string mode;
  std::string packaging;

  std::optional<double> minKg;
  std::optional<double> maxKg;

  double intercept{0.0};
  double slope{0.0};

  // Raw surcharge text: "12%" (of base cost) or "£0.15/kg" (per kg).
  std::string baseFuelSurcharge;

  bool useCBM{false};
  std::vector<CurvePoint> points;

  bool piecewise() const { return !points.empty(); }
};

// Generic fallback rates used when no curve applies.
struct FreightConfig {
  double ratePerKG{0.0};
  double ratePerCBM{0.0};
  double minCharge{0.0};
  double boxSurcharge{0.0};
  double palletSurcharge{0.0};
  double handlingFee{0.0};
  double domesticUkRatePerBox{0.0};

  // Shipment packing estimates.
  double kgPerBox{20.0};
  double cbmPerPallet{1.2};
};

// One product line inside a shipment.
struct ShipmentLine {
  int units{0};
  int caseSize{1};
  CaseDimensions dims{};
};

ShipmentLine shipmentLine(const Product& p, int units);

// ------------------------------
// Shipment geometry

// Sum of ceil(units/caseSize) * case weight, scaled by (1 + packagingWeightPercent).
// Rounded to 2 places.
double computeTotalWeight(const std::vector<ShipmentLine>& lines, double packagingWeightPercent);

// Sum of ceil(units/caseSize) * case volume in m3. Rounded to 3 places.
double computeTotalCBM(const std::vector<ShipmentLine>& lines);

int boxCountFor(double totalWeightKg, const FreightConfig& cfg);
int palletCountFor(double totalCbm, const FreightConfig& cfg);

// ------------------------------
// Curve lookup

// "Pallet" for pallet+sea, "Box" for box, otherwise "Any".
std::string packagingBucket(std::string_view packagingType, std::string_view mode);

// First row matching region/mode/bucket whose kg range contains `weightKg`.
// When none contains it, the row with the lowest minKg above `weightKg` is used.
// Returns nullptr when nothing matches.
const FreightCurve* findRegressionCurve(const std::vector<FreightCurve>& curves,
                                        std::string_view region,
                                        std::string_view mode,
                                        std::string_view packagingType,
                                        double weightKg);

struct CurveCost {
  double base{0.0};
  double fuelSurcharge{0.0};
  double total{0.0};
};

// Fuel surcharge for a raw "12%" or "£0.15/kg" string. A "%" value is always
// divided by 100. 0 when unparsable.
double fuelSurchargeFor(std::string_view raw, double baseCost, double weightKg);

// Cost from a single curve. nullopt when a piecewise curve has no usable input
// (x <= 0).
std::optional<CurveCost> computeFreightFromCurve(const FreightCurve& curve, double weightKg, double cbm);

// max(weight*ratePerKG, cbm*ratePerCBM, minCharge) + packaging surcharge + handling.
double computeFreightGeneric(double weightKg, double cbm, const FreightConfig& cfg,
                             std::string_view packagingType, int boxCount, int palletCount);

// ------------------------------
// Shipment pricing

enum class FreightMethod : std::uint8_t {
  None       = 0,
  Regression = 1,
  Generic    = 2,
  DomesticUk = 3
};

// Estimated pricing skips curve lookup and uses the generic model only.
enum class FreightPricing : std::uint8_t {
  Exact     = 0,
  Estimated = 1
};

const char* toString(FreightMethod m);

// Curve lookup outcome. A miss is recorded here, never reported as an error.
struct RegressionInfo {
  bool found{false};
  std::string curveId;
  std::string message;
};

struct FreightQuote {
  FreightMethod method{FreightMethod::None};

  double freightCost{0.0};      // total freight, surcharge included
  double baseFreight{0.0};      // curve base cost (regression) or freightCost
  double fuelSurcharge{0.0};

  double totalWeightKg{0.0};
  double totalCbm{0.0};
  int boxCount{0};
  int palletCount{0};

  RegressionInfo regression;
};

FreightQuote computeShipment(const std::vector<ShipmentLine>& lines,
                             const SupplierTerms& supplier,
                             const std::vector<FreightCurve>& curves,
                             const FreightConfig& cfg,
                             FreightPricing pricing = FreightPricing::Exact);

// 0 for UK suppliers or non-positive spend, else round(costBSF * 0.0067, 2).
double computeCurrencyFee(double costBSF, bool isUK);

// 1 + (freight + fee) / costBSF rounded to 4 places; 1.0 when costBSF <= 0.
double computeFreightMultiplier(double costBSF, double freightCost, double currencyFee);

double computeLandedCostPerUnit(double supplierPrice, double freightMultiplier);

} // namespace buyplan::econ
