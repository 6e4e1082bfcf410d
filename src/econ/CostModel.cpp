#include "buyplan/econ/CostModel.h"

#include "buyplan/core/Log.h"
#include "buyplan/core/Numeric.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace buyplan::econ {

ShipmentLine shipmentLine(const Product& p, int units) {
  ShipmentLine l;
  l.units = units;
  l.caseSize = std::max(1, p.caseSize);
  l.dims = p.dims;
  return l;
}

static int casesFor(const ShipmentLine& l) {
  if (l.units <= 0) return 0;
  const int cs = std::max(1, l.caseSize);
  return (l.units + cs - 1) / cs;
}

double computeTotalWeight(const std::vector<ShipmentLine>& lines, double packagingWeightPercent) {
  double total = 0.0;
  for (const ShipmentLine& l : lines) {
    if (l.dims.weightKg <= 0.0) continue;
    total += (double)casesFor(l) * l.dims.weightKg;
  }
  if (packagingWeightPercent > 0.0) total *= (1.0 + packagingWeightPercent);
  return core::roundMoney(total);
}

double computeTotalCBM(const std::vector<ShipmentLine>& lines) {
  double total = 0.0;
  for (const ShipmentLine& l : lines) {
    const CaseDimensions& d = l.dims;
    if (d.lengthCm <= 0.0 || d.widthCm <= 0.0 || d.heightCm <= 0.0) continue;
    // cm3 -> m3
    total += (double)casesFor(l) * (d.lengthCm * d.widthCm * d.heightCm) / 1000000.0;
  }
  return core::roundCbm(total);
}

int boxCountFor(double totalWeightKg, const FreightConfig& cfg) {
  if (totalWeightKg <= 0.0 || cfg.kgPerBox <= 0.0) return 0;
  return (int)std::ceil(totalWeightKg / cfg.kgPerBox);
}

int palletCountFor(double totalCbm, const FreightConfig& cfg) {
  if (totalCbm <= 0.0 || cfg.cbmPerPallet <= 0.0) return 0;
  return (int)std::ceil(totalCbm / cfg.cbmPerPallet);
}

std::string packagingBucket(std::string_view packagingType, std::string_view mode) {
  const std::string pack = core::normalizeText(packagingType);
  if (pack == "pallet") return core::normalizeText(mode) == "sea" ? "Pallet" : "Any";
  if (pack == "box") return "Box";
  return "Any";
}

const FreightCurve* findRegressionCurve(const std::vector<FreightCurve>& curves,
                                        std::string_view region,
                                        std::string_view mode,
                                        std::string_view packagingType,
                                        double weightKg) {
  const std::string regionNorm = core::normalizeText(region);
  const std::string modeNorm = core::normalizeText(mode);
  const std::string bucketNorm = core::normalizeText(packagingBucket(packagingType, mode));

  const FreightCurve* fallback = nullptr;
  double fallbackMinKg = 0.0;

  for (const FreightCurve& row : curves) {
    if (!regionNorm.empty() && core::normalizeText(row.region) != regionNorm) continue;
    if (!modeNorm.empty() && core::normalizeText(row.mode) != modeNorm) continue;
    if (core::normalizeText(row.packaging) != bucketNorm) continue;

    const bool inMin = !row.minKg || weightKg >= *row.minKg;
    const bool inMax = !row.maxKg || weightKg <= *row.maxKg;
    if (inMin && inMax) return &row;

    if (row.minKg && weightKg < *row.minKg) {
      if (!fallback || *row.minKg < fallbackMinKg) {
        fallback = &row;
        fallbackMinKg = *row.minKg;
      }
    }
  }
  return fallback;
}

double fuelSurchargeFor(std::string_view raw, double baseCost, double weightKg) {
  const std::string text = core::normalizeText(raw);
  if (text.empty()) return 0.0;

  if (text.find('%') != std::string::npos) {
    // Always a percentage here, so "1%" and "0.5%" are 0.01 and 0.005.
    std::string number;
    for (char c : text) {
      if (c != '%') number.push_back(c);
    }
    const auto pct = core::cleanNumber(number);
    if (!pct || *pct == 0.0) return 0.0;
    return baseCost * (*pct / 100.0);
  }

  if (text.find("/kg") != std::string::npos) {
    std::string digits;
    for (char c : text.substr(0, text.find("/kg"))) {
      if ((c >= '0' && c <= '9') || c == '.') digits.push_back(c);
    }
    const auto rate = core::cleanNumber(digits);
    if (!rate || *rate <= 0.0) return 0.0;
    return *rate * weightKg;
  }
  return 0.0;
}

static std::optional<double> interpolatePoints(std::vector<CurvePoint> points, double x) {
  if (points.empty() || x <= 0.0) return std::nullopt;

  std::stable_sort(points.begin(), points.end(),
                   [](const CurvePoint& a, const CurvePoint& b) { return a.x < b.x; });

  if (x <= points.front().x) return points.front().y;
  if (x >= points.back().x) return points.back().y;

  for (std::size_t i = 0; i + 1 < points.size(); ++i) {
    const CurvePoint& a = points[i];
    const CurvePoint& b = points[i + 1];
    if (x >= a.x && x <= b.x) {
      const double slope = core::safeDivide(b.y - a.y, b.x - a.x);
      return core::roundMoney(a.y + slope * (x - a.x));
    }
  }
  return std::nullopt;
}

std::optional<CurveCost> computeFreightFromCurve(const FreightCurve& curve, double weightKg, double cbm) {
  CurveCost c;
  if (curve.piecewise()) {
    const auto y = interpolatePoints(curve.points, curve.useCBM ? cbm : weightKg);
    if (!y) return std::nullopt;
    c.base = core::roundMoney(*y);
    c.total = c.base;
    return c;
  }

  const double base = curve.intercept + curve.slope * weightKg;
  const double fuel = fuelSurchargeFor(curve.baseFuelSurcharge, base, weightKg);
  c.base = core::roundMoney(base);
  c.fuelSurcharge = core::roundMoney(fuel);
  c.total = core::roundMoney(base + fuel);
  return c;
}

double computeFreightGeneric(double weightKg, double cbm, const FreightConfig& cfg,
                             std::string_view packagingType, int boxCount, int palletCount) {
  double cost = std::max({weightKg * cfg.ratePerKG, cbm * cfg.ratePerCBM, cfg.minCharge});

  const std::string pack = core::normalizeText(packagingType);
  if (pack == "box" || pack == "couriercandidate") {
    cost += (double)boxCount * cfg.boxSurcharge;
  } else if (pack == "pallet") {
    cost += (double)palletCount * cfg.palletSurcharge;
  }

  cost += cfg.handlingFee;
  return core::roundMoney(cost);
}

const char* toString(FreightMethod m) {
  switch (m) {
    case FreightMethod::None:       return "none";
    case FreightMethod::Regression: return "regression";
    case FreightMethod::Generic:    return "generic";
    case FreightMethod::DomesticUk: return "domestic_uk";
  }
  return "?";
}

static std::string noCurveMessage(const SupplierTerms& s, double weightKg) {
  std::ostringstream oss;
  oss << "No regression curve found for region=\"" << s.region << "\", mode=\"" << s.freightMode
      << "\", packaging=\"" << s.packagingType << "\", weight=" << weightKg << "kg";
  return oss.str();
}

FreightQuote computeShipment(const std::vector<ShipmentLine>& lines,
                             const SupplierTerms& supplier,
                             const std::vector<FreightCurve>& curves,
                             const FreightConfig& cfg,
                             FreightPricing pricing) {
  FreightQuote q;
  if (lines.empty()) {
    q.regression.message = "Empty shipment";
    return q;
  }

  q.totalWeightKg = computeTotalWeight(lines, supplier.packagingWeightPercent);
  q.totalCbm = computeTotalCBM(lines);
  q.boxCount = boxCountFor(q.totalWeightKg, cfg);
  q.palletCount = palletCountFor(q.totalCbm, cfg);

  bool curveUsed = false;
  RegressionInfo& reg = q.regression;

  if (pricing == FreightPricing::Estimated) {
    reg.message = "Estimated freight (generic rate model)";
  } else if (supplier.isUK) {
    reg.message = "UK origin supplier - regression curves not applied";
  } else if (curves.empty()) {
    reg.message = "No freight curves provided";
  } else if (supplier.freightMode.empty()) {
    reg.message = "No freight mode set for supplier";
  } else if (q.totalWeightKg <= 0.0 && q.totalCbm <= 0.0) {
    reg.message = "Invalid shipment weight (0 or negative)";
  } else {
    const FreightCurve* curve = findRegressionCurve(curves, supplier.region, supplier.freightMode,
                                                    supplier.packagingType, q.totalWeightKg);
    if (!curve) {
      reg.message = noCurveMessage(supplier, q.totalWeightKg);
      BUYPLAN_LOG_DEBUG("[freight] " + reg.message + "; using generic rates");
    } else {
      const auto cost = computeFreightFromCurve(*curve, q.totalWeightKg, q.totalCbm);
      if (cost && cost->total > 0.0) {
        q.method = FreightMethod::Regression;
        q.freightCost = cost->total;
        q.baseFreight = cost->base;
        q.fuelSurcharge = cost->fuelSurcharge;
        reg.found = true;
        reg.curveId = curve->curveId;
        curveUsed = true;
      } else {
        reg.curveId = curve->curveId;
        reg.message = "Freight curve produced no cost; generic rates used";
        BUYPLAN_LOG_DEBUG("[freight] curve '" + curve->curveId + "' produced no cost");
      }
    }
  }

  if (!curveUsed) {
    q.method = FreightMethod::Generic;
    q.freightCost = computeFreightGeneric(q.totalWeightKg, q.totalCbm, cfg, supplier.packagingType,
                                          q.boxCount, q.palletCount);
    q.baseFreight = q.freightCost;
    q.fuelSurcharge = 0.0;
  }

  if (supplier.isUK && cfg.domesticUkRatePerBox > 0.0) {
    q.method = FreightMethod::DomesticUk;
    q.freightCost = (double)q.boxCount * cfg.domesticUkRatePerBox;
    q.baseFreight = q.freightCost;
    q.fuelSurcharge = 0.0;
  }

  q.freightCost = core::roundMoney(q.freightCost);
  q.baseFreight = core::roundMoney(q.baseFreight);
  return q;
}

double computeCurrencyFee(double costBSF, bool isUK) {
  if (isUK || !(costBSF > 0.0)) return 0.0;
  return core::roundMoney(costBSF * kCurrencyFeeRate);
}

double computeFreightMultiplier(double costBSF, double freightCost, double currencyFee) {
  if (!(costBSF > 0.0)) return 1.0;
  return core::roundRatio(1.0 + (freightCost + currencyFee) / costBSF);
}

double computeLandedCostPerUnit(double supplierPrice, double freightMultiplier) {
  return core::roundMoney(supplierPrice * freightMultiplier);
}

} // namespace buyplan::econ
