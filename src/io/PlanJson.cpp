#include "buyplan/io/PlanJson.h"

#include "buyplan/core/Hash.h"
#include "buyplan/core/Numeric.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <variant>

namespace buyplan::io {

using Json = nlohmann::json;

namespace {

bool fail(std::string* outError, std::string msg) {
  if (outError) *outError = std::move(msg);
  return false;
}

// First non-null member among `keys`.
const Json* member(const Json& obj, std::initializer_list<const char*> keys) {
  if (!obj.is_object()) return nullptr;
  for (const char* k : keys) {
    const auto it = obj.find(k);
    if (it != obj.end() && !it->is_null()) return &*it;
  }
  return nullptr;
}

std::optional<double> number(const Json* v) {
  if (!v) return std::nullopt;
  if (v->is_number()) {
    const double d = v->get<double>();
    if (!std::isfinite(d)) return std::nullopt;
    return d;
  }
  if (v->is_string()) return core::cleanNumber(v->get_ref<const std::string&>());
  return std::nullopt;
}

double numberOr(const Json& obj, std::initializer_list<const char*> keys, double fallback) {
  return number(member(obj, keys)).value_or(fallback);
}

std::optional<double> optionalNumber(const Json& obj, std::initializer_list<const char*> keys) {
  return number(member(obj, keys));
}

std::string text(const Json& obj, std::initializer_list<const char*> keys) {
  const Json* v = member(obj, keys);
  if (!v) return {};
  if (v->is_string()) return v->get<std::string>();
  if (v->is_number_integer()) return std::to_string(v->get<long long>());
  if (v->is_number()) return v->dump();
  return {};
}

bool flag(const Json& obj, std::initializer_list<const char*> keys, bool fallback) {
  const Json* v = member(obj, keys);
  if (!v) return fallback;
  if (v->is_boolean()) return v->get<bool>();
  if (v->is_number()) return v->get<double>() != 0.0;
  if (v->is_string()) {
    const std::string s = core::normalizeText(v->get_ref<const std::string&>());
    return s == "true" || s == "yes" || s == "1";
  }
  return fallback;
}

// Fractions stay as given; whole-number percentages (5 -> 0.05) are scaled.
double percentFraction(double v) {
  return v > 1.0 ? v / 100.0 : v;
}

std::string upperTrim(std::string_view s) {
  std::string out = core::normalizeText(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)std::toupper(c); });
  return out;
}

// Optional {byASIN, byEAN, byTitle} dimension tables.
struct DimsLookup {
  const Json* byAsin{nullptr};
  const Json* byEan{nullptr};
  const Json* byTitle{nullptr};

  const Json* find(const std::string& asin, const std::string& ean, const std::string& title) const {
    const auto in = [](const Json* table, const std::string& key) -> const Json* {
      if (!table || key.empty() || !table->is_object()) return nullptr;
      const auto it = table->find(key);
      return (it != table->end() && it->is_object()) ? &*it : nullptr;
    };
    if (const Json* r = in(byAsin, upperTrim(asin))) return r;
    if (const Json* r = in(byEan, core::normalizeText(ean))) return r;
    return in(byTitle, core::normalizeText(title));
  }
};

void readDims(const Json& src, econ::CaseDimensions& d, bool onlyMissing) {
  const auto set = [&](double& field, std::initializer_list<const char*> keys) {
    if (onlyMissing && field > 0.0) return;
    if (const auto v = optionalNumber(src, keys); v && *v > 0.0) field = *v;
  };
  set(d.lengthCm, {"lengthCm", "length"});
  set(d.widthCm, {"widthCm", "width"});
  set(d.heightCm, {"heightCm", "height"});
  set(d.weightKg, {"weightKg", "weight"});
}

econ::Product parseProduct(const Json& j, const DimsLookup& dims) {
  econ::Product p;
  p.sku = text(j, {"asin", "sku", "ASIN"});
  p.title = text(j, {"itemName", "title", "name"});
  p.supplierName = text(j, {"supplier", "supplierName"});
  p.supplierKey = text(j, {"supplierKey"});

  p.supplierPrice = numberOr(j, {"supplierPrice", "cost"}, 0.0);
  p.amazonPrice = numberOr(j, {"amazonPrice", "price"}, 0.0);
  p.amazonFees = numberOr(j, {"amazonFees", "fees"}, 0.0);
  p.vatPerUnit = numberOr(j, {"vatPerUnit", "vat"}, 0.0);
  p.monthlySales = numberOr(j, {"monthlySales", "sales"}, 0.0);
  p.sellerCount = numberOr(j, {"sellers", "sellerCount"}, 1.0);
  p.queuedWeeks = std::max(0.0, numberOr(j, {"queuedWeeks"}, 0.0));

  std::optional<double> caseSize = optionalNumber(j, {"caseSize", "casePack"});

  readDims(j, p.dims, false);
  if (const Json* nested = member(j, {"dims", "dimensions"}); nested && nested->is_object()) {
    readDims(*nested, p.dims, true);
    if (!caseSize) caseSize = optionalNumber(*nested, {"caseSize"});
  }
  if (const Json* rec = dims.find(p.sku, text(j, {"ean", "EAN"}), p.title)) {
    readDims(*rec, p.dims, true);
    if (!caseSize) caseSize = optionalNumber(*rec, {"caseSize"});
  }

  p.caseSize = (caseSize && *caseSize > 0.0) ? std::max(1, (int)std::lround(*caseSize)) : 1;
  return p;
}

econ::SupplierTerms parseSupplier(const Json& j) {
  econ::SupplierTerms s;
  s.name = text(j, {"name", "supplier", "supplierName"});
  s.supplierKey = text(j, {"supplierKey", "key"});
  s.country = text(j, {"country"});
  s.region = text(j, {"region"});
  s.warehouse = text(j, {"warehouse"});
  s.freightMode = text(j, {"freightMode", "mode"});
  s.packagingType = text(j, {"packagingType", "packaging"});
  s.packagingWeightPercent = percentFraction(std::max(0.0, numberOr(j, {"packagingWeightPercent"}, 0.0)));
  s.moqGBP = std::max(0.0, numberOr(j, {"moqGBP", "moq"}, 0.0));
  s.isUK = flag(j, {"isUK"}, false) || econ::isUkCountry(s.country);
  return s;
}

econ::FreightCurve parseCurve(const Json& j) {
  econ::FreightCurve c;
  c.curveId = text(j, {"curveId", "id"});
  c.region = text(j, {"region"});
  c.mode = text(j, {"mode", "freightMode"});
  c.packaging = text(j, {"packagingType", "packaging"});
  c.minKg = optionalNumber(j, {"minKg", "min kg"});
  c.maxKg = optionalNumber(j, {"maxKg", "max kg"});
  c.intercept = numberOr(j, {"intercept"}, 0.0);
  c.slope = numberOr(j, {"slope"}, 0.0);
  c.baseFuelSurcharge = text(j, {"baseFuel", "base fuel", "baseFuelSurcharge"});
  c.useCBM = flag(j, {"useCBM"}, false);

  if (const Json* pts = member(j, {"points"}); pts && pts->is_array()) {
    for (const Json& pt : *pts) {
      if (pt.is_object()) {
        c.points.push_back(econ::CurvePoint{numberOr(pt, {"x"}, 0.0), numberOr(pt, {"y"}, 0.0)});
      } else if (pt.is_array() && pt.size() == 2) {
        c.points.push_back(econ::CurvePoint{number(&pt[0]).value_or(0.0), number(&pt[1]).value_or(0.0)});
      }
    }
  }
  return c;
}

econ::FreightConfig parseFreightConfig(const Json& j) {
  econ::FreightConfig f;
  f.ratePerKG = numberOr(j, {"ratePerKG", "ratePerKg"}, f.ratePerKG);
  f.ratePerCBM = numberOr(j, {"ratePerCBM", "ratePerCbm"}, f.ratePerCBM);
  f.minCharge = numberOr(j, {"minCharge"}, f.minCharge);
  f.boxSurcharge = numberOr(j, {"boxSurcharge"}, f.boxSurcharge);
  f.palletSurcharge = numberOr(j, {"palletSurcharge"}, f.palletSurcharge);
  f.handlingFee = numberOr(j, {"handlingFee"}, f.handlingFee);
  f.domesticUkRatePerBox = numberOr(j, {"domesticUkRatePerBox"}, f.domesticUkRatePerBox);

  const double kgPerBox = numberOr(j, {"kgPerBox"}, f.kgPerBox);
  const double cbmPerPallet = numberOr(j, {"cbmPerPallet"}, f.cbmPerPallet);
  if (kgPerBox > 0.0) f.kgPerBox = kgPerBox;
  if (cbmPerPallet > 0.0) f.cbmPerPallet = cbmPerPallet;
  return f;
}

bool requireArray(const Json& request, const char* key, std::string* outError) {
  const Json* v = member(request, {key});
  if (v && !v->is_array()) return fail(outError, std::string("'") + key + "' must be an array");
  return true;
}

} // namespace

// ------------------------------
// Requests

bool loadJsonFile(const std::string& path, Json& out, std::string* outError) {
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f) return fail(outError, "Failed to open request file: " + path);

  try {
    out = Json::parse(f);
  } catch (const Json::parse_error& e) {
    return fail(outError, path + ": " + e.what());
  }
  return true;
}

bool parsePlanRequest(const Json& request, econ::PlanInputs& out, std::string* outError) {
  if (!request.is_object()) return fail(outError, "request must be a JSON object");
  for (const char* key : {"products", "suppliers", "freightCurves"}) {
    if (!requireArray(request, key, outError)) return false;
  }

  econ::PlanInputs in;
  in.budget = numberOr(request, {"budget"}, 0.0);

  DimsLookup dims;
  if (const Json* d = member(request, {"dims"}); d && d->is_object()) {
    dims.byAsin = member(*d, {"byASIN"});
    dims.byEan = member(*d, {"byEAN"});
    dims.byTitle = member(*d, {"byTitle"});
  }

  if (const Json* products = member(request, {"products"})) {
    in.products.reserve(products->size());
    for (const Json& p : *products) {
      if (p.is_object()) in.products.push_back(parseProduct(p, dims));
    }
  }
  if (const Json* suppliers = member(request, {"suppliers"})) {
    for (const Json& s : *suppliers) {
      if (s.is_object()) in.suppliers.push_back(parseSupplier(s));
    }
  }
  if (const Json* curves = member(request, {"freightCurves"})) {
    for (const Json& c : *curves) {
      if (c.is_object()) in.freightCurves.push_back(parseCurve(c));
    }
  }
  if (const Json* cfg = member(request, {"freightConfig"}); cfg && cfg->is_object()) {
    in.freightConfig = parseFreightConfig(*cfg);
    in.hasFreightConfig = true;
  }
  if (const Json* churn = member(request, {"churnSettings"}); churn && churn->is_object()) {
    for (const auto& [key, v] : churn->items()) {
      if (!v.is_object()) continue;
      econ::ChurnOverride o;
      o.leadDays = optionalNumber(v, {"leadDays", "irstDays"});
      o.payoutDays = optionalNumber(v, {"payoutDays"});
      in.churnSettings[core::normalizeSupplierKey(key)] = o;
    }
  }

  out = std::move(in);
  return true;
}

bool parseQuoteRequest(const Json& request,
                       const econ::PlanInputs& inputs,
                       QuoteRequest& out,
                       std::string* outError) {
  if (!request.is_object()) return fail(outError, "request must be a JSON object");
  if (!requireArray(request, "products", outError)) return false;

  QuoteRequest q;
  if (const Json* products = member(request, {"products"})) {
    std::size_t i = 0;
    for (const Json& p : *products) {
      if (!p.is_object()) continue;
      if (i >= inputs.products.size()) break;
      econ::QuoteLine line;
      line.product = inputs.products[i++];
      line.unitsToOrder = std::max(0, (int)std::lround(numberOr(p, {"unitsToOrder", "units"}, 0.0)));
      q.lines.push_back(std::move(line));
    }
  }

  if (const Json* info = member(request, {"shipmentInfo"}); info && info->is_object()) {
    q.supplier = parseSupplier(*info);
    if (q.supplier.name.empty() && !q.lines.empty()) q.supplier.name = q.lines.front().product.supplierName;
    q.supplier.supplierKey = core::normalizeSupplierKey(q.supplier.name);
  } else {
    const std::string name = q.lines.empty() ? std::string() : q.lines.front().product.supplierName;
    q.supplier = econ::supplierTermsFor(econ::buildSupplierMap(inputs.suppliers), core::normalizeSupplierKey(name), name);
  }

  out = std::move(q);
  return true;
}

// ------------------------------
// Pipeline state

namespace {

const Json& emptyArray() {
  static const Json kEmpty = Json::array();
  return kEmpty;
}

const Json& arrayAt(const Json& obj, const char* key) {
  const Json* v = member(obj, {key});
  return (v && v->is_array()) ? *v : emptyArray();
}

const Json& objectAt(const Json& obj, const char* key) {
  static const Json kEmpty = Json::object();
  const Json* v = member(obj, {key});
  return (v && v->is_object()) ? *v : kEmpty;
}

double num(const Json& obj, const char* key) { return numberOr(obj, {key}, 0.0); }

int integer(const Json& obj, const char* key, int fallback = 0) {
  const auto v = optionalNumber(obj, {key});
  return v ? (int)std::llround(*v) : fallback;
}

std::size_t indexAt(const Json& obj, const char* key) {
  const auto v = optionalNumber(obj, {key});
  return (v && *v > 0.0) ? (std::size_t)std::llround(*v) : 0;
}

std::string str(const Json& obj, const char* key) { return text(obj, {key}); }

econ::FreightMethod freightMethodFrom(const std::string& s) {
  if (s == "regression") return econ::FreightMethod::Regression;
  if (s == "generic") return econ::FreightMethod::Generic;
  if (s == "domestic_uk") return econ::FreightMethod::DomesticUk;
  return econ::FreightMethod::None;
}

econ::FreightQuote readFreightQuote(const Json& j) {
  econ::FreightQuote f;
  f.method = freightMethodFrom(str(j, "method"));
  f.freightCost = num(j, "freightCost");
  f.baseFreight = num(j, "baseFreight");
  f.fuelSurcharge = num(j, "fuelSurcharge");
  f.totalWeightKg = num(j, "totalWeightKg");
  f.totalCbm = num(j, "totalCbm");
  f.boxCount = integer(j, "boxCount");
  f.palletCount = integer(j, "palletCount");
  const Json& r = objectAt(j, "regression");
  f.regression.found = flag(r, {"found"}, false);
  f.regression.curveId = str(r, "curveId");
  f.regression.message = str(r, "message");
  return f;
}

pipeline::MoqBlock readBlock(const Json& j) {
  pipeline::MoqBlock b;
  b.supplierKey = str(j, "supplierKey");
  b.supplierName = str(j, "supplierName");
  b.moqGBP = num(j, "moqGBP");
  b.totalBSF = num(j, "totalBSF");
  b.totalUnits = integer(j, "totalUnits");
  b.totalCases = integer(j, "totalCases");
  b.avgProxyROI = num(j, "avgProxyROI");
  b.meetsMoq = flag(j, {"meetsMoq"}, true);
  for (const Json& l : arrayAt(j, "lines")) {
    pipeline::BlockLine line;
    line.productIndex = indexAt(l, "productIndex");
    line.sku = str(l, "sku");
    line.title = str(l, "title");
    line.caseSize = integer(l, "caseSize", 1);
    line.cases = integer(l, "cases");
    line.units = integer(l, "units");
    line.supplierPrice = num(l, "supplierPrice");
    line.costBSF = num(l, "costBSF");
    line.proxyMonthlyROI = num(l, "proxyMonthlyROI");
    b.lines.push_back(std::move(line));
  }
  return b;
}

pipeline::RankedSupplier readRanked(const Json& j) {
  pipeline::RankedSupplier r;
  r.blockIndex = indexAt(j, "blockIndex");
  r.supplierKey = str(j, "supplierKey");
  r.supplierName = str(j, "supplierName");
  r.estimatedMonthlyROI = num(j, "estimatedMonthlyROI");
  r.estimatedASF = num(j, "estimatedASF");
  return r;
}

pipeline::CaseItem readCase(const Json& j) {
  pipeline::CaseItem c;
  c.supplierKey = str(j, "supplierKey");
  c.supplierName = str(j, "supplierName");
  c.sku = str(j, "sku");
  c.title = str(j, "title");
  c.productIndex = indexAt(j, "productIndex");
  c.caseNumber = integer(j, "caseNumber", 1);
  c.units = integer(j, "units");
  c.asfCost = num(j, "asfCost");
  c.profit = num(j, "profit");
  c.marginalRoi = num(j, "marginalRoi");
  return c;
}

pipeline::SubstitutionSnapshot readSnapshot(const Json& j) {
  pipeline::SubstitutionSnapshot s;
  s.totalASF = num(j, "totalASF");
  s.avgMarginalRoi = num(j, "avgMarginalRoi");
  s.caseCount = integer(j, "caseCount");
  return s;
}

void readStage(const Json& j, pipeline::Stage0Output& s) {
  const Json& sum = objectAt(j, "summary");
  s.suppliersLoaded = integer(sum, "suppliersLoaded");
  s.productsLoaded = integer(sum, "productsLoaded");
  s.productsEligible = integer(sum, "productsEligible");
  s.hasFreightConfig = flag(sum, {"hasFreightConfig"}, false);
}

void readStage(const Json& j, pipeline::Stage1Output& s) {
  for (const Json& b : arrayAt(j, "blocks")) s.blocks.push_back(readBlock(b));
  const Json& t = objectAt(j, "totals");
  s.supplierCount = integer(t, "supplierCount");
  s.productCount = integer(t, "productCount");
  s.includedSkus = integer(t, "includedSkus");
  s.totalBSF = num(t, "totalBSF");
}

void readStage(const Json& j, pipeline::Stage2Output& s) {
  for (const Json& e : arrayAt(j, "blocks")) {
    pipeline::EstimatedBlock b;
    b.block = readBlock(objectAt(e, "block"));
    b.estimatedFreight = num(e, "estimatedFreight");
    b.freightMethod = str(e, "freightMethod");
    b.currencyFee = num(e, "currencyFee");
    b.freightMultiplier = numberOr(e, {"freightMultiplier"}, 1.0);
    b.estimatedASF = num(e, "estimatedASF");
    b.profitBSF = num(e, "profitBSF");
    b.estimatedProfit = num(e, "estimatedProfit");
    b.churnWeeks = num(e, "churnWeeks");
    b.estimatedMonthlyROI = num(e, "estimatedMonthlyROI");
    s.blocks.push_back(std::move(b));
  }
  const Json& t = objectAt(j, "totals");
  s.totalBSF = num(t, "totalBSF");
  s.totalASF = num(t, "totalASF");
  s.totalFreight = num(t, "totalFreight");
  s.totalCurrencyFee = num(t, "totalCurrencyFee");
}

void readStage(const Json& j, pipeline::Stage3Output& s) {
  for (const Json& r : arrayAt(j, "ranked")) s.ranked.push_back(readRanked(r));
}

void readStage(const Json& j, pipeline::Stage4Output& s) {
  for (const Json& r : arrayAt(j, "selected")) s.selected.push_back(readRanked(r));
  for (const Json& r : arrayAt(j, "rejected")) {
    s.rejected.push_back(pipeline::RejectedSupplier{readRanked(r), str(r, "reason")});
  }
  const Json& t = objectAt(j, "totals");
  s.budget = num(t, "budget");
  s.spentASF = num(t, "spentASF");
  s.remainingASF = num(t, "remainingASF");
}

void readStage(const Json& j, pipeline::Stage5Output& s) {
  for (const Json& x : arrayAt(j, "suppliers")) {
    pipeline::ExactSupplier e;
    e.supplierKey = str(x, "supplierKey");
    e.supplierName = str(x, "supplierName");
    e.blockIndex = indexAt(x, "blockIndex");
    e.freight = readFreightQuote(objectAt(x, "freight"));
    e.costBSF = num(x, "costBSF");
    e.currencyFee = num(x, "currencyFee");
    e.freightMultiplier = numberOr(x, {"freightMultiplier"}, 1.0);
    e.exactASF = num(x, "exactASF");
    e.profitLand = num(x, "profitLand");
    e.roi = num(x, "roi");
    e.churnWeeks = num(x, "churnWeeks");
    e.exactMonthlyROI = num(x, "exactMonthlyROI");
    s.suppliers.push_back(std::move(e));
  }
  const Json& t = objectAt(j, "totals");
  s.totalBSF = num(t, "totalBSF");
  s.totalASF = num(t, "totalASF");
  s.totalFreight = num(t, "totalFreight");
  s.totalCurrencyFee = num(t, "totalCurrencyFee");
}

void readStage(const Json& j, pipeline::Stage6Output& s) {
  for (const Json& c : arrayAt(j, "cases")) s.cases.push_back(readCase(c));
  for (const Json& c : arrayAt(j, "dropped")) s.dropped.push_back(readCase(c));
  const Json& t = objectAt(j, "totals");
  s.totalASF = num(t, "totalASF");
  s.totalUnits = integer(t, "totalUnits");
  s.poolSize = integer(t, "poolSize");
}

void readStage(const Json& j, pipeline::Stage7Output& s) {
  s.improved = flag(j, {"improved"}, false);
  s.iterations = integer(j, "iterations");
  s.before = readSnapshot(objectAt(j, "before"));
  s.after = readSnapshot(objectAt(j, "after"));
  for (const Json& w : arrayAt(j, "swaps")) {
    s.swaps.push_back(pipeline::Substitution{str(w, "removedSupplierKey"), str(w, "removedSku"),
                                             str(w, "addedSupplierKey"), num(w, "addedASF")});
  }
}

void readStage(const Json& j, pipeline::Stage8Output& s) {
  const Json& sum = objectAt(j, "summary");
  s.summary.budget = num(sum, "budget");
  s.summary.budgetUsed = num(sum, "budgetUsed");
  s.summary.budgetRemaining = num(sum, "budgetRemaining");
  s.summary.expectedProfit = num(sum, "expectedProfit");
  s.summary.averageROI = num(sum, "averageROI");
  s.summary.totalUnits = integer(sum, "totalUnits");
  s.summary.monthlyROI = num(sum, "monthlyROI");
  for (const Json& f : arrayAt(j, "suppliers")) {
    pipeline::FinalSupplier sup;
    sup.supplierKey = str(f, "supplierKey");
    sup.supplierName = str(f, "supplierName");
    sup.totalASF = num(f, "totalASF");
    sup.totalUnits = integer(f, "totalUnits");
    sup.expectedProfit = num(f, "expectedProfit");
    sup.averageROI = num(f, "averageROI");
    for (const Json& k : arrayAt(f, "skus")) {
      pipeline::FinalSku sku;
      sku.sku = str(k, "sku");
      sku.title = str(k, "title");
      sku.cases = integer(k, "cases");
      sku.units = integer(k, "units");
      sku.asfCost = num(k, "asfCost");
      sku.profit = num(k, "profit");
      sku.roi = num(k, "roi");
      sku.monthlyROI = num(k, "monthlyROI");
      sup.skus.push_back(std::move(sku));
    }
    s.suppliers.push_back(std::move(sup));
  }
}

template <int N>
bool readSlot(const Json& state, pipeline::PipelineState& out, std::string* outError) {
  const std::string key = "stage" + std::to_string(N);
  auto& slot = out.*pipeline::StageTraits<N>::slot;
  slot.reset();

  const Json* v = member(state, {key.c_str()});
  if (!v) return true;
  if (!v->is_object()) return fail(outError, "state '" + key + "' must be an object or null");

  typename pipeline::StageTraits<N>::Output stage;
  readStage(*v, stage);
  slot = std::move(stage);
  return true;
}

// `inputs` and `data` share the request layout; the stored flags win over
// what the request parser infers.
bool readPlanLists(const Json& state, const char* key, econ::PlanInputs& out, std::string* outError) {
  const Json* v = member(state, {key});
  if (!v) return true;
  if (!v->is_object()) return fail(outError, std::string("state '") + key + "' must be an object");

  econ::PlanInputs in;
  if (!parsePlanRequest(*v, in, outError)) return false;
  in.hasFreightConfig = flag(*v, {"hasFreightConfig"}, in.hasFreightConfig);

  // Stored fractions are not rescaled.
  const Json& suppliers = arrayAt(*v, "suppliers");
  std::size_t i = 0;
  for (const Json& s : suppliers) {
    if (!s.is_object()) continue;
    if (i < in.suppliers.size()) in.suppliers[i++].packagingWeightPercent = num(s, "packagingWeightPercent");
  }

  out = std::move(in);
  return true;
}

} // namespace

bool parsePipelineState(const Json& state, pipeline::PipelineState& out, std::string* outError) {
  if (!state.is_object()) return fail(outError, "state must be a JSON object");
  const Json* meta = member(state, {"meta"});
  if (!meta || !meta->is_object()) return fail(outError, "state 'meta' is missing");

  pipeline::PipelineState s;
  s.meta.version = str(*meta, "version");
  if (s.meta.version != pipeline::kPipelineVersion) {
    return fail(outError, "state version '" + s.meta.version + "' is not " + pipeline::kPipelineVersion);
  }
  s.meta.stage = integer(*meta, "stage");
  s.meta.createdAt = str(*meta, "createdAt");
  s.meta.updatedAt = str(*meta, "updatedAt");

  if (!readPlanLists(state, "inputs", s.inputs, outError)) return false;

  econ::PlanInputs data;
  if (!readPlanLists(state, "data", data, outError)) return false;
  s.data.suppliers = std::move(data.suppliers);
  s.data.products = std::move(data.products);
  s.data.freightCurves = std::move(data.freightCurves);
  s.data.freightConfig = data.freightConfig;
  s.data.hasFreightConfig = data.hasFreightConfig;
  s.data.churnSettings = std::move(data.churnSettings);

  const bool ok = readSlot<0>(state, s, outError) && readSlot<1>(state, s, outError) &&
                  readSlot<2>(state, s, outError) && readSlot<3>(state, s, outError) &&
                  readSlot<4>(state, s, outError) && readSlot<5>(state, s, outError) &&
                  readSlot<6>(state, s, outError) && readSlot<7>(state, s, outError) &&
                  readSlot<8>(state, s, outError);
  if (!ok) return false;

  out = std::move(s);
  return true;
}

// ------------------------------
// Responses

namespace {

void writeOptionalText(core::JsonWriter& j, std::string_view key, const std::string& v) {
  j.key(key);
  if (v.empty()) j.nullValue();
  else j.value(v);
}

void writeOptionalNumber(core::JsonWriter& j, std::string_view key, const std::optional<double>& v) {
  j.key(key);
  if (v) j.value(*v);
  else j.nullValue();
}

// Products, suppliers and curves are written under the request field names so
// parsePlanRequest reads them back unchanged.
void writeProduct(core::JsonWriter& j, const econ::Product& p) {
  j.beginObject();
  j.field("sku", p.sku);
  j.field("title", p.title);
  j.field("supplierName", p.supplierName);
  j.field("supplierKey", p.supplierKey);
  j.field("supplierPrice", p.supplierPrice);
  j.field("amazonPrice", p.amazonPrice);
  j.field("amazonFees", p.amazonFees);
  j.field("vatPerUnit", p.vatPerUnit);
  j.field("monthlySales", p.monthlySales);
  j.field("sellerCount", p.sellerCount);
  j.field("caseSize", p.caseSize);
  j.field("queuedWeeks", p.queuedWeeks);
  j.field("lengthCm", p.dims.lengthCm);
  j.field("widthCm", p.dims.widthCm);
  j.field("heightCm", p.dims.heightCm);
  j.field("weightKg", p.dims.weightKg);
  j.endObject();
}

void writeSupplierTerms(core::JsonWriter& j, const econ::SupplierTerms& t) {
  j.beginObject();
  j.field("name", t.name);
  j.field("supplierKey", t.supplierKey);
  j.field("country", t.country);
  j.field("region", t.region);
  j.field("warehouse", t.warehouse);
  j.field("freightMode", t.freightMode);
  j.field("packagingType", t.packagingType);
  j.field("packagingWeightPercent", t.packagingWeightPercent);
  j.field("moqGBP", t.moqGBP);
  j.field("isUK", t.isUK);
  j.endObject();
}

void writeCurve(core::JsonWriter& j, const econ::FreightCurve& c) {
  j.beginObject();
  j.field("curveId", c.curveId);
  j.field("region", c.region);
  j.field("mode", c.mode);
  j.field("packagingType", c.packaging);
  writeOptionalNumber(j, "minKg", c.minKg);
  writeOptionalNumber(j, "maxKg", c.maxKg);
  j.field("intercept", c.intercept);
  j.field("slope", c.slope);
  j.field("baseFuelSurcharge", c.baseFuelSurcharge);
  j.field("useCBM", c.useCBM);
  j.key("points");
  j.beginArray();
  for (const econ::CurvePoint& pt : c.points) {
    j.beginObject();
    j.field("x", pt.x);
    j.field("y", pt.y);
    j.endObject();
  }
  j.endArray();
  j.endObject();
}

void writeFreightConfig(core::JsonWriter& j, const econ::FreightConfig& f) {
  j.beginObject();
  j.field("ratePerKG", f.ratePerKG);
  j.field("ratePerCBM", f.ratePerCBM);
  j.field("minCharge", f.minCharge);
  j.field("boxSurcharge", f.boxSurcharge);
  j.field("palletSurcharge", f.palletSurcharge);
  j.field("handlingFee", f.handlingFee);
  j.field("domesticUkRatePerBox", f.domesticUkRatePerBox);
  j.field("kgPerBox", f.kgPerBox);
  j.field("cbmPerPallet", f.cbmPerPallet);
  j.endObject();
}

// Fields of an already open object.
void writePlanLists(core::JsonWriter& j,
                    const std::vector<econ::Product>& products,
                    const std::vector<econ::SupplierTerms>& suppliers,
                    const std::vector<econ::FreightCurve>& curves,
                    const econ::FreightConfig& freightConfig,
                    bool hasFreightConfig,
                    const econ::ChurnSettings& churn) {
  j.key("products");
  j.beginArray();
  for (const econ::Product& p : products) writeProduct(j, p);
  j.endArray();

  j.key("suppliers");
  j.beginArray();
  for (const econ::SupplierTerms& t : suppliers) writeSupplierTerms(j, t);
  j.endArray();

  j.key("freightCurves");
  j.beginArray();
  for (const econ::FreightCurve& c : curves) writeCurve(j, c);
  j.endArray();

  j.key("freightConfig");
  writeFreightConfig(j, freightConfig);
  j.field("hasFreightConfig", hasFreightConfig);

  j.key("churnSettings");
  j.beginObject();
  for (const auto& [key, o] : churn) {
    j.key(key);
    j.beginObject();
    writeOptionalNumber(j, "leadDays", o.leadDays);
    writeOptionalNumber(j, "payoutDays", o.payoutDays);
    j.endObject();
  }
  j.endObject();
}

void writeRegression(core::JsonWriter& j, const econ::RegressionInfo& r) {
  j.beginObject();
  j.field("found", r.found);
  writeOptionalText(j, "curveId", r.curveId);
  writeOptionalText(j, "message", r.message);
  j.endObject();
}

void writeFreightQuote(core::JsonWriter& j, const econ::FreightQuote& f) {
  j.beginObject();
  j.field("method", econ::toString(f.method));
  j.field("freightCost", f.freightCost);
  j.field("baseFreight", f.baseFreight);
  j.field("fuelSurcharge", f.fuelSurcharge);
  j.field("totalWeightKg", f.totalWeightKg);
  j.field("totalCbm", f.totalCbm);
  j.field("boxCount", f.boxCount);
  j.field("palletCount", f.palletCount);
  j.key("regression");
  writeRegression(j, f.regression);
  j.endObject();
}

void writeBlock(core::JsonWriter& j, const pipeline::MoqBlock& b) {
  j.beginObject();
  j.field("supplierKey", b.supplierKey);
  j.field("supplierName", b.supplierName);
  j.field("moqGBP", b.moqGBP);
  j.field("totalBSF", b.totalBSF);
  j.field("totalUnits", b.totalUnits);
  j.field("totalCases", b.totalCases);
  j.field("avgProxyROI", b.avgProxyROI);
  j.field("meetsMoq", b.meetsMoq);
  j.key("lines");
  j.beginArray();
  for (const pipeline::BlockLine& l : b.lines) {
    j.beginObject();
    j.field("productIndex", (long long)l.productIndex);
    j.field("sku", l.sku);
    j.field("title", l.title);
    j.field("caseSize", l.caseSize);
    j.field("cases", l.cases);
    j.field("units", l.units);
    j.field("supplierPrice", l.supplierPrice);
    j.field("costBSF", l.costBSF);
    j.field("proxyMonthlyROI", l.proxyMonthlyROI);
    j.endObject();
  }
  j.endArray();
  j.endObject();
}

void writeRanked(core::JsonWriter& j, const pipeline::RankedSupplier& r) {
  j.beginObject();
  j.field("supplierKey", r.supplierKey);
  j.field("supplierName", r.supplierName);
  j.field("blockIndex", (long long)r.blockIndex);
  j.field("estimatedMonthlyROI", r.estimatedMonthlyROI);
  j.field("estimatedASF", r.estimatedASF);
  j.endObject();
}

void writeCase(core::JsonWriter& j, const pipeline::CaseItem& c) {
  j.beginObject();
  j.field("supplierKey", c.supplierKey);
  j.field("supplierName", c.supplierName);
  j.field("sku", c.sku);
  j.field("title", c.title);
  j.field("productIndex", (long long)c.productIndex);
  j.field("caseNumber", c.caseNumber);
  j.field("units", c.units);
  j.field("asfCost", c.asfCost);
  j.field("profit", c.profit);
  j.field("marginalRoi", c.marginalRoi);
  j.endObject();
}

void writeSnapshot(core::JsonWriter& j, const pipeline::SubstitutionSnapshot& s) {
  j.beginObject();
  j.field("totalASF", s.totalASF);
  j.field("avgMarginalRoi", s.avgMarginalRoi);
  j.field("caseCount", s.caseCount);
  j.endObject();
}

void writeStage(core::JsonWriter& j, const pipeline::Stage0Output& s) {
  j.beginObject();
  j.key("summary");
  j.beginObject();
  j.field("suppliersLoaded", s.suppliersLoaded);
  j.field("productsLoaded", s.productsLoaded);
  j.field("productsEligible", s.productsEligible);
  j.field("hasFreightConfig", s.hasFreightConfig);
  j.endObject();
  j.endObject();
}

void writeStage(core::JsonWriter& j, const pipeline::Stage1Output& s) {
  j.beginObject();
  j.key("blocks");
  j.beginArray();
  for (const pipeline::MoqBlock& b : s.blocks) writeBlock(j, b);
  j.endArray();
  j.key("totals");
  j.beginObject();
  j.field("supplierCount", s.supplierCount);
  j.field("productCount", s.productCount);
  j.field("includedSkus", s.includedSkus);
  j.field("totalBSF", s.totalBSF);
  j.endObject();
  j.endObject();
}

void writeStage(core::JsonWriter& j, const pipeline::Stage2Output& s) {
  j.beginObject();
  j.key("blocks");
  j.beginArray();
  for (const pipeline::EstimatedBlock& e : s.blocks) {
    j.beginObject();
    j.key("block");
    writeBlock(j, e.block);
    j.field("estimatedFreight", e.estimatedFreight);
    j.field("freightMethod", e.freightMethod);
    j.field("currencyFee", e.currencyFee);
    j.field("freightMultiplier", e.freightMultiplier);
    j.field("estimatedASF", e.estimatedASF);
    j.field("profitBSF", e.profitBSF);
    j.field("estimatedProfit", e.estimatedProfit);
    j.field("churnWeeks", e.churnWeeks);
    j.field("estimatedMonthlyROI", e.estimatedMonthlyROI);
    j.endObject();
  }
  j.endArray();
  j.key("totals");
  j.beginObject();
  j.field("totalBSF", s.totalBSF);
  j.field("totalASF", s.totalASF);
  j.field("totalFreight", s.totalFreight);
  j.field("totalCurrencyFee", s.totalCurrencyFee);
  j.endObject();
  j.endObject();
}

void writeStage(core::JsonWriter& j, const pipeline::Stage3Output& s) {
  j.beginObject();
  j.key("ranked");
  j.beginArray();
  for (const pipeline::RankedSupplier& r : s.ranked) writeRanked(j, r);
  j.endArray();
  j.endObject();
}

void writeStage(core::JsonWriter& j, const pipeline::Stage4Output& s) {
  j.beginObject();
  j.key("selected");
  j.beginArray();
  for (const pipeline::RankedSupplier& r : s.selected) writeRanked(j, r);
  j.endArray();
  j.key("rejected");
  j.beginArray();
  for (const pipeline::RejectedSupplier& r : s.rejected) {
    j.beginObject();
    j.field("supplierKey", r.entry.supplierKey);
    j.field("supplierName", r.entry.supplierName);
    j.field("blockIndex", (long long)r.entry.blockIndex);
    j.field("estimatedMonthlyROI", r.entry.estimatedMonthlyROI);
    j.field("estimatedASF", r.entry.estimatedASF);
    j.field("reason", r.reason);
    j.endObject();
  }
  j.endArray();
  j.key("totals");
  j.beginObject();
  j.field("budget", s.budget);
  j.field("spentASF", s.spentASF);
  j.field("remainingASF", s.remainingASF);
  j.field("selectedCount", (long long)s.selected.size());
  j.endObject();
  j.endObject();
}

void writeStage(core::JsonWriter& j, const pipeline::Stage5Output& s) {
  j.beginObject();
  j.key("suppliers");
  j.beginArray();
  for (const pipeline::ExactSupplier& x : s.suppliers) {
    j.beginObject();
    j.field("supplierKey", x.supplierKey);
    j.field("supplierName", x.supplierName);
    j.field("blockIndex", (long long)x.blockIndex);
    j.key("freight");
    writeFreightQuote(j, x.freight);
    j.field("costBSF", x.costBSF);
    j.field("currencyFee", x.currencyFee);
    j.field("freightMultiplier", x.freightMultiplier);
    j.field("exactASF", x.exactASF);
    j.field("profitLand", x.profitLand);
    j.field("roi", x.roi);
    j.field("churnWeeks", x.churnWeeks);
    j.field("exactMonthlyROI", x.exactMonthlyROI);
    j.endObject();
  }
  j.endArray();
  j.key("totals");
  j.beginObject();
  j.field("totalBSF", s.totalBSF);
  j.field("totalASF", s.totalASF);
  j.field("totalFreight", s.totalFreight);
  j.field("totalCurrencyFee", s.totalCurrencyFee);
  j.endObject();
  j.endObject();
}

void writeStage(core::JsonWriter& j, const pipeline::Stage6Output& s) {
  j.beginObject();
  j.key("cases");
  j.beginArray();
  for (const pipeline::CaseItem& c : s.cases) writeCase(j, c);
  j.endArray();
  j.key("dropped");
  j.beginArray();
  for (const pipeline::CaseItem& c : s.dropped) writeCase(j, c);
  j.endArray();
  j.key("totals");
  j.beginObject();
  j.field("totalASF", s.totalASF);
  j.field("totalUnits", s.totalUnits);
  j.field("caseCount", (long long)s.cases.size());
  j.field("poolSize", s.poolSize);
  j.endObject();
  j.endObject();
}

void writeStage(core::JsonWriter& j, const pipeline::Stage7Output& s) {
  j.beginObject();
  j.field("improved", s.improved);
  j.field("iterations", s.iterations);
  j.key("before");
  writeSnapshot(j, s.before);
  j.key("after");
  writeSnapshot(j, s.after);
  j.key("swaps");
  j.beginArray();
  for (const pipeline::Substitution& w : s.swaps) {
    j.beginObject();
    j.field("removedSupplierKey", w.removedSupplierKey);
    j.field("removedSku", w.removedSku);
    j.field("addedSupplierKey", w.addedSupplierKey);
    j.field("addedASF", w.addedASF);
    j.endObject();
  }
  j.endArray();
  j.endObject();
}

void writeStage(core::JsonWriter& j, const pipeline::Stage8Output& s) {
  j.beginObject();
  j.key("summary");
  j.beginObject();
  j.field("budget", s.summary.budget);
  j.field("budgetUsed", s.summary.budgetUsed);
  j.field("budgetRemaining", s.summary.budgetRemaining);
  j.field("expectedProfit", s.summary.expectedProfit);
  j.field("averageROI", s.summary.averageROI);
  j.field("totalUnits", s.summary.totalUnits);
  j.field("monthlyROI", s.summary.monthlyROI);
  j.endObject();
  j.key("suppliers");
  j.beginArray();
  for (const pipeline::FinalSupplier& f : s.suppliers) {
    j.beginObject();
    j.field("supplierKey", f.supplierKey);
    j.field("supplierName", f.supplierName);
    j.field("totalASF", f.totalASF);
    j.field("totalUnits", f.totalUnits);
    j.field("expectedProfit", f.expectedProfit);
    j.field("averageROI", f.averageROI);
    j.key("skus");
    j.beginArray();
    for (const pipeline::FinalSku& k : f.skus) {
      j.beginObject();
      j.field("sku", k.sku);
      j.field("title", k.title);
      j.field("cases", k.cases);
      j.field("units", k.units);
      j.field("asfCost", k.asfCost);
      j.field("profit", k.profit);
      j.field("roi", k.roi);
      j.field("monthlyROI", k.monthlyROI);
      j.endObject();
    }
    j.endArray();
    j.endObject();
  }
  j.endArray();
  j.endObject();
}

} // namespace

void writeError(core::JsonWriter& j, const econ::PlanError& e) {
  j.beginObject();
  j.field("ok", false);
  j.key("error");
  j.beginObject();
  j.field("kind", econ::toString(e.kind));
  if (e.stage >= 0) j.field("stage", e.stage);
  j.field("message", e.message);
  j.endObject();
  j.endObject();
}

void writeAllocation(core::JsonWriter& j, const econ::AllocationResult& a) {
  j.beginObject();
  j.field("engineVersion", a.engineVersion);

  j.key("summary");
  j.beginObject();
  j.field("totalUnits", a.summary.totalUnits);
  j.field("totalCostASF", a.summary.totalCostASF);
  j.field("expectedProfit", a.summary.expectedProfit);
  j.field("remainingBudget", a.summary.remainingBudget);
  j.field("roi", a.summary.roi);
  j.field("weightedChurnWeeks", a.summary.weightedChurnWeeks);
  j.field("monthlyROI", a.summary.monthlyROI);
  j.endObject();

  j.key("suppliers");
  j.beginArray();
  for (const econ::SupplierAllocation& s : a.suppliers) {
    j.beginObject();
    j.field("supplierKey", s.supplierKey);
    j.field("supplierName", s.supplierName);

    j.key("freight");
    j.beginObject();
    j.field("freightCost", s.freight.freightCost);
    j.field("currencyFee", s.freight.currencyFee);
    j.field("shippingAndFees", s.freight.shippingAndFees);
    j.field("totalWeightKg", s.freight.totalWeightKg);
    j.field("totalCbm", s.freight.totalCbm);
    j.field("totalBoxes", s.freight.totalBoxes);
    j.field("pallets", s.freight.pallets);
    j.field("method", s.freight.method);
    j.endObject();

    j.key("summary");
    j.beginObject();
    j.field("costBSF", s.summary.costBSF);
    j.field("costASF", s.summary.costASF);
    j.field("expectedProfit", s.summary.expectedProfit);
    j.field("roi", s.summary.roi);
    j.field("churnWeeks", s.summary.churnWeeks);
    j.field("monthlyROI", s.summary.monthlyROI);
    j.endObject();

    j.key("products");
    j.beginArray();
    for (const econ::AllocatedProduct& p : s.products) {
      j.beginObject();
      j.field("sku", p.sku);
      j.field("title", p.title);
      j.field("unitsToOrder", p.unitsToOrder);
      j.field("caseSize", p.caseSize);
      j.field("supplierPrice", p.supplierPrice);
      j.field("amazonPrice", p.amazonPrice);
      j.field("landedCostPerUnit", p.landedCostPerUnit);
      j.field("profitPerUnit", p.profitPerUnit);
      j.field("roi", p.roi);
      j.field("monthlyROI", p.monthlyROI);
      j.field("churnWeeks", p.churnWeeks);
      j.field("totalCost", p.totalCost);
      j.field("totalProfit", p.totalProfit);
      j.field("monthlySales", p.monthlySales);
      j.field("sellers", p.sellers);
      j.endObject();
    }
    j.endArray();
    j.endObject();
  }
  j.endArray();

  j.key("diagnostics");
  j.beginObject();
  j.field("eligibleProducts", (long long)a.eligibleProducts);
  j.field("bundleCandidates", (long long)a.bundleCandidates);
  j.field("optimizerPath", econ::toString(a.optimizerPath));
  j.endObject();

  j.endObject();
}

void writeShipmentQuote(core::JsonWriter& j, const econ::ShipmentQuote& q) {
  j.beginObject();
  j.field("ok", q.ok);
  j.field("supplierKey", q.supplierKey);
  j.field("supplierName", q.supplierName);
  j.field("method", q.method);

  j.key("shipmentTotals");
  j.beginObject();
  j.field("totalWeightKg", q.shipmentTotals.totalWeightKg);
  j.field("totalCbm", q.shipmentTotals.totalCbm);
  j.field("boxCount", q.shipmentTotals.boxCount);
  j.field("palletCount", q.shipmentTotals.palletCount);
  j.field("warehouse", q.shipmentTotals.warehouse);
  j.field("country", q.shipmentTotals.country);
  j.field("freightMode", q.shipmentTotals.freightMode);
  j.field("packagingType", q.shipmentTotals.packagingType);
  j.endObject();

  j.key("freight");
  j.beginObject();
  j.field("costBSF", q.freight.costBSF);
  j.field("fuelSurcharge", q.freight.fuelSurcharge);
  j.field("currencyFee", q.freight.currencyFee);
  j.field("costASF", q.freight.costASF);
  j.endObject();

  j.key("regression");
  writeRegression(j, q.regression);
  j.field("productCostBSF", q.productCostBSF);

  j.key("products");
  j.beginArray();
  for (const econ::QuotedProduct& p : q.products) {
    j.beginObject();
    j.field("sku", p.sku);
    j.field("title", p.title);
    j.field("unitsToOrder", p.unitsToOrder);
    j.field("supplierPrice", p.supplierPrice);
    j.field("freightMultiplier", p.freightMultiplier);
    j.field("landedCostPerUnit", p.landedCostPerUnit);
    j.field("profitPerUnit", p.profitPerUnit);
    j.field("roi", p.roi);
    j.field("monthlyROI", p.monthlyROI);
    j.field("totalCost", p.totalCost);
    j.field("expectedProfit", p.expectedProfit);
    j.field("dailySalesAvg", p.dailySalesAvg);
    j.field("daysOfStock", p.daysOfStock);
    j.field("churnWeeks", p.churnWeeks);
    j.endObject();
  }
  j.endArray();
  j.endObject();
}

void writeStageOutput(core::JsonWriter& j, const pipeline::StageOutput& out) {
  std::visit([&j](const auto& stage) { writeStage(j, stage); }, out);
}

std::string stageSignature(const pipeline::PipelineState& s, int stage) {
  const std::optional<pipeline::StageOutput> out = pipeline::stageOutput(s, stage);
  if (!out) return {};

  std::ostringstream oss;
  core::JsonWriter j(oss, false);
  writeStageOutput(j, *out);
  return core::toHex64(core::fnv1a64(oss.str()));
}

void writePipelineState(core::JsonWriter& j, const pipeline::PipelineState& s, bool withSignatures) {
  j.beginObject();

  j.key("meta");
  j.beginObject();
  j.field("version", s.meta.version);
  j.field("stage", s.meta.stage);
  j.field("createdAt", s.meta.createdAt);
  j.field("updatedAt", s.meta.updatedAt);
  j.endObject();

  j.key("inputs");
  j.beginObject();
  j.field("budget", s.inputs.budget);
  writePlanLists(j, s.inputs.products, s.inputs.suppliers, s.inputs.freightCurves, s.inputs.freightConfig,
                 s.inputs.hasFreightConfig, s.inputs.churnSettings);
  j.endObject();

  j.key("data");
  j.beginObject();
  writePlanLists(j, s.data.products, s.data.suppliers, s.data.freightCurves, s.data.freightConfig,
                 s.data.hasFreightConfig, s.data.churnSettings);
  j.endObject();

  for (int stage = 0; stage <= pipeline::kLastStage; ++stage) {
    j.key("stage" + std::to_string(stage));
    const std::optional<pipeline::StageOutput> out = pipeline::stageOutput(s, stage);
    if (out) writeStageOutput(j, *out);
    else j.nullValue();
  }

  if (withSignatures) {
    j.key("signatures");
    j.beginObject();
    for (int stage = 0; stage <= pipeline::kLastStage; ++stage) {
      const std::string sig = stageSignature(s, stage);
      if (!sig.empty()) j.field("stage" + std::to_string(stage), sig);
    }
    j.endObject();
  }

  j.endObject();
}

} // namespace buyplan::io
