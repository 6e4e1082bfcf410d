#include "buyplan/econ/EngineConfig.h"

#include "buyplan/core/Numeric.h"
#include "buyplan/core/Settings.h"

namespace buyplan::econ {

const char* toString(StockHorizon h) {
  switch (h) {
    case StockHorizon::TwoMonths:   return "two_months";
    case StockHorizon::ThreeMonths: return "three_months";
  }
  return "?";
}

const char* toString(OptionPick p) {
  switch (p) {
    case OptionPick::BestMonthlyRoi:    return "best_monthly_roi";
    case OptionPick::LargestAffordable: return "largest_affordable";
  }
  return "?";
}

std::optional<StockHorizon> parseStockHorizon(std::string_view text) {
  const std::string t = core::normalizeText(text);
  if (t == "two_months" || t == "2m" || t == "60") return StockHorizon::TwoMonths;
  if (t == "three_months" || t == "3m" || t == "90") return StockHorizon::ThreeMonths;
  return std::nullopt;
}

std::optional<OptionPick> parseOptionPick(std::string_view text) {
  const std::string t = core::normalizeText(text);
  if (t == "best_monthly_roi") return OptionPick::BestMonthlyRoi;
  if (t == "largest_affordable") return OptionPick::LargestAffordable;
  return std::nullopt;
}

void defineEngineSettings(core::Settings& s) {
  const EngineConfig d{};

  s.defineFloat("plan.churn.default_payout_days", d.churn.defaultPayoutDays, "Payout delay for ordinary products (days)");
  s.defineFloat("plan.churn.business_payout_days", d.churn.businessPayoutDays, "Payout delay for business electronics (days)");
  s.defineFloat("plan.churn.cap_weeks", d.churn.churnCapWeeks, "Churn weeks ceiling; <= 0 disables");

  s.defineString("plan.option.horizon", toString(d.option.horizon), "Stock horizon: two_months | three_months");
  s.defineInt("plan.option.max_options", d.option.maxOptionsPerSku, "Case-count options generated per SKU");
  s.defineString("plan.option.pick", toString(d.option.pick), "Bundle seed option: best_monthly_roi | largest_affordable");

  s.defineInt("plan.bundle.seed_count", d.bundle.seedCount, "SKUs that seed multi-SKU bundles");
  s.defineInt("plan.bundle.max_per_supplier", d.bundle.maxBundlesPerSupplier, "Bundles kept per supplier");
  s.defineFloat("plan.bundle.roi_tolerance", d.bundle.roiTolerance, "Minimum ROI ratio when adding a SKU");
  s.defineFloat("plan.bundle.supplier_budget_cap", d.bundle.supplierBudgetCap, "Per-supplier budget; <= 0 uses the global budget");

  s.defineInt("plan.optimizer.exhaustive_limit", d.optimizer.exhaustiveLimit, "Exhaustive search up to this many bundles (max 24)");
  s.defineBool("plan.optimizer.allow_overlap", d.optimizer.allowOverlappingBundles, "Allow bundles sharing a SKU in one plan");

  s.defineInt("plan.pipeline.substitution_iterations", d.pipeline.substitutionIterations, "Supplier substitution attempts");
}

bool engineConfigFromSettings(const core::Settings& s, EngineConfig& out, std::string* outError) {
  EngineConfig c{};

  c.churn.defaultPayoutDays = s.getFloat("plan.churn.default_payout_days", c.churn.defaultPayoutDays);
  c.churn.businessPayoutDays = s.getFloat("plan.churn.business_payout_days", c.churn.businessPayoutDays);
  c.churn.churnCapWeeks = s.getFloat("plan.churn.cap_weeks", c.churn.churnCapWeeks);

  const std::string horizon = s.getString("plan.option.horizon", toString(c.option.horizon));
  const auto h = parseStockHorizon(horizon);
  if (!h) {
    if (outError) *outError = "plan.option.horizon: unknown value '" + horizon + "'";
    return false;
  }
  c.option.horizon = *h;

  const std::string pick = s.getString("plan.option.pick", toString(c.option.pick));
  const auto p = parseOptionPick(pick);
  if (!p) {
    if (outError) *outError = "plan.option.pick: unknown value '" + pick + "'";
    return false;
  }
  c.option.pick = *p;
  c.option.maxOptionsPerSku = (int)s.getInt("plan.option.max_options", c.option.maxOptionsPerSku);

  c.bundle.seedCount = (int)s.getInt("plan.bundle.seed_count", c.bundle.seedCount);
  c.bundle.maxBundlesPerSupplier = (int)s.getInt("plan.bundle.max_per_supplier", c.bundle.maxBundlesPerSupplier);
  c.bundle.roiTolerance = s.getFloat("plan.bundle.roi_tolerance", c.bundle.roiTolerance);
  c.bundle.supplierBudgetCap = s.getFloat("plan.bundle.supplier_budget_cap", c.bundle.supplierBudgetCap);

  c.optimizer.exhaustiveLimit = (int)s.getInt("plan.optimizer.exhaustive_limit", c.optimizer.exhaustiveLimit);
  c.optimizer.allowOverlappingBundles = s.getBool("plan.optimizer.allow_overlap", c.optimizer.allowOverlappingBundles);

  c.pipeline.substitutionIterations = (int)s.getInt("plan.pipeline.substitution_iterations", c.pipeline.substitutionIterations);

  if (c.option.maxOptionsPerSku < 1) {
    if (outError) *outError = "plan.option.max_options must be >= 1";
    return false;
  }
  if (c.optimizer.exhaustiveLimit < 0 || c.optimizer.exhaustiveLimit > kMaxExhaustiveCandidates) {
    if (outError) *outError = "plan.optimizer.exhaustive_limit must be within 0..24";
    return false;
  }
  if (c.bundle.seedCount < 0 || c.bundle.maxBundlesPerSupplier < 1) {
    if (outError) *outError = "plan.bundle.seed_count must be >= 0 and plan.bundle.max_per_supplier >= 1";
    return false;
  }
  if (c.pipeline.substitutionIterations < 0) {
    if (outError) *outError = "plan.pipeline.substitution_iterations must be >= 0";
    return false;
  }

  out = c;
  return true;
}

} // namespace buyplan::econ
