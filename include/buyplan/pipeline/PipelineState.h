#pragma once

#include "buyplan/econ/CostModel.h"
#include "buyplan/econ/PlanInputs.h"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace buyplan::pipeline {

inline constexpr const char* kPipelineVersion = "v3.3";
inline constexpr int kFirstStage = 1;
inline constexpr int kLastStage = 8;

struct PipelineMeta {
  std::string version{kPipelineVersion};
  int stage{0};
  std::string createdAt;
  std::string updatedAt;
};

// Normalized working copy produced by the load stage.
struct PipelineData {
  std::vector<econ::SupplierTerms> suppliers;
  std::vector<econ::Product> products;  // eligible, keys normalized
  std::vector<econ::FreightCurve> freightCurves;
  econ::FreightConfig freightConfig{};
  bool hasFreightConfig{false};
  econ::ChurnSettings churnSettings;
};

// ------------------------------
// Stage 0: load

struct Stage0Output {
  int suppliersLoaded{0};
  int productsLoaded{0};
  int productsEligible{0};
  bool hasFreightConfig{false};
};

// ------------------------------
// Stage 1: MOQ blocks

struct BlockLine {
  std::size_t productIndex{0};  // into PipelineData::products
  std::string sku;
  std::string title;
  int caseSize{1};
  int cases{0};
  int units{0};
  double supplierPrice{0.0};
  double costBSF{0.0};
  double proxyMonthlyROI{0.0};  // one case at BSF, churn-aware
};

struct MoqBlock {
  std::string supplierKey;
  std::string supplierName;
  double moqGBP{0.0};
  std::vector<BlockLine> lines;

  double totalBSF{0.0};
  int totalUnits{0};
  int totalCases{0};
  double avgProxyROI{0.0};
  bool meetsMoq{true};
};

struct Stage1Output {
  std::vector<MoqBlock> blocks;  // best average proxy first

  int supplierCount{0};
  int productCount{0};
  int includedSkus{0};
  double totalBSF{0.0};
};

// ------------------------------
// Stage 2: estimated ASF

struct EstimatedBlock {
  MoqBlock block;
  double estimatedFreight{0.0};
  std::string freightMethod;
  double currencyFee{0.0};
  double freightMultiplier{1.0};
  double estimatedASF{0.0};
  double profitBSF{0.0};
  double estimatedProfit{0.0};  // profitBSF less estimated freight and fees
  double churnWeeks{0.0};
  double estimatedMonthlyROI{0.0};
};

struct Stage2Output {
  std::vector<EstimatedBlock> blocks;

  double totalBSF{0.0};
  double totalASF{0.0};
  double totalFreight{0.0};
  double totalCurrencyFee{0.0};
};

// ------------------------------
// Stage 3: rank

struct RankedSupplier {
  std::size_t blockIndex{0};  // into Stage2Output::blocks
  std::string supplierKey;
  std::string supplierName;
  double estimatedMonthlyROI{0.0};
  double estimatedASF{0.0};
};

struct Stage3Output {
  std::vector<RankedSupplier> ranked;
};

// ------------------------------
// Stage 4: budget cut line

struct RejectedSupplier {
  RankedSupplier entry;
  std::string reason;  // "non_positive_asf" | "insufficient_budget"
};

struct Stage4Output {
  std::vector<RankedSupplier> selected;
  std::vector<RejectedSupplier> rejected;

  double budget{0.0};
  double spentASF{0.0};
  double remainingASF{0.0};
};

// ------------------------------
// Stage 5: exact ASF

struct ExactSupplier {
  std::string supplierKey;
  std::string supplierName;
  std::size_t blockIndex{0};  // into Stage2Output::blocks

  econ::FreightQuote freight;
  double costBSF{0.0};
  double currencyFee{0.0};
  double freightMultiplier{1.0};
  double exactASF{0.0};
  double profitLand{0.0};
  double roi{0.0};
  double churnWeeks{0.0};
  double exactMonthlyROI{0.0};
};

struct Stage5Output {
  std::vector<ExactSupplier> suppliers;

  double totalBSF{0.0};
  double totalASF{0.0};
  double totalFreight{0.0};
  double totalCurrencyFee{0.0};
};

// ------------------------------
// Stage 6: case-level reallocation

struct CaseItem {
  std::string supplierKey;
  std::string supplierName;
  std::string sku;
  std::string title;
  std::size_t productIndex{0};
  int caseNumber{1};  // k-th case of this SKU, 1-based
  int units{0};
  double asfCost{0.0};
  double profit{0.0};
  double marginalRoi{0.0};  // monthly ROI of holding k cases
};

struct Stage6Output {
  std::vector<CaseItem> cases;    // selected, best first
  std::vector<CaseItem> dropped;  // left out of the budget

  double totalASF{0.0};
  int totalUnits{0};
  int poolSize{0};
};

// ------------------------------
// Stage 7: supplier substitution (advisory)

struct SubstitutionSnapshot {
  double totalASF{0.0};
  double avgMarginalRoi{0.0};
  int caseCount{0};
};

struct Substitution {
  std::string removedSupplierKey;
  std::string removedSku;
  std::string addedSupplierKey;
  double addedASF{0.0};
};

struct Stage7Output {
  bool improved{false};
  int iterations{0};
  SubstitutionSnapshot before;
  SubstitutionSnapshot after;
  std::vector<Substitution> swaps;
};

// ------------------------------
// Stage 8: finalize

struct FinalSku {
  std::string sku;
  std::string title;
  int cases{0};
  int units{0};
  double asfCost{0.0};
  double profit{0.0};
  double roi{0.0};
  double monthlyROI{0.0};  // ASF-weighted over the SKU's cases
};

struct FinalSupplier {
  std::string supplierKey;
  std::string supplierName;
  double totalASF{0.0};
  int totalUnits{0};
  double expectedProfit{0.0};
  double averageROI{0.0};
  std::vector<FinalSku> skus;
};

struct FinalSummary {
  double budget{0.0};
  double budgetUsed{0.0};
  double budgetRemaining{0.0};
  double expectedProfit{0.0};
  double averageROI{0.0};
  int totalUnits{0};
  double monthlyROI{0.0};
};

struct Stage8Output {
  FinalSummary summary;
  std::vector<FinalSupplier> suppliers;
};

// ------------------------------
// State

// Every stage output is kept so any stage can be re-run or audited alone.
// A stage only ever writes its own slot.
struct PipelineState {
  PipelineMeta meta;
  econ::PlanInputs inputs;
  PipelineData data;

  std::optional<Stage0Output> stage0;
  std::optional<Stage1Output> stage1;
  std::optional<Stage2Output> stage2;
  std::optional<Stage3Output> stage3;
  std::optional<Stage4Output> stage4;
  std::optional<Stage5Output> stage5;
  std::optional<Stage6Output> stage6;
  std::optional<Stage7Output> stage7;
  std::optional<Stage8Output> stage8;
};

// Stage output tagged by stage number.
using StageOutput = std::variant<Stage0Output, Stage1Output, Stage2Output, Stage3Output, Stage4Output,
                                 Stage5Output, Stage6Output, Stage7Output, Stage8Output>;

// Compile-time description of each stage: output type, name and state slot.
template <int N>
struct StageTraits;

#define BUYPLAN_STAGE_TRAITS(N, OUT, NAME)                                               \
  template <>                                                                            \
  struct StageTraits<N> {                                                                \
    using Output = OUT;                                                                  \
    static constexpr const char* name = NAME;                                            \
    static constexpr std::optional<OUT> PipelineState::*slot = &PipelineState::stage##N; \
  };

BUYPLAN_STAGE_TRAITS(0, Stage0Output, "load")
BUYPLAN_STAGE_TRAITS(1, Stage1Output, "moq_blocks")
BUYPLAN_STAGE_TRAITS(2, Stage2Output, "estimated_asf")
BUYPLAN_STAGE_TRAITS(3, Stage3Output, "rank_suppliers")
BUYPLAN_STAGE_TRAITS(4, Stage4Output, "budget_cut_line")
BUYPLAN_STAGE_TRAITS(5, Stage5Output, "exact_asf")
BUYPLAN_STAGE_TRAITS(6, Stage6Output, "reallocate_cases")
BUYPLAN_STAGE_TRAITS(7, Stage7Output, "supplier_substitution")
BUYPLAN_STAGE_TRAITS(8, Stage8Output, "finalize")

#undef BUYPLAN_STAGE_TRAITS

template <int N>
const typename StageTraits<N>::Output* stageSlot(const PipelineState& s) {
  const auto& opt = s.*StageTraits<N>::slot;
  return opt ? &*opt : nullptr;
}

const char* stageName(int stage);

// Output of `stage` tagged by number, or nullopt when the slot is empty or the
// stage is out of range.
std::optional<StageOutput> stageOutput(const PipelineState& s, int stage);

} // namespace buyplan::pipeline
