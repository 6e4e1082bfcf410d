#pragma once

#include "buyplan/econ/EngineConfig.h"
#include "buyplan/econ/PlanInputs.h"
#include "buyplan/pipeline/PipelineState.h"

namespace buyplan::pipeline {

// Outcome of one stage. `output` is only meaningful when ok.
template <class T>
struct StageRun {
  bool ok{false};
  econ::PlanError error;
  T output{};
};

// Stage functions are pure: each takes the typed outputs it depends on, so a
// stage can't be wired to the wrong upstream slot. An empty upstream output
// is a StageDependency error, a non-positive budget an Input error.

// Stage 0. Normalizes supplier keys, filters ineligible products and copies
// everything else into `outData`.
StageRun<Stage0Output> loadStage(const econ::PlanInputs& inputs, PipelineData* outData);

// Stage 1. Per supplier, products ranked by one-case monthly ROI at BSF, whole
// cases added until the block spend reaches the supplier MOQ.
StageRun<Stage1Output> buildMoqBlocks(const PipelineData& data, const econ::EngineConfig& cfg);

// Stage 2. Prices every block with the generic rate model.
StageRun<Stage2Output> estimateBlockAsf(const Stage1Output& blocks,
                                        const PipelineData& data,
                                        const econ::EngineConfig& cfg);

// Stage 3. Blocks by estimated monthly ROI, best first; ties keep block order.
StageRun<Stage3Output> rankSuppliers(const Stage2Output& estimated);

// Stage 4. Greedy cut line over the ranking.
StageRun<Stage4Output> allocateBudget(const Stage3Output& ranked, double budget);

// Stage 5. Exact freight (curve lookup) for the selected suppliers only.
StageRun<Stage5Output> computeExactAsf(const Stage2Output& estimated,
                                       const Stage4Output& selection,
                                       const PipelineData& data,
                                       const econ::EngineConfig& cfg);

// Stage 6. Case-level reallocation against the budget.
StageRun<Stage6Output> reallocateCases(const Stage5Output& exact,
                                       const Stage2Output& estimated,
                                       const PipelineData& data,
                                       double budget,
                                       const econ::EngineConfig& cfg);

// Stage 7. Tries swapping the worst case for an excluded supplier's MOQ block.
// Reports before/after metrics only; the stage 6 selection is left untouched.
StageRun<Stage7Output> substituteSuppliers(const Stage6Output& cases,
                                           const Stage4Output& selection,
                                           const Stage2Output& estimated,
                                           double budget,
                                           const econ::PipelineConfig& cfg);

// Stage 8. Freezes the stage 6 cases into a per-supplier, per-SKU plan.
StageRun<Stage8Output> finalizePlan(const Stage6Output& cases, double budget);

} // namespace buyplan::pipeline
