#pragma once

#include "buyplan/econ/EngineConfig.h"
#include "buyplan/econ/PlanInputs.h"
#include "buyplan/pipeline/PipelineState.h"

#include <functional>
#include <string>

namespace buyplan::pipeline {

// Source of meta timestamps. Tests inject a fixed clock.
using PipelineClock = std::function<std::string()>;

// Current UTC time, "2026-01-31T12:00:00.000Z".
std::string isoTimestampUtc();

struct StageResult {
  bool ok{false};
  econ::PlanError error;
  PipelineState state;
};

// Runs exactly one stage (1..8) and returns the new state.
//
// Without a previous state (or one that never loaded) stage 0 runs first.
// With one, `inputs` is merged over the previous inputs: a positive budget,
// non-empty lists and a supplied freight config replace what was there,
// churn overrides are merged by supplier. The loaded data is kept as is.
// Stages don't cascade: prerequisites must already be in `previous`.
StageResult runStage(int stage,
                     const PipelineState* previous,
                     const econ::PlanInputs& inputs,
                     const econ::EngineConfig& cfg,
                     const PipelineClock& clock = {});

// Drives stages 1..lastStage in order from a fresh load, stopping at the
// first failure. The failing stage's error is returned with the state as it
// was after the last successful stage.
StageResult runThrough(int lastStage,
                       const econ::PlanInputs& inputs,
                       const econ::EngineConfig& cfg,
                       const PipelineClock& clock = {});

} // namespace buyplan::pipeline
