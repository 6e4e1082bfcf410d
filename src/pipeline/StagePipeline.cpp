#include "buyplan/pipeline/StagePipeline.h"

#include "buyplan/core/Log.h"
#include "buyplan/pipeline/Stages.h"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace buyplan::pipeline {

std::string isoTimestampUtc() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto t = clock::to_time_t(now);

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
  return oss.str();
}

namespace {

std::string now(const PipelineClock& clock) {
  return clock ? clock() : isoTimestampUtc();
}

void mergeInputs(econ::PlanInputs& into, const econ::PlanInputs& from) {
  if (std::isfinite(from.budget) && from.budget > 0.0) into.budget = from.budget;
  if (!from.products.empty()) into.products = from.products;
  if (!from.suppliers.empty()) into.suppliers = from.suppliers;
  if (!from.freightCurves.empty()) into.freightCurves = from.freightCurves;
  if (from.hasFreightConfig) {
    into.freightConfig = from.freightConfig;
    into.hasFreightConfig = true;
  }
  for (const auto& [key, o] : from.churnSettings) into.churnSettings[key] = o;
}

// Typed read of an upstream slot. Missing output is a dependency error named
// after the stage that needed it.
template <int N>
const typename StageTraits<N>::Output* require(const PipelineState& s, int forStage, econ::PlanError& err) {
  const auto* out = stageSlot<N>(s);
  if (!out) {
    err = econ::stageDependencyError(forStage, std::string("requires stage ") + std::to_string(N) + " (" +
                                                 StageTraits<N>::name + ") output");
  }
  return out;
}

template <int N>
bool commit(PipelineState& s, StageRun<typename StageTraits<N>::Output> run, econ::PlanError& err) {
  if (!run.ok) {
    err = std::move(run.error);
    return false;
  }
  s.*StageTraits<N>::slot = std::move(run.output);
  return true;
}

bool execute(int stage, PipelineState& s, const econ::EngineConfig& cfg, econ::PlanError& err) {
  const double budget = s.inputs.budget;

  switch (stage) {
    case 1:
      return commit<1>(s, buildMoqBlocks(s.data, cfg), err);
    case 2: {
      const auto* s1 = require<1>(s, 2, err);
      return s1 && commit<2>(s, estimateBlockAsf(*s1, s.data, cfg), err);
    }
    case 3: {
      const auto* s2 = require<2>(s, 3, err);
      return s2 && commit<3>(s, rankSuppliers(*s2), err);
    }
    case 4: {
      const auto* s3 = require<3>(s, 4, err);
      return s3 && commit<4>(s, allocateBudget(*s3, budget), err);
    }
    case 5: {
      const auto* s2 = require<2>(s, 5, err);
      const auto* s4 = s2 ? require<4>(s, 5, err) : nullptr;
      return s4 && commit<5>(s, computeExactAsf(*s2, *s4, s.data, cfg), err);
    }
    case 6: {
      const auto* s5 = require<5>(s, 6, err);
      const auto* s2 = s5 ? require<2>(s, 6, err) : nullptr;
      return s2 && commit<6>(s, reallocateCases(*s5, *s2, s.data, budget, cfg), err);
    }
    case 7: {
      const auto* s6 = require<6>(s, 7, err);
      const auto* s4 = s6 ? require<4>(s, 7, err) : nullptr;
      const auto* s2 = s4 ? require<2>(s, 7, err) : nullptr;
      return s2 && commit<7>(s, substituteSuppliers(*s6, *s4, *s2, budget, cfg.pipeline), err);
    }
    case 8: {
      const auto* s6 = require<6>(s, 8, err);
      return s6 && commit<8>(s, finalizePlan(*s6, budget), err);
    }
    default:
      err = econ::inputError("stage must be between 1 and 8, got " + std::to_string(stage));
      return false;
  }
}

} // namespace

StageResult runStage(int stage,
                     const PipelineState* previous,
                     const econ::PlanInputs& inputs,
                     const econ::EngineConfig& cfg,
                     const PipelineClock& clock) {
  StageResult r;
  if (stage < kFirstStage || stage > kLastStage) {
    r.error = econ::inputError("stage must be between 1 and 8, got " + std::to_string(stage));
    return r;
  }

  PipelineState& s = r.state;
  const std::string stamp = now(clock);

  if (previous && previous->stage0) {
    s = *previous;
    mergeInputs(s.inputs, inputs);
  } else {
    s.inputs = inputs;
    s.meta.createdAt = stamp;
    if (!commit<0>(s, loadStage(s.inputs, &s.data), r.error)) return r;
  }
  if (s.meta.createdAt.empty()) s.meta.createdAt = stamp;

  BUYPLAN_LOG_DEBUG("[pipeline] running stage " + std::to_string(stage) + " (" + stageName(stage) + ")");
  if (!execute(stage, s, cfg, r.error)) {
    BUYPLAN_LOG_WARN("[pipeline] " + econ::describe(r.error));
    return r;
  }

  s.meta.version = kPipelineVersion;
  s.meta.stage = stage;
  s.meta.updatedAt = stamp;
  r.ok = true;
  return r;
}

StageResult runThrough(int lastStage,
                       const econ::PlanInputs& inputs,
                       const econ::EngineConfig& cfg,
                       const PipelineClock& clock) {
  if (lastStage < kFirstStage || lastStage > kLastStage) {
    StageResult r;
    r.error = econ::inputError("stage must be between 1 and 8, got " + std::to_string(lastStage));
    return r;
  }

  StageResult current = runStage(kFirstStage, nullptr, inputs, cfg, clock);
  for (int stage = kFirstStage + 1; current.ok && stage <= lastStage; ++stage) {
    StageResult next = runStage(stage, &current.state, econ::PlanInputs{}, cfg, clock);
    if (!next.ok) {
      current.ok = false;
      current.error = std::move(next.error);
      break;
    }
    current = std::move(next);
  }
  return current;
}

} // namespace buyplan::pipeline
