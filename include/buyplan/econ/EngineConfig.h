#pragma once

#include "buyplan/econ/BudgetOptimizer.h"
#include "buyplan/econ/BundleBuilder.h"
#include "buyplan/econ/ChurnModel.h"
#include "buyplan/econ/OptionBuilder.h"

#include <optional>
#include <string>
#include <string_view>

namespace buyplan::core {
class Settings;
}

namespace buyplan::econ {

struct PipelineConfig {
  int substitutionIterations{3};
};

// Every tunable the engine reads. Passed by value into each call.
struct EngineConfig {
  ChurnConfig churn{};
  OptionConfig option{};
  BundleConfig bundle{};
  OptimizerConfig optimizer{};
  PipelineConfig pipeline{};
};

const char* toString(StockHorizon h);
const char* toString(OptionPick p);
std::optional<StockHorizon> parseStockHorizon(std::string_view text);
std::optional<OptionPick> parseOptionPick(std::string_view text);

// Registers every knob under "plan.*" with the EngineConfig defaults.
void defineEngineSettings(core::Settings& settings);

// Reads the "plan.*" keys. Fails on an unknown enum spelling or a value out of range.
bool engineConfigFromSettings(const core::Settings& settings, EngineConfig& out, std::string* outError = nullptr);

} // namespace buyplan::econ
