#include "buyplan/econ/PlanInputs.h"

namespace buyplan::econ {

const char* toString(PlanErrorKind k) {
  switch (k) {
    case PlanErrorKind::None:            return "none";
    case PlanErrorKind::Input:           return "input";
    case PlanErrorKind::StageDependency: return "stage_dependency";
  }
  return "?";
}

static std::string stagePrefix(int stage) {
  return stage >= 0 ? "[stage " + std::to_string(stage) + "] " : std::string();
}

PlanError inputError(std::string message, int stage) {
  PlanError e;
  e.kind = PlanErrorKind::Input;
  e.stage = stage;
  e.message = stagePrefix(stage) + message;
  return e;
}

PlanError stageDependencyError(int stage, std::string message) {
  PlanError e;
  e.kind = PlanErrorKind::StageDependency;
  e.stage = stage;
  e.message = stagePrefix(stage) + message;
  return e;
}

std::string describe(const PlanError& e) {
  return std::string(toString(e.kind)) + ": " + e.message;
}

} // namespace buyplan::econ
