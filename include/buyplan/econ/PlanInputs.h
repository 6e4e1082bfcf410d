#pragma once

#include "buyplan/econ/ChurnModel.h"
#include "buyplan/econ/CostModel.h"
#include "buyplan/econ/Product.h"
#include "buyplan/econ/Supplier.h"

#include <cstdint>
#include <string>
#include <vector>

namespace buyplan::econ {

// Already-parsed engine input.
struct PlanInputs {
  double budget{0.0};
  std::vector<Product> products;
  std::vector<SupplierTerms> suppliers;
  std::vector<FreightCurve> freightCurves;
  FreightConfig freightConfig{};
  bool hasFreightConfig{false};
  ChurnSettings churnSettings;
};

enum class PlanErrorKind : std::uint8_t {
  None            = 0,
  Input           = 1,  // bad budget, empty product set, unreadable request
  StageDependency = 2   // a pipeline stage ran without its prerequisite output
};

const char* toString(PlanErrorKind k);

struct PlanError {
  PlanErrorKind kind{PlanErrorKind::None};
  int stage{-1};  // pipeline stage, -1 outside the pipeline
  std::string message;

  explicit operator bool() const { return kind != PlanErrorKind::None; }
};

PlanError inputError(std::string message, int stage = -1);
PlanError stageDependencyError(int stage, std::string message);

// "input: ..." / "stage_dependency: [stage 5] ...".
std::string describe(const PlanError& e);

} // namespace buyplan::econ
