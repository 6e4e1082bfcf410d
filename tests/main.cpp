#include "buyplan/core/Log.h"

#include <iostream>

int test_args();
int test_settings();
int test_log_sinks();
int test_cost_model();
int test_churn_model();
int test_option_builder();
int test_bundle_builder();
int test_budget_optimizer();
int test_plan_engine();
int test_shipment_quote();
int test_pipeline();
int test_json_io();

int main() {
  // Engine INFO lines would drown the test output.
  buyplan::core::setLogLevel(buyplan::core::LogLevel::Warn);

  int fails = 0;

  fails += test_args();
  fails += test_settings();
  fails += test_log_sinks();
  fails += test_cost_model();
  fails += test_churn_model();
  fails += test_option_builder();
  fails += test_bundle_builder();
  fails += test_budget_optimizer();
  fails += test_plan_engine();
  fails += test_shipment_quote();
  fails += test_pipeline();
  fails += test_json_io();

  if (fails == 0) {
    std::cout << "[buyplan_tests] ALL PASS\n";
    return 0;
  }

  std::cerr << "[buyplan_tests] FAILS=" << fails << "\n";
  return 1;
}
