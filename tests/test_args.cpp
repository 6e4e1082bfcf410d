#include "buyplan/core/Args.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

static std::vector<char*> makeArgv(std::initializer_list<const char*> items) {
  std::vector<char*> argv;
  argv.reserve(items.size());
  for (const char* s : items) {
    argv.push_back(const_cast<char*>(s));
  }
  return argv;
}

int test_args() {
  int fails = 0;

  using buyplan::core::Args;

  // Key/value in both spellings, typed getters.
  {
    auto argv = makeArgv({"buyplan_cli", "--request", "req.json", "--stage=5", "--through", "8"});
    Args args((int)argv.size(), argv.data());

    std::string request;
    if (!args.getString("request", request) || request != "req.json") {
      std::cerr << "[test_args] expected --request req.json\n";
      ++fails;
    }

    int stage = 0;
    if (!args.getInt("stage", stage) || stage != 5) {
      std::cerr << "[test_args] expected --stage=5 to parse\n";
      ++fails;
    }

    int through = 0;
    if (!args.getInt("through", through) || through != 8) {
      std::cerr << "[test_args] expected --through 8 to parse\n";
      ++fails;
    }

    if (args.program() != "buyplan_cli") {
      std::cerr << "[test_args] expected program name to be kept\n";
      ++fails;
    }
  }

  // A non-numeric value must not parse as an int.
  {
    auto argv = makeArgv({"app", "--stage", "five"});
    Args args((int)argv.size(), argv.data());
    int stage = 3;
    if (args.getInt("stage", stage) || stage != 3) {
      std::cerr << "[test_args] expected --stage five to be rejected and leave the output untouched\n";
      ++fails;
    }
  }

  // Negative numeric values are values, not switches.
  {
    auto argv = makeArgv({"app", "--budget", "-50.5"});
    Args args((int)argv.size(), argv.data());

    double budget = 0.0;
    if (!args.getDouble("budget", budget) || std::abs(budget - (-50.5)) > 1e-9) {
      std::cerr << "[test_args] expected --budget -50.5 to parse\n";
      ++fails;
    }
  }

  // Repeated keys keep every value; last() returns the final one.
  {
    auto argv = makeArgv({"app", "--set", "plan.bundle.seed_count=3", "--set", "plan.optimizer.allow_overlap=true"});
    Args args((int)argv.size(), argv.data());

    const auto sets = args.values("set");
    if (sets.size() != 2 || sets[0] != "plan.bundle.seed_count=3") {
      std::cerr << "[test_args] expected two --set values, got " << sets.size() << "\n";
      ++fails;
    }
    const auto last = args.last("set");
    if (!last || *last != "plan.optimizer.allow_overlap=true") {
      std::cerr << "[test_args] expected last --set to win\n";
      ++fails;
    }
  }

  // The end-of-options marker forces everything after it to be positional.
  {
    auto argv = makeArgv({"app", "--pretty", "--", "--notAFlag", "-x", "pos"});
    Args args((int)argv.size(), argv.data());

    if (!args.hasFlag("pretty")) {
      std::cerr << "[test_args] expected --pretty to be recognized\n";
      ++fails;
    }
    if (args.hasFlag("notAFlag") || args.hasFlag("x")) {
      std::cerr << "[test_args] expected tokens after -- to NOT be parsed as flags\n";
      ++fails;
    }
    const auto& pos = args.positional();
    if (pos.size() != 3 || pos[0] != "--notAFlag" || pos[1] != "-x" || pos[2] != "pos") {
      std::cerr << "[test_args] expected 3 positional args after --, got size=" << pos.size() << "\n";
      ++fails;
    }
  }

  // A single '-' is a stdout placeholder and stays a value.
  {
    auto argv = makeArgv({"app", "--out", "-"});
    Args args((int)argv.size(), argv.data());

    if (args.hasFlag("out")) {
      std::cerr << "[test_args] expected --out - to be parsed as a key/value, not a flag\n";
      ++fails;
    }
    const auto v = args.last("out");
    if (!v || *v != "-") {
      std::cerr << "[test_args] expected --out to have value '-'\n";
      ++fails;
    }
  }

  // Negative positional numbers stay positional; grouped short flags split.
  {
    auto argv = makeArgv({"app", "-1", "-0.25", "-hv"});
    Args args((int)argv.size(), argv.data());
    const auto& pos = args.positional();
    if (pos.size() != 2 || pos[0] != "-1" || pos[1] != "-0.25") {
      std::cerr << "[test_args] expected negative positional args to remain positional\n";
      ++fails;
    }
    if (!args.hasFlag("h") || !args.hasFlag("v")) {
      std::cerr << "[test_args] expected -hv to set flags h and v\n";
      ++fails;
    }
  }

  // has() covers both flags and key/value options.
  {
    auto argv = makeArgv({"app", "--sig", "--mode", "stage"});
    Args args((int)argv.size(), argv.data());
    if (!args.has("sig") || !args.has("mode") || args.has("quote")) {
      std::cerr << "[test_args] expected has() to see --sig and --mode only\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_args] pass\n";
  return fails;
}
