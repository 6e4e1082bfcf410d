#include "buyplan/core/Settings.h"
#include "buyplan/econ/EngineConfig.h"

#include "test_harness.h"

#include <cstdio>
#include <string>

int test_settings() {
  int failures = 0;

  using buyplan::core::Settings;
  using buyplan::core::SettingType;

  // ---- Define + typed get/set ----
  {
    Settings s;
    CHECK(s.defineBool("a.bool", true, "test"));
    CHECK(s.defineInt("a.int", 42));
    CHECK(s.defineFloat("a.float", 1.5));
    CHECK(s.defineString("a.str", "hello"));

    // Same name, other type.
    CHECK(!s.defineInt("a.bool", 1));

    CHECK(s.getBool("a.bool", false) == true);
    CHECK(s.getInt("a.int", 0) == 42);
    CHECK(s.getFloat("a.float", 0.0) > 1.4);
    CHECK(s.getString("a.str", "") == "hello");

    std::string err;
    CHECK(s.setFromString("a.bool", "off", &err));
    CHECK(s.getBool("a.bool", true) == false);
    CHECK(s.setFromString("a.int", "-7", &err));
    CHECK(s.getInt("a.int", 0) == -7);
    CHECK(s.setFromString("a.str", "\"hi there\"", &err));
    CHECK(s.getString("a.str", "") == "hi there");

    CHECK(!s.setFromString("a.int", "seven", &err));
    CHECK(err.find("a.int") != std::string::npos);
    CHECK(!s.setFromString("missing.key", "1", &err));

    CHECK(s.reset("a.int", &err));
    CHECK(s.getInt("a.int", 0) == 42);

    // Name-sorted listing.
    const auto all = s.list();
    CHECK(all.size() == 4);
    if (all.size() == 4) {
      CHECK(all.front()->name == "a.bool");
      CHECK(all.back()->name == "a.str");
      CHECK(all.back()->type == SettingType::String);
    }
  }

  // ---- Pending assignment (load before define) ----
  {
    Settings s;
    std::string err;
    CHECK(s.loadText("# comment\nplan.bundle.seed_count = 3\n\nplan.option.horizon = \"two_months\"\n", &err));
    CHECK(s.hasPending("plan.bundle.seed_count"));
    CHECK(s.pendingValue("plan.option.horizon").value_or("") == "\"two_months\"");

    buyplan::econ::defineEngineSettings(s);
    CHECK(!s.hasPending("plan.bundle.seed_count"));

    buyplan::econ::EngineConfig cfg;
    CHECK(buyplan::econ::engineConfigFromSettings(s, cfg, &err));
    CHECK(cfg.bundle.seedCount == 3);
    CHECK(cfg.option.horizon == buyplan::econ::StockHorizon::TwoMonths);
    CHECK(cfg.bundle.roiTolerance > 0.94 && cfg.bundle.roiTolerance < 0.96);
  }

  // ---- Malformed line ----
  {
    Settings s;
    std::string err;
    CHECK(!s.loadText("plan.bundle.seed_count 3\n", &err));
    CHECK(err.find("Line 1") != std::string::npos);
  }

  // ---- Engine defaults and validation ----
  {
    Settings s;
    buyplan::econ::defineEngineSettings(s);

    buyplan::econ::EngineConfig cfg;
    std::string err;
    CHECK(buyplan::econ::engineConfigFromSettings(s, cfg, &err));
    CHECK(cfg.churn.defaultPayoutDays == 14.0);
    CHECK(cfg.churn.businessPayoutDays == 42.0);
    CHECK(cfg.option.maxOptionsPerSku == 20);
    CHECK(cfg.optimizer.exhaustiveLimit == 20);
    CHECK(!cfg.optimizer.allowOverlappingBundles);
    CHECK(cfg.pipeline.substitutionIterations == 3);
    CHECK(cfg.option.pick == buyplan::econ::OptionPick::LargestAffordable);

    CHECK(s.setFromString("plan.optimizer.exhaustive_limit", "25", &err));
    CHECK(!buyplan::econ::engineConfigFromSettings(s, cfg, &err));
    CHECK(err.find("exhaustive_limit") != std::string::npos);

    CHECK(s.reset("plan.optimizer.exhaustive_limit", &err));
    CHECK(s.setFromString("plan.option.pick", "cheapest", &err));
    CHECK(!buyplan::econ::engineConfigFromSettings(s, cfg, &err));
    CHECK(err.find("plan.option.pick") != std::string::npos);

    CHECK(s.setFromString("plan.option.pick", "best_monthly_roi", &err));
    CHECK(buyplan::econ::engineConfigFromSettings(s, cfg, &err));
    CHECK(cfg.option.pick == buyplan::econ::OptionPick::BestMonthlyRoi);
  }

  // ---- Save + reload ----
  {
    const std::string path = "buyplan_test_settings_roundtrip.cfg";

    Settings a;
    buyplan::econ::defineEngineSettings(a);
    std::string err;
    CHECK(a.setFromString("plan.churn.cap_weeks", "15", &err));
    CHECK(a.setFromString("plan.optimizer.allow_overlap", "true", &err));
    CHECK(a.saveFile(path, &err));

    Settings b;
    CHECK(b.loadFile(path, &err));
    buyplan::econ::defineEngineSettings(b);

    buyplan::econ::EngineConfig cfg;
    CHECK(buyplan::econ::engineConfigFromSettings(b, cfg, &err));
    CHECK(cfg.churn.churnCapWeeks == 15.0);
    CHECK(cfg.optimizer.allowOverlappingBundles);

    std::remove(path.c_str());
  }

  return failures;
}
