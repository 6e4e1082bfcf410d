#include "buyplan/core/Args.h"
#include "buyplan/core/JsonWriter.h"
#include "buyplan/core/Log.h"
#include "buyplan/core/Settings.h"
#include "buyplan/econ/EngineConfig.h"
#include "buyplan/econ/PlanEngine.h"
#include "buyplan/econ/ShipmentQuote.h"
#include "buyplan/io/PlanJson.h"
#include "buyplan/pipeline/StagePipeline.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace buyplan;

static void printHelp() {
  std::cout << "buyplan_cli\n"
            << "  --request <file>       Request JSON {budget, products, suppliers, freightCurves, freightConfig, churnSettings}\n"
            << "  --mode <m>             plan (default) | stage | quote\n"
            << "  --out <path>           Write JSON to a file instead of stdout ('-' means stdout)\n"
            << "  --pretty               Indent the JSON output\n"
            << "  --log <level>          trace | debug | info | warn | error | off (default: warn)\n"
            << "\n"
            << "Staged pipeline (--mode stage):\n"
            << "  --stage <n>            Run only stage n (1..8); prerequisites must exist\n"
            << "  --state <file>         Saved stage output to continue from (with --stage); the\n"
            << "                         request is optional and only overrides the stored inputs\n"
            << "  --through <n>          Load, then run stages 1..n in order (default: 8)\n"
            << "  --sig                  Add a signature per stage output (idempotence audits)\n"
            << "\n"
            << "Configuration:\n"
            << "  --config <file>        Settings file (key = value), see --list-settings\n"
            << "  --set <key=value>      Override one setting (repeatable)\n"
            << "  --list-settings        Print every plan.* setting with its default and exit\n"
            << "\n"
            << "Quote (--mode quote): prices the request's products at their unitsToOrder as one\n"
            << "shipment from shipmentInfo (or the first product's supplier).\n";
}

static void listSettings(const core::Settings& settings) {
  for (const core::Setting* s : settings.list()) {
    std::cout << s->name << " = " << core::Settings::valueToString(*s) << "  ("
              << core::Settings::typeName(s->type) << ")";
    if (!s->help.empty()) std::cout << "  " << s->help;
    std::cout << "\n";
  }
}

static bool applyOverrides(core::Settings& settings, const core::Args& args, std::string* outError) {
  for (const std::string& kv : args.values("set")) {
    const auto eq = kv.find('=');
    if (eq == std::string::npos) {
      if (outError) *outError = "--set expects key=value, got '" + kv + "'";
      return false;
    }
    if (!settings.setFromString(kv.substr(0, eq), kv.substr(eq + 1), outError)) return false;
  }
  return true;
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Warn);

  core::Args args;
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  {
    std::string level;
    if (args.getString("log", level)) {
      const auto parsed = core::parseLogLevel(level);
      if (!parsed) {
        std::cerr << "Unknown --log level: " << level << "\n";
        return 2;
      }
      core::setLogLevel(*parsed);
    }
  }

  core::Settings settings;
  econ::defineEngineSettings(settings);

  if (args.has("list-settings")) {
    listSettings(settings);
    return 0;
  }

  std::string configPath;
  if (args.getString("config", configPath)) {
    std::string err;
    if (!settings.loadFile(configPath, &err)) {
      std::cerr << "Failed to load --config: " << err << "\n";
      return 2;
    }
  }
  {
    std::string err;
    if (!applyOverrides(settings, args, &err)) {
      std::cerr << err << "\n";
      return 2;
    }
  }

  econ::EngineConfig cfg;
  {
    std::string err;
    if (!econ::engineConfigFromSettings(settings, cfg, &err)) {
      std::cerr << "Invalid configuration: " << err << "\n";
      return 2;
    }
  }

  std::string mode = "plan";
  (void)args.getString("mode", mode);

  std::string statePath;
  const bool fromState = mode == "stage" && args.getString("state", statePath) && !statePath.empty();

  std::string requestPath;
  const bool hasRequest = args.getString("request", requestPath) && !requestPath.empty();
  if (!hasRequest && !fromState) {
    std::cerr << "--request <file> is required (see --help)\n";
    return 2;
  }

  nlohmann::json request;
  econ::PlanInputs inputs;
  if (hasRequest) {
    std::string err;
    if (!io::loadJsonFile(requestPath, request, &err) || !io::parsePlanRequest(request, inputs, &err)) {
      std::cerr << err << "\n";
      return 2;
    }
  }

  pipeline::PipelineState previous;
  if (fromState) {
    nlohmann::json saved;
    std::string err;
    if (!io::loadJsonFile(statePath, saved, &err) || !io::parsePipelineState(saved, previous, &err)) {
      std::cerr << "Failed to load --state: " << err << "\n";
      return 2;
    }
  }

  std::string outPath;
  (void)args.getString("out", outPath);
  const bool pretty = args.has("pretty");

  std::unique_ptr<std::ofstream> outFile;
  std::ostream* out = &std::cout;
  if (!outPath.empty() && outPath != "-") {
    outFile = std::make_unique<std::ofstream>(outPath, std::ios::out | std::ios::trunc);
    if (!*outFile) {
      std::cerr << "Failed to open --out file: " << outPath << "\n";
      return 2;
    }
    out = outFile.get();
  }

  core::JsonWriter j(*out, pretty);
  int rc = 0;

  if (mode == "plan") {
    const econ::PlanResult r = econ::generatePlan(inputs, cfg);
    if (r.ok) {
      io::writeAllocation(j, r.allocation);
    } else {
      io::writeError(j, r.error);
      rc = 1;
    }
  } else if (mode == "stage") {
    int stage = 0;
    int through = pipeline::kLastStage;
    const bool single = args.getInt("stage", stage);
    (void)args.getInt("through", through);

    if (fromState && !single) {
      std::cerr << "--state needs --stage <n>\n";
      return 2;
    }

    const pipeline::StageResult r = single ? pipeline::runStage(stage, fromState ? &previous : nullptr, inputs, cfg)
                                           : pipeline::runThrough(through, inputs, cfg);
    if (r.ok) {
      io::writePipelineState(j, r.state, args.has("sig"));
    } else {
      io::writeError(j, r.error);
      rc = 1;
    }
  } else if (mode == "quote") {
    io::QuoteRequest q;
    std::string err;
    if (!io::parseQuoteRequest(request, inputs, q, &err)) {
      std::cerr << err << "\n";
      return 2;
    }
    const econ::ShipmentQuote quote = econ::quoteShipment(q.supplier, q.lines, inputs, cfg);
    if (quote.ok) {
      io::writeShipmentQuote(j, quote);
    } else {
      io::writeError(j, quote.error);
      rc = 1;
    }
  } else {
    std::cerr << "Unknown --mode: " << mode << " (expected plan, stage or quote)\n";
    return 2;
  }

  *out << "\n";
  out->flush();
  return rc;
}
