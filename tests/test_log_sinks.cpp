#include "buyplan/core/Log.h"
#include "tests/test_harness.h"

#include <string>
#include <vector>

using namespace buyplan;

namespace {

struct Captured {
  std::vector<core::LogLevel> levels;
  std::vector<std::string> messages;
};

void captureSink(core::LogLevel level, std::string_view /*ts*/, std::string_view msg, void* user) {
  auto* c = static_cast<Captured*>(user);
  if (!c) return;
  c->levels.push_back(level);
  c->messages.emplace_back(msg);
}

} // namespace

int test_log_sinks() {
  int failures = 0;

  const core::LogLevel prev = core::getLogLevel();
  core::setLogLevel(core::LogLevel::Trace);
  core::setLogToStderr(false);

  Captured cap;
  const core::LogSink sink{&captureSink, &cap};

  core::addLogSink(sink);
  BUYPLAN_LOG_INFO("[pipeline][stage 1] hello");
  CHECK(cap.messages.size() == 1);
  CHECK(!cap.messages.empty() && cap.messages.back() == "[pipeline][stage 1] hello");
  CHECK(!cap.levels.empty() && cap.levels.back() == core::LogLevel::Info);

  // Removing should stop callbacks.
  core::removeLogSink(sink);
  core::log(core::LogLevel::Info, "world");
  CHECK(cap.messages.size() == 1);

  // Respect log-level filtering.
  core::addLogSink(sink);
  core::setLogLevel(core::LogLevel::Warn);
  BUYPLAN_LOG_INFO("filtered");
  BUYPLAN_LOG_WARN("kept");
  CHECK(cap.messages.size() == 2);
  CHECK(cap.messages.back() == "kept");

  core::setLogLevel(core::LogLevel::Off);
  core::log(core::LogLevel::Error, "should_not_fire");
  CHECK(cap.messages.size() == 2);

  // Level names.
  CHECK(core::parseLogLevel("DEBUG") == core::LogLevel::Debug);
  CHECK(core::parseLogLevel("warning") == core::LogLevel::Warn);
  CHECK(core::parseLogLevel("none") == core::LogLevel::Off);
  CHECK(!core::parseLogLevel("loud").has_value());

  // Restore.
  core::removeLogSink(sink);
  core::setLogToStderr(true);
  core::setLogLevel(prev);
  return failures;
}
