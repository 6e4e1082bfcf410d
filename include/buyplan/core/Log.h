#pragma once

#include <optional>
#include <string_view>

namespace buyplan::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

std::string_view toString(LogLevel level);

// Accepts "trace", "debug", "info", "warn", "error", "off" (any case).
std::optional<LogLevel> parseLogLevel(std::string_view text);

// Callback sink for log messages.
//
// Sinks run after the line has been written to stderr and obey the level filter.
// The timestamp and message views are only valid for the duration of the call.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// When false, lines only go to the registered sinks (tests and embedding callers
// use this to keep stderr quiet).
void setLogToStderr(bool enabled);

void log(LogLevel level, std::string_view message);

} // namespace buyplan::core

#define BUYPLAN_LOG_TRACE(msg) ::buyplan::core::log(::buyplan::core::LogLevel::Trace, (msg))
#define BUYPLAN_LOG_DEBUG(msg) ::buyplan::core::log(::buyplan::core::LogLevel::Debug, (msg))
#define BUYPLAN_LOG_INFO(msg)  ::buyplan::core::log(::buyplan::core::LogLevel::Info,  (msg))
#define BUYPLAN_LOG_WARN(msg)  ::buyplan::core::log(::buyplan::core::LogLevel::Warn,  (msg))
#define BUYPLAN_LOG_ERROR(msg) ::buyplan::core::log(::buyplan::core::LogLevel::Error, (msg))
