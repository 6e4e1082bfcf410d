#include "buyplan/core/Log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace buyplan::core {

static std::atomic<LogLevel> g_level{LogLevel::Info};
static std::atomic<bool> g_stderr{true};
static std::mutex g_logMutex;
static std::vector<LogSink> g_sinks;

void setLogLevel(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }
LogLevel getLogLevel() { return g_level.load(std::memory_order_relaxed); }

void setLogToStderr(bool enabled) { g_stderr.store(enabled, std::memory_order_relaxed); }

std::string_view toString(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO ";
    case LogLevel::Warn:  return "WARN ";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF  ";
  }
  return "?????";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
  std::string k;
  k.reserve(text.size());
  for (char c : text) k.push_back((char)std::tolower((unsigned char)c));

  if (k == "trace") return LogLevel::Trace;
  if (k == "debug") return LogLevel::Debug;
  if (k == "info")  return LogLevel::Info;
  if (k == "warn" || k == "warning") return LogLevel::Warn;
  if (k == "error") return LogLevel::Error;
  if (k == "off" || k == "none") return LogLevel::Off;
  return std::nullopt;
}

static std::string timestampNow() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto t = clock::to_time_t(now);

  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
  return oss.str();
}

void addLogSink(LogSink sink) {
  if (!sink.fn) return;
  std::lock_guard<std::mutex> lock(g_logMutex);
  g_sinks.push_back(sink);
}

void removeLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_logMutex);
  g_sinks.erase(std::remove_if(g_sinks.begin(), g_sinks.end(), [&](const LogSink& s) {
    return s.fn == sink.fn && s.user == sink.user;
  }), g_sinks.end());
}

void log(LogLevel level, std::string_view message) {
  const LogLevel cur = getLogLevel();
  if (cur == LogLevel::Off || level == LogLevel::Off) return;
  if (static_cast<int>(level) < static_cast<int>(cur)) return;

  const std::string ts = timestampNow();

  // Sinks are invoked outside the lock so a sink may log itself.
  std::vector<LogSink> sinksCopy;
  {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_stderr.load(std::memory_order_relaxed)) {
      std::cerr << "[" << ts << "][" << toString(level) << "] " << message << "\n";
    }
    sinksCopy = g_sinks;
  }

  for (const LogSink& s : sinksCopy) {
    if (s.fn) s.fn(level, ts, message, s.user);
  }
}

} // namespace buyplan::core
