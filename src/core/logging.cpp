#include "core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>
#include <utility>

namespace {

using core::logging::LogLevel;
using core::logging::LogSink;

std::atomic<LogLevel> g_log_level{LogLevel::kInfo};
std::mutex g_log_mutex;
LogSink g_sink;

std::string CurrentTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
      1000;
  std::tm tm_snapshot;
  localtime_r(&now_time, &tm_snapshot);
  std::ostringstream oss;
  oss << std::put_time(&tm_snapshot, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis;
  return oss.str();
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kDebug:
      return "DEBUG";
  }
  return "INFO";
}

void WriteToConsole(LogLevel level, const std::string& line) {
  std::ostream& stream =
      (level == LogLevel::kError || level == LogLevel::kWarn) ? std::cerr : std::cout;
  stream << line << std::endl;
}

}  // namespace

namespace core::logging {

void InitializeFromEnvironment() {
  if (const char* env = std::getenv("TOOLBRIDGE_LOG_LEVEL")) {
    SetLogLevel(ParseLogLevel(env));
  }
}

void SetLogLevel(LogLevel level) { g_log_level.store(level); }

LogLevel GetLogLevel() { return g_log_level.load(); }

bool IsDebugEnabled() { return GetLogLevel() == LogLevel::kDebug; }

LogLevel ParseLogLevel(std::string value) {
  for (auto& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "debug" || value == "trace") {
    return LogLevel::kDebug;
  }
  return LogLevel::kInfo;
}

void SetLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_sink = std::move(sink);
}

void ResetLogSink() { SetLogSink(nullptr); }

void Log(LogLevel level, const std::string& message) {
  if (static_cast<int>(level) > static_cast<int>(g_log_level.load())) {
    return;
  }

  std::string line = CurrentTimestamp();
  line += " [";
  line += ToString(level);
  line += "] ";
  line += message;

  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_sink) {
    g_sink(level, line);
    return;
  }
  WriteToConsole(level, line);
}

void LogInfo(const std::string& message) { Log(LogLevel::kInfo, message); }

void LogWarn(const std::string& message) { Log(LogLevel::kWarn, message); }

void LogError(const std::string& message) { Log(LogLevel::kError, message); }

void LogDebug(const std::string& message) { Log(LogLevel::kDebug, message); }

}  // namespace core::logging
