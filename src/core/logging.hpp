#pragma once

#include <functional>
#include <string>

namespace core::logging {

enum class LogLevel { kError = 0, kWarn, kInfo, kDebug };

// Receives fully formatted lines. The default sink writes errors and warnings
// to stderr and everything else to stdout.
using LogSink = std::function<void(LogLevel, const std::string&)>;

void InitializeFromEnvironment();
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool IsDebugEnabled();
LogLevel ParseLogLevel(std::string value);

void SetLogSink(LogSink sink);
void ResetLogSink();

void Log(LogLevel level, const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

}  // namespace core::logging
