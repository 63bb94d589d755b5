#pragma once
#include <cstdint>
#include <string>

namespace rigid::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

using LogSink = void(*)(LogLevel, const std::string&);

// The initial level is Warn, or the value of RIGID_LOG_LEVEL if set.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// nullptr restores the default stderr sink.
void setLogSink(LogSink sink);
LogSink getLogSink();

bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& msg);
void log(LogLevel level, const char* msg);

const char* logLevelToString(LogLevel level);

// Accepts "error", "warn", "warning", "info", "debug" in any case.
bool parseLogLevel(const char* text, LogLevel* out);

}  // namespace rigid::core
