#include "rigid/core/common/logger.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace rigid::core {

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

static bool equalsIgnoreCase(const char* a, const char* b) {
  for (; *a && *b; ++a, ++b) {
    if (std::tolower(static_cast<unsigned char>(*a)) !=
        std::tolower(static_cast<unsigned char>(*b))) {
      return false;
    }
  }
  return *a == *b;
}

bool parseLogLevel(const char* text, LogLevel* out) {
  if (!text || !out) return false;
  if (equalsIgnoreCase(text, "error")) {
    *out = LogLevel::Error;
  } else if (equalsIgnoreCase(text, "warn") || equalsIgnoreCase(text, "warning")) {
    *out = LogLevel::Warn;
  } else if (equalsIgnoreCase(text, "info")) {
    *out = LogLevel::Info;
  } else if (equalsIgnoreCase(text, "debug")) {
    *out = LogLevel::Debug;
  } else {
    return false;
  }
  return true;
}

// RIGID_LOG_LEVEL seeds the level at startup; setLogLevel() overrides it.
static LogLevel initialLevel() {
  const char* env = std::getenv("RIGID_LOG_LEVEL");
  LogLevel level = LogLevel::Warn;
  if (env != nullptr && !parseLogLevel(env, &level)) {
    level = LogLevel::Warn;
  }
  return level;
}

static std::atomic<LogLevel> g_level{initialLevel()};
static std::atomic<LogSink> g_sink{nullptr};

static bool useColor() {
#ifdef _WIN32
  return false;
#else
  static const bool enabled =
      std::getenv("NO_COLOR") == nullptr && isatty(fileno(stderr)) != 0;
  return enabled;
#endif
}

static const char* logLevelToColor(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "\x1b[31m";  // red
    case LogLevel::Warn: return "\x1b[33m";   // yellow
    case LogLevel::Info: return "\x1b[36m";   // cyan
    case LogLevel::Debug: return "\x1b[90m";  // bright black
  }
  return "\x1b[0m";
}

static void defaultSink(LogLevel level, const std::string& msg) {
  if (useColor()) {
    const char* color = logLevelToColor(level);
    std::cerr << color << "[rigid][" << logLevelToString(level) << "] "
              << msg << "\x1b[0m\n";
    return;
  }
  std::cerr << "[rigid][" << logLevelToString(level) << "] "
            << msg << "\n";
}

static LogSink sinkOrDefault() {
  LogSink sink = g_sink.load();
  return sink ? sink : &defaultSink;
}

void setLogLevel(LogLevel level) {
  g_level.store(level);
}

LogLevel getLogLevel() {
  return g_level.load();
}

void setLogSink(LogSink sink) {
  g_sink.store(sink);
}

LogSink getLogSink() {
  return g_sink.load();
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(getLogLevel());
}

void log(LogLevel level, const std::string& msg) {
  if (!shouldLog(level)) return;
  sinkOrDefault()(level, msg);
}

void log(LogLevel level, const char* msg) {
  if (!shouldLog(level)) return;
  sinkOrDefault()(level, msg ? std::string(msg) : std::string());
}

}  // namespace rigid::core
