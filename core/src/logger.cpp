#include "tessera/core/common/logger.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace tessera::core {

static std::atomic<LogLevel> g_level{LogLevel::Warn};
static std::atomic<LogSink> g_sink{nullptr};

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

static bool detectColor() {
#ifdef _WIN32
  return false;
#else
  if (std::getenv("NO_COLOR") != nullptr) return false;
  return isatty(fileno(stderr)) != 0;
#endif
}

static bool useColor() {
  static const bool enabled = detectColor();
  return enabled;
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

static void stderrSink(LogLevel level, const std::string& line) {
  if (useColor()) {
    std::cerr << logLevelToColor(level) << line << "\x1b[0m\n";
  } else {
    std::cerr << line << '\n';
  }
}

static std::string formatLine(LogLevel level, const char* component,
                              const std::string& msg) {
  std::string line = "[tessera][";
  line += logLevelToString(level);
  line += ']';
  if (component && *component) {
    line += '[';
    line += component;
    line += ']';
  }
  line += ' ';
  line += msg;
  return line;
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
  return static_cast<int>(level) <= static_cast<int>(g_level.load());
}

void log(LogLevel level, const char* component, const std::string& msg) {
  if (!shouldLog(level)) return;
  const LogSink sink = g_sink.load();
  (sink ? sink : &stderrSink)(level, formatLine(level, component, msg));
}

void log(LogLevel level, const std::string& msg) {
  log(level, nullptr, msg);
}

}  // namespace tessera::core
