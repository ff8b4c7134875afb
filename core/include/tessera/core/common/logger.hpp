#pragma once
#include <cstdint>
#include <string>

namespace tessera::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

// A sink receives the fully formatted line, without a trailing newline.
using LogSink = void(*)(LogLevel, const std::string&);

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// nullptr restores the default stderr sink.
void setLogSink(LogSink sink);
LogSink getLogSink();

bool shouldLog(LogLevel level);

// Lines are prefixed "[tessera][LEVEL]" and, when `component` is non-empty,
// "[component]", e.g. "[tessera][WARN][rotor4] ...".
void log(LogLevel level, const char* component, const std::string& msg);
void log(LogLevel level, const std::string& msg);

const char* logLevelToString(LogLevel level);

}  // namespace tessera::core
