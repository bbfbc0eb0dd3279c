#pragma once
#include "manoid/core/export.hpp"

#include <cstdint>
#include <string>

namespace manoid::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

// Receives every message that passes the level filter. Must be callable from
// any thread.
using LogSink = void(*)(LogLevel, const std::string&);

// The initial level is Warn, or the value of MANOID_LOG_LEVEL
// ("error", "warn", "info", "debug") when set.
MANOID_CORE_API void setLogLevel(LogLevel level);
MANOID_CORE_API LogLevel getLogLevel();

// nullptr restores the default stderr sink.
MANOID_CORE_API void setLogSink(LogSink sink);
MANOID_CORE_API LogSink getLogSink();

MANOID_CORE_API bool shouldLog(LogLevel level);
MANOID_CORE_API void log(LogLevel level, const std::string& msg);

MANOID_CORE_API const char* logLevelToString(LogLevel level);

// Case-insensitive; false (and *out untouched) for unknown names.
MANOID_CORE_API bool parseLogLevel(const std::string& name, LogLevel* out);

// Installs a sink for the lifetime of the object, then restores the previous one.
class ScopedLogSink {
public:
  explicit ScopedLogSink(LogSink sink) : previous_(getLogSink()) { setLogSink(sink); }
  ~ScopedLogSink() { setLogSink(previous_); }

  ScopedLogSink(const ScopedLogSink&) = delete;
  ScopedLogSink& operator=(const ScopedLogSink&) = delete;

private:
  LogSink previous_;
};

}  // namespace manoid::core
