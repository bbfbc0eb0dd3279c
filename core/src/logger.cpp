#include "manoid/core/common/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace manoid::core {
namespace {

LogLevel initialLevel() {
  LogLevel level = LogLevel::Warn;
  if (const char* env = std::getenv("MANOID_LOG_LEVEL")) {
    if (!parseLogLevel(env, &level)) {
      std::cerr << "[manoid][WARN] ignoring MANOID_LOG_LEVEL='" << env << "'\n";
    }
  }
  return level;
}

std::atomic<LogLevel>& levelSlot() {
  static std::atomic<LogLevel> level{initialLevel()};
  return level;
}

std::atomic<LogSink> g_sink{nullptr};

bool stderrIsColorTerminal() {
#ifdef _WIN32
  return false;
#else
  static const bool enabled =
      std::getenv("NO_COLOR") == nullptr && isatty(fileno(stderr)) != 0;
  return enabled;
#endif
}

const char* levelColor(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "\x1b[31m";
    case LogLevel::Warn: return "\x1b[33m";
    case LogLevel::Info: return "\x1b[36m";
    case LogLevel::Debug: return "\x1b[90m";
  }
  return "";
}

// One write per message so lines from different threads do not interleave.
void stderrSink(LogLevel level, const std::string& msg) {
  const bool color = stderrIsColorTerminal();
  std::ostringstream line;
  if (color) line << levelColor(level);
  line << "[manoid][" << logLevelToString(level) << "] " << msg;
  if (color) line << "\x1b[0m";
  line << '\n';
  std::cerr << line.str();
}

}  // namespace

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

bool parseLogLevel(const std::string& name, LogLevel* out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  LogLevel level;
  if (lower == "error") {
    level = LogLevel::Error;
  } else if (lower == "warn" || lower == "warning") {
    level = LogLevel::Warn;
  } else if (lower == "info") {
    level = LogLevel::Info;
  } else if (lower == "debug") {
    level = LogLevel::Debug;
  } else {
    return false;
  }
  if (out) *out = level;
  return true;
}

void setLogLevel(LogLevel level) {
  levelSlot().store(level);
}

LogLevel getLogLevel() {
  return levelSlot().load();
}

void setLogSink(LogSink sink) {
  g_sink.store(sink);
}

LogSink getLogSink() {
  return g_sink.load();
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(levelSlot().load());
}

void log(LogLevel level, const std::string& msg) {
  if (!shouldLog(level)) return;
  const LogSink sink = g_sink.load();
  (sink ? sink : &stderrSink)(level, msg);
}

}  // namespace manoid::core
