#pragma once

#include "util/time.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>

// namespace logging — line-oriented diagnostics on stderr:
//   [HH:MM:SS] [tag] message
// Results meant for the user go to stdout; everything here is for operators.
namespace logging {

enum class Level { debug = 0, info = 1, warn = 2, error = 3 };

inline std::atomic<Level> &Threshold() {
  static std::atomic<Level> level{Level::info};
  return level;
}

inline void SetLevel(Level level) {
  Threshold().store(level, std::memory_order_relaxed);
}

inline bool Enabled(Level level) {
  return level >= Threshold().load(std::memory_order_relaxed);
}

inline const char *LevelName(Level level) {
  switch (level) {
  case Level::debug:
    return "debug";
  case Level::info:
    return "info";
  case Level::warn:
    return "warn";
  case Level::error:
    return "error";
  }
  return "?";
}

// Writes one complete line; lines from different threads never interleave.
inline void Write(Level level, std::string_view tag, std::string_view msg) {
  if (!Enabled(level)) {
    return;
  }
  std::ostringstream line;
  line << '[' << timeutil::ClockTime() << "] [" << tag << "] ";
  if (level != Level::info) {
    line << LevelName(level) << ": ";
  }
  line << msg << '\n';
  static std::mutex mu;
  std::lock_guard lock(mu);
  std::cerr << line.str();
}

inline void Debug(std::string_view tag, std::string_view msg) {
  Write(Level::debug, tag, msg);
}
inline void Info(std::string_view tag, std::string_view msg) {
  Write(Level::info, tag, msg);
}
inline void Warn(std::string_view tag, std::string_view msg) {
  Write(Level::warn, tag, msg);
}
inline void Error(std::string_view tag, std::string_view msg) {
  Write(Level::error, tag, msg);
}

} // namespace logging
