// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef LSYSGEN_UTIL_LOG_HPP
#define LSYSGEN_UTIL_LOG_HPP

#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#define LSYSGEN_LOG_LEVEL_OFF   0
#define LSYSGEN_LOG_LEVEL_FATAL 1
#define LSYSGEN_LOG_LEVEL_ERROR 2
#define LSYSGEN_LOG_LEVEL_WARN  3
#define LSYSGEN_LOG_LEVEL_INFO  4
#define LSYSGEN_LOG_LEVEL_DEBUG 5
#define LSYSGEN_LOG_LEVEL_TRACE 6

// Highest level compiled in. Anything above it expands to nothing.
#ifndef LSYSGEN_LOG_LEVEL
#define LSYSGEN_LOG_LEVEL LSYSGEN_LOG_LEVEL_DEBUG
#endif

// Level in effect at startup; tools may change it with set_log_level().
#ifndef LSYSGEN_LOG_LEVEL_DEFAULT
#define LSYSGEN_LOG_LEVEL_DEFAULT LSYSGEN_LOG_LEVEL_WARN
#endif

namespace lsysgen {
namespace util {

enum class LogLevel : int {
  Off = LSYSGEN_LOG_LEVEL_OFF,
  Fatal = LSYSGEN_LOG_LEVEL_FATAL,
  Error = LSYSGEN_LOG_LEVEL_ERROR,
  Warn = LSYSGEN_LOG_LEVEL_WARN,
  Info = LSYSGEN_LOG_LEVEL_INFO,
  Debug = LSYSGEN_LOG_LEVEL_DEBUG,
  Trace = LSYSGEN_LOG_LEVEL_TRACE
};

inline LogLevel& log_threshold() {
  static LogLevel threshold = static_cast<LogLevel>(LSYSGEN_LOG_LEVEL_DEFAULT);
  return threshold;
}

inline void set_log_level(LogLevel level) { log_threshold() = level; }

inline bool log_enabled(LogLevel level) {
  return level != LogLevel::Off && static_cast<int>(level) <= static_cast<int>(log_threshold());
}

// Maps a level name (off, fatal, error, warn, info, debug, trace) to its
// value. Returns false if the name is unknown.
inline bool parse_log_level(std::string_view name, LogLevel& level) {
  static constexpr std::pair<std::string_view, LogLevel> names[] = {
    {"off", LogLevel::Off}, {"fatal", LogLevel::Fatal}, {"error", LogLevel::Error}, {"warn", LogLevel::Warn},
    {"info", LogLevel::Info}, {"debug", LogLevel::Debug}, {"trace", LogLevel::Trace},
  };
  for (const auto& [n, l] : names) {
    if (n == name) {
      level = l;
      return true;
    }
  }
  return false;
}

template<typename... Args>
void log(LogLevel level, std::string_view fmt, Args&&... args) {
  if (!log_enabled(level)) {
    return;
  }
  std::string message;
  if constexpr (sizeof...(Args) == 0) {
    message = std::string(fmt);
  } else {
    message = std::vformat(fmt, std::make_format_args(args...));
  }
  std::clog << message << std::endl;
}

}  // namespace util
}  // namespace lsysgen

#if LSYSGEN_LOG_LEVEL >= LSYSGEN_LOG_LEVEL_FATAL
#define LSYSGEN_LOG_FATAL(FMT, ...) ::lsysgen::util::log(::lsysgen::util::LogLevel::Fatal, "\033[95m[F]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define LSYSGEN_LOG_FATAL(FMT, ...) do { } while (false)
#endif

#if LSYSGEN_LOG_LEVEL >= LSYSGEN_LOG_LEVEL_ERROR
#define LSYSGEN_LOG_ERROR(FMT, ...) ::lsysgen::util::log(::lsysgen::util::LogLevel::Error, "\033[91m[E]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define LSYSGEN_LOG_ERROR(FMT, ...) do { } while (false)
#endif

#if LSYSGEN_LOG_LEVEL >= LSYSGEN_LOG_LEVEL_WARN
#define LSYSGEN_LOG_WARN(FMT, ...) ::lsysgen::util::log(::lsysgen::util::LogLevel::Warn, "\033[93m[W]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define LSYSGEN_LOG_WARN(FMT, ...) do { } while (false)
#endif

#if LSYSGEN_LOG_LEVEL >= LSYSGEN_LOG_LEVEL_INFO
#define LSYSGEN_LOG_INFO(FMT, ...) ::lsysgen::util::log(::lsysgen::util::LogLevel::Info, "\033[92m[I]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define LSYSGEN_LOG_INFO(FMT, ...) do { } while (false)
#endif

#if LSYSGEN_LOG_LEVEL >= LSYSGEN_LOG_LEVEL_DEBUG
#define LSYSGEN_LOG_DEBUG(FMT, ...) ::lsysgen::util::log(::lsysgen::util::LogLevel::Debug, "\033[94m[D]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define LSYSGEN_LOG_DEBUG(FMT, ...) do { } while (false)
#endif

#if LSYSGEN_LOG_LEVEL >= LSYSGEN_LOG_LEVEL_TRACE
#define LSYSGEN_LOG_TRACE(FMT, ...) ::lsysgen::util::log(::lsysgen::util::LogLevel::Trace, "\033[96m[T]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define LSYSGEN_LOG_TRACE(FMT, ...) do { } while (false)
#endif

#endif  // LSYSGEN_UTIL_LOG_HPP
