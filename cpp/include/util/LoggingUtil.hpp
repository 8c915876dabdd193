#pragma once

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

// The main logging macros are LOG_INFO(), LOG_DEBUG(), LOG_WARN(), and LOG_ERROR().
//
// These use fmt::format() to format the message. For example:
//
// LOG_INFO("Hello {}!", "world");
// LOG_DEBUG("x={} pi={}", 3, 3.14159);
//
// By default, LOG_DEBUG() and LOG_TRACE() statements are compiled out. In order to enable them,
// configure with -DSPDLOG_ACTIVE_LEVEL=SPDLOG_LEVEL_TRACE.

#define LOG_TRACE(...)         \
  do {                         \
    SPDLOG_TRACE(__VA_ARGS__); \
  } while (0)

#define LOG_DEBUG(...)         \
  do {                         \
    SPDLOG_DEBUG(__VA_ARGS__); \
  } while (0)

#define LOG_INFO(...)         \
  do {                        \
    SPDLOG_INFO(__VA_ARGS__); \
  } while (0)

#define LOG_WARN(...)         \
  do {                        \
    SPDLOG_WARN(__VA_ARGS__); \
  } while (0)

#define LOG_ERROR(...)         \
  do {                         \
    SPDLOG_ERROR(__VA_ARGS__); \
  } while (0)

namespace util {

/*
 * Installs the default logger: stdout, plus a file if --log-filename is given.
 *
 * Every line is tagged with the id of the logging thread, since the TableServer runs a reader and
 * a writer thread per connection and their output interleaves.
 */
struct Logging {
  struct Params {
    std::string log_filename;
    std::string log_level = "trace";
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  static void init(const Params&);

  // "info" -> spdlog::level::info. Throws util::CleanException on an unknown name.
  static spdlog::level::level_enum parse_level(const std::string& name);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"
