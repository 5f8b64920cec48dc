#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

// The main logging macros are LOG_INFO(), LOG_DEBUG(), LOG_WARN(), and LOG_ERROR().
//
// For example:
//
// LOG_INFO("Hello {}!", "world");
// LOG_DEBUG("row={} col={}", row, col);
//
// By default, LOG_DEBUG() and LOG_TRACE() statements are compiled out. In order to enable them,
// configure with -DC4_ENABLE_DEBUG_LOGGING=ON.

#define LOG_TRACE(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_TRACE(__VA_ARGS__);    \
  } while (0)

#define LOG_DEBUG(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_DEBUG(__VA_ARGS__);    \
  } while (0)

#define LOG_INFO(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_INFO(__VA_ARGS__);     \
  } while (0)

#define LOG_WARN(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_WARN(__VA_ARGS__);     \
  } while (0)

#define LOG_ERROR(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_ERROR(__VA_ARGS__);    \
  } while (0)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    bool append_mode = false;
    bool omit_timestamps = false;
    bool quiet = false;

    auto make_options_description();
  };

  // Installs the default spdlog logger: a colored stdout sink unless params.quiet, plus a file sink
  // if params.log_filename is set. Call once, before the first LOG_*() statement.
  static void init(const Params& params);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
