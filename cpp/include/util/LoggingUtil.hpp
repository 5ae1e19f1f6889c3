#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/fmt/ostr.h>  // lets types with an ostream operator<< be logged
#include <spdlog/spdlog.h>

#include <string>

/*
 * LOG_TRACE(), LOG_DEBUG(), LOG_INFO(), LOG_WARN() and LOG_ERROR() log through the default spdlog
 * logger with fmt-style formatting:
 *
 * LOG_INFO("Starting a game of size {}", size);
 *
 * Statements below SPDLOG_ACTIVE_LEVEL are removed at compile time, but their arguments are still
 * type-checked. CMakeLists.txt sets SPDLOG_ACTIVE_LEVEL to TRACE for Debug builds and to INFO
 * otherwise, so LOG_DEBUG() costs nothing in release builds.
 */
#define UTIL_LOG_IMPL(SPDLOG_MACRO, ...) \
  do {                                   \
    USE_UNEVALUATED(__VA_ARGS__);        \
    SPDLOG_MACRO(__VA_ARGS__);           \
  } while (0)

#define LOG_TRACE(...) UTIL_LOG_IMPL(SPDLOG_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) UTIL_LOG_IMPL(SPDLOG_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) UTIL_LOG_IMPL(SPDLOG_INFO, __VA_ARGS__)
#define LOG_WARN(...) UTIL_LOG_IMPL(SPDLOG_WARN, __VA_ARGS__)
#define LOG_ERROR(...) UTIL_LOG_IMPL(SPDLOG_ERROR, __VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;  // empty: console only
    std::string log_level = "info";
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  /*
   * Replaces the default spdlog logger with one that writes to stdout and, if params.log_filename
   * is set, to that file. Throws util::CleanException if params.log_level is not a spdlog level
   * name.
   */
  static void init(const Params& params);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
