#pragma once

#include "util/CppUtil.hpp"
#include "util/Exception.hpp"

#include <fmt/format.h>

#include <source_location>
#include <string>
#include <utility>

/*
 * DEBUG_ASSERT(cond, ...)    throws util::DebugAssertionError; checked only when DEBUG_BUILD=1
 * RELEASE_ASSERT(cond, ...)  throws util::ReleaseAssertionError; always checked
 * CLEAN_ASSERT(cond, ...)    throws util::CleanAssertionError; always checked, for user errors
 *
 * The optional trailing arguments are an fmt format string and its arguments:
 *
 * RELEASE_ASSERT(index < size, "index={} size={}", index, size);
 *
 * A disabled DEBUG_ASSERT() still compiles its arguments, so they cannot rot in release builds and
 * locals used only by asserts do not trigger unused-variable warnings. A disabled assert evaluates
 * nothing.
 */

#define UTIL_ASSERT_IMPL(ERROR_T, COND, ...)                                        \
  util::detail::assert_impl<ERROR_T>(#COND, std::source_location::current(), COND, \
                                     ##__VA_ARGS__)

#define DEBUG_ASSERT(COND, ...)                                           \
  do {                                                                    \
    if (IS_MACRO_ENABLED(DEBUG_BUILD)) {                                  \
      UTIL_ASSERT_IMPL(util::DebugAssertionError, COND, ##__VA_ARGS__);   \
    }                                                                     \
  } while (0)

#define RELEASE_ASSERT(COND, ...)                                         \
  do {                                                                    \
    UTIL_ASSERT_IMPL(util::ReleaseAssertionError, COND, ##__VA_ARGS__);   \
  } while (0)

#define CLEAN_ASSERT(COND, ...)                                           \
  do {                                                                    \
    UTIL_ASSERT_IMPL(util::CleanAssertionError, COND, ##__VA_ARGS__);     \
  } while (0)

namespace util {
namespace detail {

template <typename ErrorT>
[[noreturn]] void assert_fail(const std::string& msg, const std::source_location& loc) {
  throw ErrorT("{} failed: {} [{}:{}]", ErrorT::descr(), msg, loc.file_name(), loc.line());
}

template <typename ErrorT, typename... Ts>
inline void assert_impl(const char*, const std::source_location& loc, bool cond,
                        fmt::format_string<Ts...> fmt, Ts&&... ts) {
  if (!cond) assert_fail<ErrorT>(fmt::format(fmt, std::forward<Ts>(ts)...), loc);
}

template <typename ErrorT>
inline void assert_impl(const char* cond_str, const std::source_location& loc, bool cond) {
  if (!cond) assert_fail<ErrorT>(cond_str, loc);
}

}  // namespace detail
}  // namespace util
