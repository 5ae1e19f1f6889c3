#pragma once

#include <fmt/format.h>

#include <exception>
#include <string>
#include <utility>

namespace util {

/*
 * std::exception with an fmt-formatted message:
 *
 * throw util::Exception("Unexpected index {} (size={})", index, size);
 */
class Exception : public std::exception {
 public:
  template <typename... Ts>
  explicit Exception(fmt::format_string<Ts...> fmt, Ts&&... ts)
      : what_(fmt::format(fmt, std::forward<Ts>(ts)...)) {}

  const char* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * Thrown when the user, not the program, is at fault: bad command-line arguments, an unknown log
 * level, an out-of-range board size. main() catches it and prints what() to stderr, so that no
 * stack trace or core dump is produced for a mistake that is not a bug.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

// The error types thrown by the macros of util/Asserts.hpp. descr() names the macro.

class DebugAssertionError : public Exception {
 public:
  using Exception::Exception;
  static constexpr const char* descr() { return "DEBUG_ASSERT"; }
};

class ReleaseAssertionError : public Exception {
 public:
  using Exception::Exception;
  static constexpr const char* descr() { return "RELEASE_ASSERT"; }
};

class CleanAssertionError : public CleanException {
 public:
  using CleanException::CleanException;
  static constexpr const char* descr() { return "CLEAN_ASSERT"; }
};

}  // namespace util
