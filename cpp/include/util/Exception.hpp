#pragma once

#include <exception>
#include <format>
#include <string>
#include <utility>

namespace util {

// std::runtime_error with a std::format() constructor:
//
//   throw util::Exception("bad column {} on a {}x{} board", col, rows, cols);
class Exception : public std::exception {
 public:
  template <typename... Ts>
  Exception(std::format_string<Ts...> fmt, Ts&&... ts)
      : what_(std::format(fmt, std::forward<Ts>(ts)...)) {}

  const char* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * An error caused by the user (a bad command-line option, an invalid game configuration) rather
 * than by a bug. main() catches these and prints what() to stderr instead of letting the process
 * die with a core dump.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

// Thrown by RELEASE_ASSERT()
class ReleaseAssertionError : public Exception {
 public:
  using Exception::Exception;
};

}  // namespace util
