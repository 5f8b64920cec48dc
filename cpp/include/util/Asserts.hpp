#pragma once

#include "util/Exception.hpp"

#include <format>
#include <source_location>

/*
 * RELEASE_ASSERT(cond) or RELEASE_ASSERT(cond, fmt, args...)
 *
 * Throws util::ReleaseAssertionError if cond is false, in every build type. The message names the
 * failing condition (or the formatted message, if one is given) and the source location.
 *
 * Use it for violated preconditions, i.e. bugs. Errors caused by user input are reported with
 * util::CleanException instead.
 */
#define RELEASE_ASSERT(COND, ...)                                                              \
  do {                                                                                         \
    util::detail::release_assert(#COND, std::source_location::current(), COND, ##__VA_ARGS__); \
  } while (0)

namespace util {
namespace detail {

template <typename... Ts>
inline void release_assert(const char*, const std::source_location& loc, bool cond,
                           const std::format_string<Ts...>& fmt, Ts&&... ts) {
  if (!cond) {
    throw ReleaseAssertionError("RELEASE_ASSERT failed: {} [{}:{}]",
                                std::format(fmt, std::forward<Ts>(ts)...), loc.file_name(),
                                loc.line());
  }
}

inline void release_assert(const char* cond_str, const std::source_location& loc, bool cond) {
  if (!cond) {
    throw ReleaseAssertionError("RELEASE_ASSERT failed: {} [{}:{}]", cond_str, loc.file_name(),
                                loc.line());
  }
}

}  // namespace detail
}  // namespace util
