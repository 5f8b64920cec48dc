#pragma once

#include "util/Rendering.hpp"

/*
 * ANSI codes.
 *
 * Each of these functions accepts an optional argument that is returned instead when
 * util::Rendering::mode() is util::Rendering::kText (i.e., when the output is not a terminal).
 */
namespace ansi {

namespace detail {

inline const char* pick(const char* code, const char* s) {
  return util::Rendering::mode() == util::Rendering::kTerminal ? code : s;
}

}  // namespace detail

inline const char* kCircle(const char* s = nullptr) { return detail::pick("●", s); }
inline const char* kHollowCircle(const char* s = nullptr) { return detail::pick("○", s); }
inline const char* kBlink(const char* s = nullptr) { return detail::pick("\033[5m", s); }
inline const char* kReset(const char* s = nullptr) { return detail::pick("\033[00m", s); }

inline const char* kBlack(const char* s = nullptr) { return detail::pick("\033[30m", s); }
inline const char* kRed(const char* s = nullptr) { return detail::pick("\033[31m", s); }
inline const char* kGreen(const char* s = nullptr) { return detail::pick("\033[32m", s); }
inline const char* kYellow(const char* s = nullptr) { return detail::pick("\033[33m", s); }
inline const char* kBlue(const char* s = nullptr) { return detail::pick("\033[34m", s); }
inline const char* kCyan(const char* s = nullptr) { return detail::pick("\033[36m", s); }
inline const char* kWhite(const char* s = nullptr) { return detail::pick("\033[37m", s); }
inline const char* kGray(const char* s = nullptr) { return detail::pick("\033[90m", s); }

}  // namespace ansi
