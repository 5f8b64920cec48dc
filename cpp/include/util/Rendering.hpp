#pragma once

#include <cstdint>
#include <unistd.h>

namespace util {

/*
 * Process-wide rendering mode. kTerminal allows ANSI colors, unicode checkers and blinking; kText
 * is plain ASCII, which is what unit tests compare renderings against.
 *
 * The initial mode is kTerminal iff stdout is a TTY. A Guard overrides it for a scope:
 *
 *   {
 *     util::Rendering::Guard guard(util::Rendering::kText);
 *     IO::print_state(ss, engine, config);  // plain text, even on a terminal
 *   }
 */
class Rendering {
 public:
  enum Mode : int8_t { kText, kTerminal };

  class Guard {
   public:
    explicit Guard(Mode mode) : saved_(mode_) { mode_ = mode; }
    ~Guard() { mode_ = saved_; }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

   private:
    const Mode saved_;
  };

  static Mode mode() { return mode_; }
  static void set(Mode mode) { mode_ = mode; }

 private:
  static inline Mode mode_ = isatty(STDOUT_FILENO) ? kTerminal : kText;
};

}  // namespace util
