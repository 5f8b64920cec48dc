#include "util/ScreenUtil.hpp"

#include <sys/ioctl.h>

#include <cstdlib>
#include <unistd.h>

namespace util {

inline int get_screen_width() {
  constexpr int kDefaultWidth = 80;

  static const int width = [] {
    winsize w;
    bool ok = ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0;
    return ok ? int(w.ws_col) : kDefaultWidth;
  }();
  return width;
}

inline bool clearscreen() { return std::system("clear") == 0; }

}  // namespace util
