#pragma once

namespace util {

// Width of the terminal attached to stdout, or 80 if there is none.
int get_screen_width();

// Runs clear(1). Returns false if it failed, e.g. because TERM is unset or clear is not installed.
bool clearscreen();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
