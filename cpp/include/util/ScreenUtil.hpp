#pragma once

namespace util {

/*
 * Returns the width of the terminal attached to stdout, or 80 if stdout is not a terminal.
 */
int get_screen_width();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
