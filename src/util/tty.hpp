#pragma once

#include "util/color.hpp"

namespace yamlview {

// Falls back to 80x50 when the size can not be determined.
void
tty_get_term_size(int* rows, int* cols);

// Best guess of the color support of whatever stdout is connected to.
ColorProfile
tty_detect_color_profile();

}  // namespace yamlview
