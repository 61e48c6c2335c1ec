#pragma once

#include "processing/source.hpp"
#include "style/styles.hpp"
#include "util/color.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace yamlview {

struct GutterContext {
    const Styles* styles = nullptr;
    ColorProfile profile = ColorProfile::TrueColor;

    // 1-based position of the line in the source being printed.
    int64_t index = 0;

    // Display number of the line.
    int64_t number = 0;

    int64_t total_lines = 0;
    LineFlag flag = LineFlag::Default;

    // Row holds an annotation rather than line content.
    bool annotation = false;

    // Row continues a soft wrapped line.
    bool soft = false;
};

// Called once per rendered row with the display number of the line.
using Gutter = std::function<std::string(int64_t line_number, const GutterContext& ctx)>;

namespace gutters {

Gutter
none();

// "   7 "
Gutter
line_numbers();

// "+ ", "- " or "  "
Gutter
diff_markers();

// Line number followed by the diff marker.
Gutter
standard();

// "none", "line-numbers", "diff" or "default".
std::optional<Gutter>
from_name(const std::string& name);

}  // namespace gutters

}  // namespace yamlview
