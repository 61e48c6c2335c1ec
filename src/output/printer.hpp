#pragma once

#include "output/gutter.hpp"
#include "processing/position.hpp"
#include "processing/source.hpp"
#include "style/composer.hpp"
#include "style/styles.hpp"
#include "style/theme.hpp"
#include "util/color.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace yamlview {

enum class OverlayMode {
    // Every overlay blends into the cell style.
    Blend,

    // The first overlay covering a cell overrides its colors, later ones blend.
    OverrideFirst,
};

struct PrinterOptions {
    Styles styles = default_styles();

    // No gutter when unset.
    std::optional<Gutter> gutter;

    // Show control characters as their control picture.
    bool control_escape = true;

    // Tab stop distance when tabs are not escaped.
    int64_t tab_width = 8;

    // Row width in cells, gutter included. 0 disables wrapping, a negative
    // value uses the terminal width.
    int64_t width = 0;

    bool annotations = true;

    // Row printed before each hunk except the first. An empty string gives a
    // blank line.
    std::optional<std::string> hunk_separator = std::string();

    OverlayMode overlay_mode = OverlayMode::Blend;
    ColorProfile color_profile = ColorProfile::TrueColor;
};

// Renders sources as ANSI styled text. A printer keeps its blend cache
// between calls; copies share it.
class Printer {
   public:
    explicit Printer(PrinterOptions options = {});

    // All lines. Ends with a newline if the source text did.
    std::string
    print(const Source& source) const;

    // Lines first..last inclusive, clipped to the source.
    std::string
    print_slice(const Source& source, int64_t first, int64_t last) const;

    // The lines touched by `spans`. Touching or overlapping ranges merge;
    // separate ranges are divided by a blank line.
    std::string
    print_spans(const Source& source, const std::vector<Span>& spans) const;

    const PrinterOptions&
    options() const {
        return options_;
    }

    const Composer&
    composer() const {
        return *composer_;
    }

   private:
    void
    render_range(const Source& source, int64_t first, int64_t last, std::vector<std::string>& rows) const;

    void
    render_line(const Source& source, int64_t n, bool first_rendered, std::vector<std::string>& rows) const;

    int64_t
    row_width() const;

    PrinterOptions options_;
    std::shared_ptr<Composer> composer_;
};

}  // namespace yamlview
