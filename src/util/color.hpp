#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace yamlview {

// How much color the output terminal understands.
enum class ColorProfile : uint8_t {
    None = 0,   // No SGR output at all
    Ansi16,     // 16 color palette
    Ansi256,    // 256 color palette (216 color cube + 16 ansi + 24 gray)
    TrueColor,  // 24 bit
};

struct Color {
    enum class Kind : uint8_t {
        NoColor = 0,  // Absent; the terminal default shows through
        Color4bit,    // One of the 16 palette slots
        Color24bit,
        Transparent,  // Fully transparent; treated as absent
    };

    Kind kind = Kind::NoColor;

    // Palette slot for 4 bit colors. The rgb triple holds the xterm default for
    // the slot so that palette colors can still be blended.
    uint8_t index = 0;

    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    Color() = default;

    Color(Kind kind, uint8_t r, uint8_t g, uint8_t b) : kind(kind), r(r), g(g), b(b) {}

    static Color
    rgb(uint8_t r, uint8_t g, uint8_t b) {
        return Color(Kind::Color24bit, r, g, b);
    }

    static Color
    palette(uint8_t index);

    // Non-nil, non-NoColor and not fully transparent.
    bool
    is_visible() const {
        return kind == Kind::Color4bit || kind == Kind::Color24bit;
    }

    bool
    operator==(const Color& other) const {
        if (kind != other.kind) {
            return false;
        }
        switch (kind) {
            case Kind::Color4bit:
                return index == other.index;
            case Kind::Color24bit:
                return r == other.r && g == other.g && b == other.b;
            default:
                return true;
        }
    }

    bool
    operator!=(const Color& other) const {
        return !(*this == other);
    }

    // "#rgb", "#rrggbb"
    static std::optional<Color>
    from_hex(const std::string& value);

    // Palette name ("red", "light_blue"), "none", "transparent" or hex.
    static std::optional<Color>
    parse(const std::string& value);

    // Lowercase "#rrggbb"; empty for invisible colors.
    std::string
    to_hex() const;

    // Palette name for 4 bit colors, "#rrggbb" for 24 bit colors. The result
    // parses back to the same color.
    std::string
    to_string() const;

    // Shift LAB lightness by `amount * 100`, clamped.
    Color
    lighten(double amount) const;

    Color
    darken(double amount) const;

    static const Color kNone;
    static const Color kTransparent;

    // Colors (standard 4 bit palette)
    static const Color kBlack;
    static const Color kRed;
    static const Color kGreen;
    static const Color kYellow;
    static const Color kBlue;
    static const Color kMagenta;
    static const Color kCyan;
    static const Color kLightGray;
    static const Color kDarkGray;
    static const Color kLightRed;
    static const Color kLightGreen;
    static const Color kLightYellow;
    static const Color kLightBlue;
    static const Color kLightMagenta;
    static const Color kLightCyan;
    static const Color kWhite;
};

// Mix two colors in CIE LAB space. `t` is the weight of `b`.
Color
blend_lab(const Color& a, const Color& b, double t = 0.5);

// 50/50 LAB blend. Absent or invisible colors yield the other side; two absent
// colors yield NoColor.
Color
blend_colors(const Color& base, const Color& overlay);

// The overlay color if it is visible, otherwise the base color.
Color
override_color(const Color& base, const Color& overlay);

// Append the SGR parameters that select `color` as foreground or background.
// Invisible colors and ColorProfile::None append nothing.
void
color_sgr_codes(const Color& color, bool foreground, ColorProfile profile, std::vector<int>& codes);

// Nearest xterm 256 palette index.
uint8_t
color_to_ansi256(const Color& color);

// Nearest 16 color palette slot.
uint8_t
color_to_ansi16(const Color& color);

std::string
repr(const Color& color);

}  // namespace yamlview
