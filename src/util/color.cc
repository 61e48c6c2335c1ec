#include "color.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <tuple>
#include <unordered_map>

using namespace yamlview;

namespace {

// clang-format off
// xterm defaults for the 16 palette slots.
const std::array<std::array<uint8_t, 3>, 16> kPaletteRgb {{
    {   0,   0,   0 },  // black
    { 205,   0,   0 },  // red
    {   0, 205,   0 },  // green
    { 205, 205,   0 },  // yellow
    {   0,   0, 238 },  // blue
    { 205,   0, 205 },  // magenta
    {   0, 205, 205 },  // cyan
    { 229, 229, 229 },  // light_gray
    { 127, 127, 127 },  // dark_gray
    { 255,   0,   0 },  // light_red
    {   0, 255,   0 },  // light_green
    { 255, 255,   0 },  // light_yellow
    {  92,  92, 255 },  // light_blue
    { 255,   0, 255 },  // light_magenta
    {   0, 255, 255 },  // light_cyan
    { 255, 255, 255 },  // white
}};

const std::unordered_map<std::string, uint8_t> k16ColorNames = {
    { "black",          0 },
    { "red",            1 },
    { "green",          2 },
    { "yellow",         3 },
    { "blue",           4 },
    { "magenta",        5 },
    { "cyan",           6 },
    { "light_gray",     7 },
    { "dark_gray",      8 },
    { "light_red",      9 },
    { "light_green",   10 },
    { "light_yellow",  11 },
    { "light_blue",    12 },
    { "light_magenta", 13 },
    { "light_cyan",    14 },
    { "white",         15 },
};
// clang-format on

struct Lab {
    double l;
    double a;
    double b;
};

double
srgb_to_linear(uint8_t c) {
    double v = c / 255.0;
    return v <= 0.04045 ? v / 12.92 : std::pow((v + 0.055) / 1.055, 2.4);
}

uint8_t
linear_to_srgb(double v) {
    v = std::clamp(v, 0.0, 1.0);
    double s = v <= 0.0031308 ? v * 12.92 : 1.055 * std::pow(v, 1.0 / 2.4) - 0.055;
    return static_cast<uint8_t>(std::lround(std::clamp(s, 0.0, 1.0) * 255.0));
}

// D65 reference white
const double kXn = 0.95047;
const double kYn = 1.00000;
const double kZn = 1.08883;

double
lab_f(double t) {
    const double delta = 6.0 / 29.0;
    return t > delta * delta * delta ? std::cbrt(t) : t / (3 * delta * delta) + 4.0 / 29.0;
}

double
lab_finv(double t) {
    const double delta = 6.0 / 29.0;
    return t > delta ? t * t * t : 3 * delta * delta * (t - 4.0 / 29.0);
}

Lab
to_lab(const Color& c) {
    double r = srgb_to_linear(c.r);
    double g = srgb_to_linear(c.g);
    double b = srgb_to_linear(c.b);

    double x = 0.4124564 * r + 0.3575761 * g + 0.1804375 * b;
    double y = 0.2126729 * r + 0.7151522 * g + 0.0721750 * b;
    double z = 0.0193339 * r + 0.1191920 * g + 0.9503041 * b;

    double fx = lab_f(x / kXn);
    double fy = lab_f(y / kYn);
    double fz = lab_f(z / kZn);
    return {116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

Color
from_lab(const Lab& lab) {
    double fy = (lab.l + 16.0) / 116.0;
    double fx = fy + lab.a / 500.0;
    double fz = fy - lab.b / 200.0;

    double x = kXn * lab_finv(fx);
    double y = kYn * lab_finv(fy);
    double z = kZn * lab_finv(fz);

    double r = 3.2404542 * x - 1.5371385 * y - 0.4985314 * z;
    double g = -0.9692660 * x + 1.8760108 * y + 0.0415560 * z;
    double b = 0.0556434 * x - 0.2040259 * y + 1.0572252 * z;
    return Color::rgb(linear_to_srgb(r), linear_to_srgb(g), linear_to_srgb(b));
}

int
distance_sq(int r1, int g1, int b1, int r2, int g2, int b2) {
    return (r1 - r2) * (r1 - r2) + (g1 - g2) * (g1 - g2) + (b1 - b2) * (b1 - b2);
}

}  // namespace

Color
Color::palette(uint8_t index) {
    index = static_cast<uint8_t>(index & 0x0F);
    Color c(Kind::Color4bit, kPaletteRgb[index][0], kPaletteRgb[index][1], kPaletteRgb[index][2]);
    c.index = index;
    return c;
}

const Color Color::kNone = Color{};
const Color Color::kTransparent = Color{Color::Kind::Transparent, 0, 0, 0};

const Color Color::kBlack = Color::palette(0);
const Color Color::kRed = Color::palette(1);
const Color Color::kGreen = Color::palette(2);
const Color Color::kYellow = Color::palette(3);
const Color Color::kBlue = Color::palette(4);
const Color Color::kMagenta = Color::palette(5);
const Color Color::kCyan = Color::palette(6);
const Color Color::kLightGray = Color::palette(7);
const Color Color::kDarkGray = Color::palette(8);
const Color Color::kLightRed = Color::palette(9);
const Color Color::kLightGreen = Color::palette(10);
const Color Color::kLightYellow = Color::palette(11);
const Color Color::kLightBlue = Color::palette(12);
const Color Color::kLightMagenta = Color::palette(13);
const Color Color::kLightCyan = Color::palette(14);
const Color Color::kWhite = Color::palette(15);

std::optional<Color>
Color::from_hex(const std::string& s) {
    // Hex code parser that supports '#FFF' and '#FE83EE'
    if (!((s.size() == 4 || s.size() == 7) && s[0] == '#')) {
        return {};
    }

    for (std::size_t i = 1; i < s.size(); i++) {
        if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return {};
        }
    }

    long color24 = std::strtol(&s[1], nullptr, 16);
    switch (s.size()) {
        // '#ABC'
        case 4: {
            auto r = static_cast<uint8_t>(((color24 >> 8) & 0x0F) * 17);
            auto g = static_cast<uint8_t>(((color24 >> 4) & 0x0F) * 17);
            auto b = static_cast<uint8_t>(((color24 >> 0) & 0x0F) * 17);
            return Color::rgb(r, g, b);
        }
        // '#AABBCC'
        case 7: {
            auto r = static_cast<uint8_t>((color24 >> 16) & 0xFF);
            auto g = static_cast<uint8_t>((color24 >> 8) & 0xFF);
            auto b = static_cast<uint8_t>((color24 >> 0) & 0xFF);
            return Color::rgb(r, g, b);
        }
    }
    return {};
}

std::optional<Color>
Color::parse(const std::string& s) {
    if (s.empty()) {
        return {};
    }

    if (s == "none" || s == "default") {
        return kNone;
    }

    if (s == "transparent") {
        return kTransparent;
    }

    // Is it a palette color?
    if (auto it = k16ColorNames.find(s); it != k16ColorNames.end()) {
        return palette(it->second);
    }

    return from_hex(s);
}

std::string
Color::to_hex() const {
    if (!is_visible()) {
        return "";
    }
    return fmt::format("#{:02x}{:02x}{:02x}", r, g, b);
}

std::string
Color::to_string() const {
    if (kind == Kind::Color4bit) {
        for (const auto& [name, slot] : k16ColorNames) {
            if (slot == index) {
                return name;
            }
        }
    }
    return to_hex();
}

Color
Color::lighten(double amount) const {
    if (!is_visible()) {
        return *this;
    }
    Lab lab = to_lab(*this);
    lab.l = std::clamp(lab.l + amount * 100.0, 0.0, 100.0);
    return from_lab(lab);
}

Color
Color::darken(double amount) const {
    return lighten(-amount);
}

Color
yamlview::blend_lab(const Color& a, const Color& b, double t) {
    Lab la = to_lab(a);
    Lab lb = to_lab(b);
    return from_lab({la.l + t * (lb.l - la.l), la.a + t * (lb.a - la.a), la.b + t * (lb.b - la.b)});
}

Color
yamlview::blend_colors(const Color& base, const Color& overlay) {
    const bool base_absent = base.kind == Color::Kind::NoColor;
    const bool overlay_absent = overlay.kind == Color::Kind::NoColor;

    if (base_absent && overlay_absent) {
        return Color::kNone;
    }
    if (base_absent) {
        return overlay;
    }
    if (overlay_absent) {
        return base;
    }
    if (!base.is_visible()) {
        return overlay;
    }
    if (!overlay.is_visible()) {
        return base;
    }
    return blend_lab(base, overlay, 0.5);
}

Color
yamlview::override_color(const Color& base, const Color& overlay) {
    return overlay.is_visible() ? overlay : base;
}

uint8_t
yamlview::color_to_ansi256(const Color& c) {
    if (c.kind == Color::Kind::Color4bit) {
        return c.index;
    }

    auto cube_index = [](int v) { return v < 48 ? 0 : v < 115 ? 1 : (v - 35) / 40; };
    const int cube_levels[] = {0, 95, 135, 175, 215, 255};

    int ri = cube_index(c.r);
    int gi = cube_index(c.g);
    int bi = cube_index(c.b);
    int cube_color = 16 + 36 * ri + 6 * gi + bi;
    int cube_dist = distance_sq(c.r, c.g, c.b, cube_levels[ri], cube_levels[gi], cube_levels[bi]);

    int average = (c.r + c.g + c.b) / 3;
    int gray_index = average > 238 ? 23 : std::max(0, (average - 3) / 10);
    int gray_level = 8 + 10 * gray_index;
    int gray_dist = distance_sq(c.r, c.g, c.b, gray_level, gray_level, gray_level);

    return static_cast<uint8_t>(gray_dist < cube_dist ? 232 + gray_index : cube_color);
}

uint8_t
yamlview::color_to_ansi16(const Color& c) {
    if (c.kind == Color::Kind::Color4bit) {
        return c.index;
    }

    uint8_t best = 0;
    int best_dist = -1;
    for (std::size_t i = 0; i < kPaletteRgb.size(); i++) {
        const auto& p = kPaletteRgb[i];
        int d = distance_sq(c.r, c.g, c.b, p[0], p[1], p[2]);
        if (best_dist < 0 || d < best_dist) {
            best_dist = d;
            best = static_cast<uint8_t>(i);
        }
    }
    return best;
}

void
yamlview::color_sgr_codes(const Color& color, bool fg, ColorProfile profile, std::vector<int>& codes) {
    if (!color.is_visible() || profile == ColorProfile::None) {
        return;
    }

    // https://gist.github.com/fnky/458719343aabd01cfb17a3a4f7296797
    auto palette16 = [&](uint8_t slot) {
        int base = slot < 8 ? 30 + slot : 90 + (slot - 8);
        codes.push_back(fg ? base : base + 10);
    };

    if (color.kind == Color::Kind::Color4bit) {
        palette16(color.index);
        return;
    }

    switch (profile) {
        // ESC[38;2;{r};{g};{b}m
        case ColorProfile::TrueColor: {
            codes.insert(codes.end(), {fg ? 38 : 48, 2, color.r, color.g, color.b});
        } break;
        // ESC[38;5;{ID}m
        case ColorProfile::Ansi256: {
            codes.insert(codes.end(), {fg ? 38 : 48, 5, color_to_ansi256(color)});
        } break;
        case ColorProfile::Ansi16: {
            palette16(color_to_ansi16(color));
        } break;
        case ColorProfile::None:
            break;
    }
}

std::string
yamlview::repr(const Color& color) {
    switch (color.kind) {
        case Color::Kind::NoColor:
            return "none";
        case Color::Kind::Transparent:
            return "transparent";
        case Color::Kind::Color4bit:
            return fmt::format("4:{}", color.index);
        case Color::Kind::Color24bit:
            return color.to_hex();
    }
    return "?";
}
