#include "style/style.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <cctype>
#include <sstream>
#include <tuple>
#include <vector>

using namespace yamlview;

namespace {

// clang-format off
const std::array<std::tuple<const Style::Attribute, const char*, int>, 8> kAttributes {{
    { Style::Attribute::Bold,          "bold",          1 },
    { Style::Attribute::Dim,           "dim",           2 },
    { Style::Attribute::Italic,        "italic",        3 },
    { Style::Attribute::Underline,     "underline",     4 },
    { Style::Attribute::Blink,         "blink",         5 },
    { Style::Attribute::Inverse,       "inverse",       7 },
    { Style::Attribute::Hidden,        "hidden",        8 },
    { Style::Attribute::Strikethrough, "strikethrough", 9 }
}};
// clang-format on

std::string
to_lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool
starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

Style::Attribute
yamlview::operator|(Style::Attribute a, Style::Attribute b) {
    return static_cast<Style::Attribute>(static_cast<uint16_t>(a) | static_cast<uint16_t>(b));
}

Style
Style::with_fg(Color color) const {
    Style s = *this;
    s.fg = color;
    return s;
}

Style
Style::with_bg(Color color) const {
    Style s = *this;
    s.bg = color;
    return s;
}

Style
Style::with(Attribute flag) const {
    Style s = *this;
    s.attr = s.attr | flag;
    return s;
}

Style
Style::without(Attribute flag) const {
    Style s = *this;
    s.attr = static_cast<Attribute>(static_cast<uint16_t>(s.attr) & ~static_cast<uint16_t>(flag));
    return s;
}

Style
Style::with_transform(Transform tx) const {
    Style s = *this;
    s.transform = std::move(tx);
    return s;
}

std::string
Style::sgr(ColorProfile profile) const {
    if (profile == ColorProfile::None) {
        return "";
    }

    std::vector<int> escseq;

    color_sgr_codes(fg, true, profile, escseq);
    for (const auto& [attr_flag, attr_name, attr_code] : kAttributes) {
        if (has(attr_flag)) {
            escseq.push_back(attr_code);
        }
    }
    color_sgr_codes(bg, false, profile, escseq);

    if (escseq.empty()) {
        return "";
    }
    return fmt::format("\033[{}m", fmt::join(escseq, ";"));
}

std::string
Style::render(const std::string& text, ColorProfile profile) const {
    std::string content = transform ? transform(text) : text;
    if (content.empty()) {
        return "";
    }

    std::string seq = sgr(profile);
    if (seq.empty()) {
        return content;
    }
    return seq + content + "\033[0m";
}

std::optional<Style>
yamlview::parse_style(const std::string& value) {
    Style style;

    std::istringstream stream(value);
    std::string token;
    while (stream >> token) {
        const std::string lower = to_lower(token);

        if (starts_with(lower, "bg:")) {
            auto color = Color::parse(token.substr(3));
            if (!color) {
                return {};
            }
            style.bg = *color;
            continue;
        }

        // Accepted for compatibility with pygments style strings.
        if (starts_with(lower, "border:") || lower == "noinherit") {
            continue;
        }

        bool matched = false;
        for (const auto& [flag, name, _code] : kAttributes) {
            if (lower == name) {
                style = style.with(flag);
                matched = true;
            } else if (lower == fmt::format("no{}", name)) {
                style = style.without(flag);
                matched = true;
            }
        }
        if (matched) {
            continue;
        }

        auto color = Color::parse(token);
        if (!color) {
            return {};
        }
        style.fg = *color;
    }

    return style;
}

std::string
yamlview::encode_style(const Style& style) {
    std::vector<std::string> parts;

    for (const auto& [flag, name, _code] : kAttributes) {
        if (style.has(flag)) {
            parts.emplace_back(name);
        }
    }

    if (style.fg.is_visible()) {
        parts.push_back(style.fg.to_string());
    }

    if (style.bg.is_visible()) {
        parts.push_back(fmt::format("bg:{}", style.bg.to_string()));
    }

    return fmt::format("{}", fmt::join(parts, " "));
}

std::string
yamlview::repr(const Style& style) {
    return fmt::format("Style(fg: {}, bg: {}, attr: {:#x}{})",
                       repr(style.fg),
                       repr(style.bg),
                       static_cast<uint16_t>(style.attr),
                       style.transform ? ", transform" : "");
}

std::string
yamlview::strip_sgr(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\033' && i + 1 < text.size() && text[i + 1] == '[') {
            auto end = text.find('m', i + 2);
            if (end != std::string::npos) {
                i = end + 1;
                continue;
            }
        }
        result.push_back(text[i++]);
    }
    return result;
}
