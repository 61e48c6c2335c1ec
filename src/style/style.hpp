#pragma once

#include "util/color.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace yamlview {

// Visual attributes applied to a run of text.
struct Style {
    enum class Attribute : uint16_t {
        None          = 0,
        Bold          = 1 << 0,
        Dim           = 1 << 1,
        Italic        = 1 << 2,
        Underline     = 1 << 4,
        Blink         = 1 << 5,
        Inverse       = 1 << 6,
        Hidden        = 1 << 7,
        Strikethrough = 1 << 8,
    };

    // Rewrites the text of a run before it is emitted.
    using Transform = std::function<std::string(const std::string&)>;

    Color fg;
    Color bg;
    Attribute attr = Attribute::None;
    Transform transform;

    Style() = default;

    explicit Style(Color fg, Color bg = Color::kNone, Attribute attr = Attribute::None)
        : fg(fg)
        , bg(bg)
        , attr(attr) {}

    bool
    has(Attribute flag) const {
        return (static_cast<uint16_t>(attr) & static_cast<uint16_t>(flag)) != 0;
    }

    // No colors, attributes or transform.
    bool
    empty() const {
        return !fg.is_visible() && !bg.is_visible() && attr == Attribute::None && !transform;
    }

    Style
    with_fg(Color color) const;

    Style
    with_bg(Color color) const;

    Style
    with(Attribute flag) const;

    Style
    without(Attribute flag) const;

    Style
    with_transform(Transform tx) const;

    // SGR sequence selecting this style; empty when there is nothing to select.
    std::string
    sgr(ColorProfile profile) const;

    // Transform, then wrap in SGR and reset. Empty text renders as nothing.
    std::string
    render(const std::string& text, ColorProfile profile) const;
};

using StylePtr = std::shared_ptr<const Style>;

Style::Attribute
operator|(Style::Attribute a, Style::Attribute b);

// Parse a space separated style string, e.g. "bold #ff0000 bg:#000".
// Returns nullopt for unknown keywords and malformed colors.
std::optional<Style>
parse_style(const std::string& value);

// Inverse of parse_style. Colors are written as lowercase hex.
std::string
encode_style(const Style& style);

std::string
repr(const Style& style);

// Remove SGR escape sequences, leaving the visible text.
std::string
strip_sgr(const std::string& text);

}  // namespace yamlview
