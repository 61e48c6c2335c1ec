#include "style/theme.hpp"

using namespace yamlview;

namespace {

using A = Style::Attribute;

Color
hex(const char* value) {
    // Only called with literals below.
    return *Color::from_hex(value);
}

}  // namespace

Styles
yamlview::themes::dracula() {
    const Color fg = hex("#f8f8f2");
    const Color bg = hex("#282a36");
    const Style base(fg, bg);

    // clang-format off
    return Styles(base, {
        { Category::Comment,             base.with_fg(hex("#6272a4")) },
        { Category::Generic,             base },
        { Category::GenericDeleted,      base.with_fg(hex("#ff5555")) },
        { Category::GenericError,        base },
        { Category::GenericInserted,     base.with_fg(hex("#50fa7b")).with(A::Bold) },
        { Category::LiteralNumber,       base.with_fg(hex("#bd93f9")) },
        { Category::LiteralString,       base.with_fg(hex("#f1fa8c")) },
        { Category::LiteralBoolean,      base.with_fg(hex("#ff79c6")) },
        { Category::Name,                base },
        { Category::NameTag,             base.with_fg(hex("#ff79c6")) },
        { Category::Punctuation,         base },
        { Category::PunctuationHeading,  base },
        { Category::Title,               Style(bg, hex("#ff79c6"), A::Bold) },
        { Category::TitleAccent,         base.with_bg(bg.lighten(0.30)).with_fg(fg.lighten(0.15)) },
        { Category::TitleSubtle,         base.with_bg(bg.lighten(0.15)) },
        { Category::TitleOK,             Style(bg, hex("#50fa7b"), A::Bold) },
        { Category::TitleWarn,           Style(bg, hex("#f1fa8c"), A::Bold) },
        { Category::TitleError,          Style(bg, hex("#ff5555"), A::Bold) },
        { Category::TextAccent,          base.with_fg(fg.lighten(0.15)) },
        { Category::TextAccentDim,       base },
        { Category::TextSubtle,          base.with_fg(fg.darken(0.15)) },
        { Category::TextSubtleDim,       base },
        { Category::TextOK,              base.with_fg(hex("#50fa7b")) },
        { Category::TextWarn,            base.with_fg(hex("#f1fa8c")) },
        { Category::TextError,           base.with_fg(hex("#ff5555")) },
        { Category::Highlight,           Style(Color::kNone, bg.lighten(0.30)) },
        { Category::HighlightDim,        Style(Color::kNone, bg.lighten(0.15)) },
    });
    // clang-format on
}

Styles
yamlview::themes::monokai() {
    const Color bg = hex("#272822");
    const Style base(hex("#f8f8f2"), bg);

    // clang-format off
    return Styles(base, {
        { Category::Comment,             base.with_fg(hex("#75715e")) },
        { Category::Generic,             base.with(A::Italic) },
        { Category::GenericDeleted,      base.with_fg(hex("#f92672")) },
        { Category::GenericInserted,     base.with_fg(hex("#a6e22e")) },
        { Category::GenericError,        Style(hex("#960050"), hex("#1e0010")) },
        { Category::LiteralNumber,       base.with_fg(hex("#ae81ff")) },
        { Category::LiteralString,       base.with_fg(hex("#e6db74")) },
        { Category::Name,                base },
        { Category::NameDecorator,       base.with_fg(hex("#a6e22e")) },
        { Category::NameTag,             base.with_fg(hex("#f92672")) },
        { Category::Punctuation,         base },
        { Category::Title,               Style(bg, hex("#a6e22e"), A::Bold) },
        { Category::TitleOK,             Style(bg, hex("#a6e22e"), A::Bold) },
        { Category::TitleWarn,           Style(bg, hex("#e6db74"), A::Bold) },
        { Category::TitleError,          Style(bg, hex("#f92672"), A::Bold) },
        { Category::TextOK,              base.with_fg(hex("#a6e22e")) },
        { Category::TextWarn,            base.with_fg(hex("#e6db74")) },
        { Category::TextError,           base.with_fg(hex("#f92672")) },
        { Category::Highlight,           Style(Color::kNone, bg.lighten(0.30)) },
        { Category::HighlightDim,        Style(Color::kNone, bg.lighten(0.15)) },
    });
    // clang-format on
}

Styles
yamlview::themes::github() {
    const Color fg = hex("#1f2328");
    const Color bg = hex("#f7f7f7");
    const Style base(fg, bg);

    // clang-format off
    return Styles(base, {
        { Category::Comment,             base.with_fg(hex("#57606a")) },
        { Category::GenericDeleted,      Style(hex("#82071e"), hex("#ffebe9")) },
        { Category::GenericInserted,     Style(hex("#116329"), hex("#dafbe1")) },
        { Category::LiteralNumber,       base.with_fg(hex("#0550ae")) },
        { Category::LiteralString,       base.with_fg(hex("#0a3069")) },
        { Category::NameDecorator,       base.with_fg(hex("#0550ae")) },
        { Category::NameTag,             base.with_fg(hex("#0550ae")) },
        { Category::Punctuation,         base },
        { Category::Title,               Style(bg, hex("#0550ae"), A::Bold) },
        { Category::TitleSubtle,         Style(bg, fg) },
        { Category::TitleOK,             Style(bg, hex("#116329"), A::Bold) },
        { Category::TitleWarn,           Style(bg, hex("#d08700"), A::Bold) },
        { Category::TitleError,          Style(bg, hex("#82071e"), A::Bold) },
        { Category::TextAccent,          base.with_fg(hex("#0550ae")) },
        { Category::TextSubtle,          base.with_fg(hex("#57606a")) },
        { Category::TextOK,              base.with_fg(hex("#116329")) },
        { Category::TextWarn,            base.with_fg(hex("#d08700")) },
        { Category::TextError,           base.with_fg(hex("#82071e")) },
        { Category::Highlight,           Style(Color::kNone, bg.darken(0.20)) },
        { Category::HighlightDim,        Style(Color::kNone, bg.darken(0.10)) },
    });
    // clang-format on
}

Styles
yamlview::themes::bw() {
    const Style base(hex("#000000"), hex("#ffffff"));

    // clang-format off
    return Styles(base, {
        { Category::Comment,             base.with(A::Italic) },
        { Category::LiteralString,       base.with(A::Italic) },
        { Category::NameTag,             base.with(A::Bold) },
        { Category::Generic,             base.with(A::Italic) },
        { Category::GenericDeleted,      base.with(A::Strikethrough) },
        { Category::GenericInserted,     base.with(A::Bold) },
        { Category::Name,                base.with(A::Bold) },
        { Category::PunctuationHeading,  base.with(A::Bold) },
        { Category::Punctuation,         base.with(A::Bold) },
        { Category::Highlight,           Style(hex("#ffffff"), hex("#000000")) },
        { Category::HighlightDim,        Style(Color::kNone, hex("#cccccc")) },
    });
    // clang-format on
}
