#include "processing/classifier.hpp"

#include "util/utf8decode.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <utility>

using namespace yamlview;

namespace {

// clang-format off
const std::array<std::pair<TokenType, Category>, 33> kTokenCategories = {{
    { TokenType::Unknown,        Category::GenericErrorUnknown },
    { TokenType::Invalid,        Category::GenericErrorInvalid },
    { TokenType::Comment,        Category::Comment },
    { TokenType::Directive,      Category::CommentPreproc },
    { TokenType::DocumentHeader, Category::PunctuationHeading },
    { TokenType::DocumentEnd,    Category::PunctuationHeading },
    { TokenType::MappingKey,     Category::NameTag },
    { TokenType::MappingValue,   Category::PunctuationMappingValue },
    { TokenType::SequenceEntry,  Category::PunctuationSequenceEntry },
    { TokenType::MappingStart,   Category::PunctuationMappingStart },
    { TokenType::MappingEnd,     Category::PunctuationMappingEnd },
    { TokenType::SequenceStart,  Category::PunctuationSequenceStart },
    { TokenType::SequenceEnd,    Category::PunctuationSequenceEnd },
    { TokenType::CollectEntry,   Category::PunctuationCollectEntry },
    { TokenType::Literal,        Category::PunctuationBlockLiteral },
    { TokenType::Folded,         Category::PunctuationBlockFolded },
    { TokenType::Anchor,         Category::NameAnchor },
    { TokenType::Alias,          Category::NameAlias },
    { TokenType::MergeKey,       Category::NameAliasMerge },
    { TokenType::Tag,            Category::NameDecorator },
    { TokenType::Null,           Category::LiteralNull },
    { TokenType::ImplicitNull,   Category::LiteralNullImplicit },
    { TokenType::Bool,           Category::LiteralBoolean },
    { TokenType::Integer,        Category::LiteralNumberInteger },
    { TokenType::BinaryInteger,  Category::LiteralNumberBin },
    { TokenType::OctetInteger,   Category::LiteralNumberOct },
    { TokenType::HexInteger,     Category::LiteralNumberHex },
    { TokenType::Float,          Category::LiteralNumberFloat },
    { TokenType::Infinity,       Category::LiteralNumberInfinity },
    { TokenType::NaN,            Category::LiteralNumberNaN },
    { TokenType::String,         Category::LiteralString },
    { TokenType::SingleQuote,    Category::LiteralStringSingle },
    { TokenType::DoubleQuote,    Category::LiteralStringDouble },
}};
// clang-format on

bool
is_scalar(TokenType type) {
    return type >= TokenType::Null && type <= TokenType::DoubleQuote && type != TokenType::ImplicitNull;
}

std::string
join_lines(const std::vector<std::string>& lines) {
    std::string text;
    for (std::size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            text.push_back('\n');
        }
        text += lines[i];
    }
    return text;
}

void
fill_line(std::vector<Segment>& out, std::vector<Segment>& pending, int64_t line, const std::string& text) {
    std::sort(pending.begin(), pending.end(), [](const Segment& a, const Segment& b) { return a.span < b.span; });

    const int64_t line_end = utf8_len(text) + 1;
    int64_t column = 1;

    auto add_text = [&](int64_t from, int64_t to) {
        if (to <= from) {
            return;
        }
        auto start = utf8_advance_by(text, 0, static_cast<std::size_t>(from - 1));
        auto end = utf8_advance_by(text, start, static_cast<std::size_t>(to - from));
        out.push_back({Span({line, from}, {line, to}), Category::Text, text.substr(start, end - start)});
    };

    for (auto& segment : pending) {
        add_text(column, segment.span.start().column);
        column = std::max(column, segment.span.end().column);
        out.push_back(std::move(segment));
    }
    add_text(column, line_end);
    pending.clear();
}

}  // namespace

Category
yamlview::token_category(const Token& token, const Token* next) {
    if (token.type == TokenType::MergeKey) {
        return Category::NameAliasMerge;
    }

    // A scalar directly followed by ':' is a mapping key.
    if (next && next->type == TokenType::MappingValue && is_scalar(token.type)) {
        return Category::NameTag;
    }

    for (const auto& [type, category] : kTokenCategories) {
        if (type == token.type) {
            return category;
        }
    }
    return Category::Text;
}

std::vector<Segment>
yamlview::classify_tokens(const std::vector<Token>& tokens, const std::vector<std::string>& lines) {
    std::vector<std::vector<Segment>> per_line(lines.size());

    for (std::size_t i = 0; i < tokens.size(); i++) {
        const Token& token = tokens[i];
        const Token* next = i + 1 < tokens.size() ? &tokens[i + 1] : nullptr;
        const Category category = token_category(token, next);

        int64_t line = token.position.line;
        int64_t column = token.position.column;
        std::size_t start = 0;
        while (start <= token.raw.size()) {
            auto nl = token.raw.find('\n', start);
            auto end = nl == std::string::npos ? token.raw.size() : nl;
            std::string piece = token.raw.substr(start, end - start);

            if (!piece.empty() && line >= 1 && static_cast<std::size_t>(line) <= lines.size()) {
                int64_t width = utf8_len(piece);
                per_line[line - 1].push_back({Span({line, column}, {line, column + width}), category, piece});
            }

            if (nl == std::string::npos) {
                break;
            }
            start = nl + 1;
            line++;
            column = 1;
        }
    }

    std::vector<Segment> result;
    for (std::size_t i = 0; i < lines.size(); i++) {
        fill_line(result, per_line[i], static_cast<int64_t>(i) + 1, lines[i]);
    }
    return result;
}

YamlClassifier::YamlClassifier() : tokenizer_(std::make_shared<YamlTokenizer>()) {}

YamlClassifier::YamlClassifier(std::shared_ptr<const Tokenizer> tokenizer) : tokenizer_(std::move(tokenizer)) {
    assert(tokenizer_);
}

std::vector<Segment>
YamlClassifier::classify(const std::vector<std::string>& lines) const {
    return classify_tokens(tokenizer_->tokenize(join_lines(lines)), lines);
}
