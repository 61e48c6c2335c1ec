#pragma once

/*
    Scan through YAML text and split it up into a vector of Tokens.

    Tokens are the lexical pieces a highlighter cares about: indicators,
    node properties, scalars, comments and directives. Whitespace and line
    breaks between tokens are not tokenized.
*/

#include <cstdint>
#include <string>
#include <vector>

namespace yamlview {

enum class TokenType : uint8_t {
    Unknown = 0,     // Unrecognized directive
    Invalid,         // Malformed input; unterminated quotes, reserved indicators
    Comment,
    Directive,       // %YAML, %TAG
    DocumentHeader,  // ---
    DocumentEnd,     // ...

    MappingKey,      // ?
    MappingValue,    // :
    SequenceEntry,   // -
    MappingStart,    // {
    MappingEnd,      // }
    SequenceStart,   // [
    SequenceEnd,     // ]
    CollectEntry,    // ,
    Literal,         // |
    Folded,          // >

    Anchor,          // &name
    Alias,           // *name
    MergeKey,        // <<
    Tag,             // !tag, !!str, !<verbatim>

    Null,
    ImplicitNull,    // Empty value after a mapping value indicator
    Bool,
    Integer,
    BinaryInteger,
    OctetInteger,
    HexInteger,
    Float,
    Infinity,
    NaN,
    String,
    SingleQuote,
    DoubleQuote,
};

enum class Indicator : uint8_t {
    NotIndicator = 0,
    BlockStructure,
    FlowCollection,
    Comment,
    NodeProperty,
    BlockScalar,
    QuotedScalar,
    Directive,
    InvalidUse,
};

struct TokenPosition {
    // 1-based; columns count code points.
    int64_t line = 1;
    int64_t column = 1;

    // Byte offset into the tokenized text.
    std::size_t offset = 0;

    // Leading spaces of the line the token starts on, and the depth of that
    // indentation among the enclosing block lines.
    int64_t indent_num = 0;
    int64_t indent_level = 0;
};

struct Token {
    TokenType type = TokenType::Unknown;

    // Source text of the token. Quoted scalars may span lines, in which case
    // `raw` holds the line breaks.
    std::string raw;

    // Scalar value; the anchor, alias or tag name for node properties.
    std::string value;

    Indicator indicator = Indicator::NotIndicator;
    TokenPosition position;
};

const char*
token_type_name(TokenType type);

std::string
repr(const Token& token);

bool
is_whitespace(char c);

bool
is_empty(const std::string& s);

class Tokenizer {
   public:
    virtual ~Tokenizer() = default;

    // Tokens in source order. Never fails; malformed input becomes Invalid
    // tokens.
    virtual std::vector<Token>
    tokenize(const std::string& text) const = 0;
};

class YamlTokenizer : public Tokenizer {
   public:
    std::vector<Token>
    tokenize(const std::string& text) const override;
};

}  // namespace yamlview
