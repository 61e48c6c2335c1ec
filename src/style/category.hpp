#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace yamlview {

// Token categories used to look up a Style. Each category inherits from its
// parent; Text is the root.
enum class Category : uint8_t {
    Text = 0,
    Comment,
    CommentPreproc,
    Generic,
    GenericDeleted,
    GenericError,
    GenericErrorInvalid,
    GenericErrorUnknown,
    GenericInserted,
    Literal,
    LiteralBoolean,
    LiteralNull,
    LiteralNullImplicit,
    LiteralNumber,
    LiteralNumberBin,
    LiteralNumberFloat,
    LiteralNumberHex,
    LiteralNumberInfinity,
    LiteralNumberInteger,
    LiteralNumberNaN,
    LiteralNumberOct,
    LiteralString,
    LiteralStringDouble,
    LiteralStringSingle,
    Name,
    NameAlias,
    NameAliasMerge,
    NameAnchor,
    NameDecorator,
    NameTag,
    Punctuation,
    PunctuationBlock,
    PunctuationBlockFolded,
    PunctuationBlockLiteral,
    PunctuationCollectEntry,
    PunctuationHeading,
    PunctuationMapping,
    PunctuationMappingEnd,
    PunctuationMappingStart,
    PunctuationMappingValue,
    PunctuationSequence,
    PunctuationSequenceEnd,
    PunctuationSequenceEntry,
    PunctuationSequenceStart,

    // Presentation helpers, not produced by the classifier.
    TextAccent,
    TextAccentDim,
    TextSubtle,
    TextSubtleDim,
    TextOK,
    TextWarn,
    TextError,
    Highlight,
    HighlightDim,
    Title,
    TitleAccent,
    TitleSubtle,
    TitleOK,
    TitleWarn,
    TitleError,

    Count
};

const std::size_t kCategoryCount = static_cast<std::size_t>(Category::Count);

// Text is its own parent.
Category
category_parent(Category category);

// Kebab case name, e.g. "literal-number-hex".
const char*
category_name(Category category);

std::optional<Category>
category_from_name(const std::string& name);

}  // namespace yamlview
