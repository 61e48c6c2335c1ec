#include "style/category.hpp"

#include <array>
#include <cassert>

using namespace yamlview;

namespace {

struct CategoryInfo {
    Category category;
    Category parent;
    const char* name;
};

// clang-format off
const std::array<CategoryInfo, kCategoryCount> kCategories = {{
    { Category::Text,                     Category::Text,                "text" },
    { Category::Comment,                  Category::Text,                "comment" },
    { Category::CommentPreproc,           Category::Comment,             "comment-preproc" },
    { Category::Generic,                  Category::Text,                "generic" },
    { Category::GenericDeleted,           Category::Generic,             "generic-deleted" },
    { Category::GenericError,             Category::Generic,             "generic-error" },
    { Category::GenericErrorInvalid,      Category::GenericError,        "generic-error-invalid" },
    { Category::GenericErrorUnknown,      Category::GenericError,        "generic-error-unknown" },
    { Category::GenericInserted,          Category::Generic,             "generic-inserted" },
    { Category::Literal,                  Category::Text,                "literal" },
    { Category::LiteralBoolean,           Category::Literal,             "literal-boolean" },
    { Category::LiteralNull,              Category::Literal,             "literal-null" },
    { Category::LiteralNullImplicit,      Category::LiteralNull,         "literal-null-implicit" },
    { Category::LiteralNumber,            Category::Literal,             "literal-number" },
    { Category::LiteralNumberBin,         Category::LiteralNumber,       "literal-number-bin" },
    { Category::LiteralNumberFloat,       Category::LiteralNumber,       "literal-number-float" },
    { Category::LiteralNumberHex,         Category::LiteralNumber,       "literal-number-hex" },
    { Category::LiteralNumberInfinity,    Category::LiteralNumber,       "literal-number-infinity" },
    { Category::LiteralNumberInteger,     Category::LiteralNumber,       "literal-number-integer" },
    { Category::LiteralNumberNaN,         Category::LiteralNumber,       "literal-number-nan" },
    { Category::LiteralNumberOct,         Category::LiteralNumber,       "literal-number-oct" },
    { Category::LiteralString,            Category::Literal,             "literal-string" },
    { Category::LiteralStringDouble,      Category::LiteralString,       "literal-string-double" },
    { Category::LiteralStringSingle,      Category::LiteralString,       "literal-string-single" },
    { Category::Name,                     Category::Text,                "name" },
    { Category::NameAlias,                Category::Name,                "name-alias" },
    { Category::NameAliasMerge,           Category::NameAlias,           "name-alias-merge" },
    { Category::NameAnchor,               Category::Name,                "name-anchor" },
    { Category::NameDecorator,            Category::NameAnchor,          "name-decorator" },
    { Category::NameTag,                  Category::Name,                "name-tag" },
    { Category::Punctuation,              Category::Text,                "punctuation" },
    { Category::PunctuationBlock,         Category::Punctuation,         "punctuation-block" },
    { Category::PunctuationBlockFolded,   Category::PunctuationBlock,    "punctuation-block-folded" },
    { Category::PunctuationBlockLiteral,  Category::PunctuationBlock,    "punctuation-block-literal" },
    { Category::PunctuationCollectEntry,  Category::Punctuation,         "punctuation-collect-entry" },
    { Category::PunctuationHeading,       Category::Punctuation,         "punctuation-heading" },
    { Category::PunctuationMapping,       Category::Punctuation,         "punctuation-mapping" },
    { Category::PunctuationMappingEnd,    Category::PunctuationMapping,  "punctuation-mapping-end" },
    { Category::PunctuationMappingStart,  Category::PunctuationMapping,  "punctuation-mapping-start" },
    { Category::PunctuationMappingValue,  Category::PunctuationMapping,  "punctuation-mapping-value" },
    { Category::PunctuationSequence,      Category::Punctuation,         "punctuation-sequence" },
    { Category::PunctuationSequenceEnd,   Category::PunctuationSequence, "punctuation-sequence-end" },
    { Category::PunctuationSequenceEntry, Category::PunctuationSequence, "punctuation-sequence-entry" },
    { Category::PunctuationSequenceStart, Category::PunctuationSequence, "punctuation-sequence-start" },
    { Category::TextAccent,               Category::Text,                "text-accent" },
    { Category::TextAccentDim,            Category::TextAccent,          "text-accent-dim" },
    { Category::TextSubtle,               Category::Text,                "text-subtle" },
    { Category::TextSubtleDim,            Category::TextSubtle,          "text-subtle-dim" },
    { Category::TextOK,                   Category::Text,                "text-ok" },
    { Category::TextWarn,                 Category::Text,                "text-warn" },
    { Category::TextError,                Category::Text,                "text-error" },
    { Category::Highlight,                Category::Generic,             "highlight" },
    { Category::HighlightDim,             Category::Highlight,           "highlight-dim" },
    { Category::Title,                    Category::Generic,             "title" },
    { Category::TitleAccent,              Category::Title,               "title-accent" },
    { Category::TitleSubtle,              Category::Title,               "title-subtle" },
    { Category::TitleOK,                  Category::Title,               "title-ok" },
    { Category::TitleWarn,                Category::Title,               "title-warn" },
    { Category::TitleError,               Category::Title,               "title-error" },
}};
// clang-format on

const CategoryInfo&
info(Category category) {
    auto index = static_cast<std::size_t>(category);
    assert(index < kCategories.size());
    assert(kCategories[index].category == category);
    return kCategories[index];
}

}  // namespace

Category
yamlview::category_parent(Category category) {
    return info(category).parent;
}

const char*
yamlview::category_name(Category category) {
    return info(category).name;
}

std::optional<Category>
yamlview::category_from_name(const std::string& name) {
    for (const auto& entry : kCategories) {
        if (name == entry.name) {
            return entry.category;
        }
    }
    return {};
}
