#include "processing/classifier.hpp"

#include <doctest.h>

using namespace yamlview;

namespace {

std::vector<Category>
categories_of(const std::vector<Segment>& segments) {
    std::vector<Category> result;
    for (const auto& s : segments) {
        result.push_back(s.category);
    }
    return result;
}

}  // namespace

TEST_CASE("classifier") {
    YamlClassifier classifier;

    SUBCASE("key value") {
        auto segments = classifier.classify({"key: value"});
        REQUIRE(categories_of(segments) == std::vector<Category>{Category::NameTag,
                                                                 Category::PunctuationMappingValue,
                                                                 Category::Text,
                                                                 Category::LiteralString});
        REQUIRE(segments[0].span == Span({1, 1}, {1, 4}));
        REQUIRE(segments[2].raw == " ");
        REQUIRE(segments[3].span == Span({1, 6}, {1, 11}));
    }

    SUBCASE("leading and trailing whitespace is text") {
        auto segments = classifier.classify({"  a: 1  "});
        REQUIRE(segments.front().category == Category::Text);
        REQUIRE(segments.front().raw == "  ");
        REQUIRE(segments.back().category == Category::Text);
        REQUIRE(segments.back().span.end().column == 9);
    }

    SUBCASE("quoted keys and values") {
        auto segments = classifier.classify({"\"k\": 'v'"});
        REQUIRE(segments[0].category == Category::NameTag);
        REQUIRE(segments.back().category == Category::LiteralStringSingle);
    }

    SUBCASE("merge keys and aliases") {
        auto segments = classifier.classify({"<<: *base"});
        REQUIRE(segments[0].category == Category::NameAliasMerge);
        REQUIRE(segments.back().category == Category::NameAlias);
    }

    SUBCASE("document structure") {
        auto segments = classifier.classify({"%YAML 1.2", "---", "- !tag &a 0x1f # note"});
        auto cats = categories_of(segments);
        REQUIRE(cats[0] == Category::CommentPreproc);
        REQUIRE(cats[1] == Category::PunctuationHeading);
        REQUIRE(cats[2] == Category::PunctuationSequenceEntry);
        REQUIRE(segments[4].category == Category::NameDecorator);
        REQUIRE(segments[6].category == Category::NameAnchor);
        REQUIRE(segments[8].category == Category::LiteralNumberHex);
        REQUIRE(cats.back() == Category::Comment);
    }

    SUBCASE("multi-line tokens split per line") {
        auto segments = classifier.classify({"a: \"one", "  two\""});
        std::vector<Segment> quoted;
        for (const auto& s : segments) {
            if (s.category == Category::LiteralStringDouble) {
                quoted.push_back(s);
            }
        }
        REQUIRE(quoted.size() == 2);
        REQUIRE(quoted[0].span == Span({1, 4}, {1, 8}));
        REQUIRE(quoted[1].span == Span({2, 1}, {2, 7}));
        REQUIRE(quoted[1].raw == "  two\"");
    }

    SUBCASE("malformed input is preserved") {
        auto segments = classifier.classify({"a: \"open", "b: `x"});
        REQUIRE(segments[3].category == Category::GenericErrorInvalid);
        REQUIRE(segments[3].raw == "\"open");
        REQUIRE(segments.back().category == Category::GenericErrorInvalid);
        REQUIRE(segments.back().raw == "`x");
    }

    SUBCASE("segments never overlap") {
        auto segments = classifier.classify({"a: [1, {b: c}]", "d: |", "  text", "e: ~"});
        for (std::size_t i = 1; i < segments.size(); i++) {
            const auto& prev = segments[i - 1].span;
            const auto& cur = segments[i].span;
            CHECK(prev.end() <= cur.start());
        }
    }
}
