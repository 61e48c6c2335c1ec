#pragma once

#include "processing/position.hpp"
#include "processing/tokenizer.hpp"
#include "style/category.hpp"

#include <memory>
#include <string>
#include <vector>

namespace yamlview {

// A styled piece of a single line.
struct Segment {
    Span span;
    Category category = Category::Text;
    std::string raw;
};

class Classifier {
   public:
    virtual ~Classifier() = default;

    // Segments in source order. Every segment lies on one line and segments
    // do not overlap.
    virtual std::vector<Segment>
    classify(const std::vector<std::string>& lines) const = 0;
};

class YamlClassifier : public Classifier {
   public:
    YamlClassifier();

    explicit YamlClassifier(std::shared_ptr<const Tokenizer> tokenizer);

    std::vector<Segment>
    classify(const std::vector<std::string>& lines) const override;

   private:
    std::shared_ptr<const Tokenizer> tokenizer_;
};

// Category of `token` given the token that follows it, if any.
Category
token_category(const Token& token, const Token* next);

// Split tokens into per-line segments and fill the gaps between them with
// Text segments.
std::vector<Segment>
classify_tokens(const std::vector<Token>& tokens, const std::vector<std::string>& lines);

}  // namespace yamlview
