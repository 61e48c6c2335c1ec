#include "tokenizer.hpp"

#include "util/utf8decode.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <vector>

using namespace yamlview;

//#define LOCAL_DEBUG

namespace {

// clang-format off
const std::array<const char*, 33> kTokenTypeNames = {
    "Unknown", "Invalid", "Comment", "Directive", "DocumentHeader", "DocumentEnd",
    "MappingKey", "MappingValue", "SequenceEntry", "MappingStart", "MappingEnd",
    "SequenceStart", "SequenceEnd", "CollectEntry", "Literal", "Folded",
    "Anchor", "Alias", "MergeKey", "Tag",
    "Null", "ImplicitNull", "Bool", "Integer", "BinaryInteger", "OctetInteger",
    "HexInteger", "Float", "Infinity", "NaN", "String", "SingleQuote", "DoubleQuote",
};
// clang-format on

bool
is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

bool
is_flow_indicator(char c) {
    return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
}

// Blank or end of line at `pos`.
bool
blank_at(const std::string& s, std::size_t pos) {
    return pos >= s.size() || is_blank(s[pos]);
}

int64_t
leading_indent(const std::string& s) {
    int64_t n = 0;
    while (static_cast<std::size_t>(n) < s.size() && s[n] == ' ') {
        n++;
    }
    return n;
}

// End of `s` without trailing blanks, searching no further back than `start`.
std::size_t
trim_end(const std::string& s, std::size_t start, std::size_t end) {
    while (end > start && is_blank(s[end - 1])) {
        end--;
    }
    return end;
}

bool
all_of(const std::string& s, std::size_t start, int (*pred)(int)) {
    if (start >= s.size()) {
        return false;
    }
    for (std::size_t i = start; i < s.size(); i++) {
        if (!pred(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

int
is_bin_digit(int c) {
    return c == '0' || c == '1';
}

int
is_oct_digit(int c) {
    return c >= '0' && c <= '7';
}

bool
is_float(const std::string& s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        i++;
    }

    std::size_t int_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        i++;
        int_digits++;
    }

    std::size_t frac_digits = 0;
    bool has_dot = false;
    if (i < s.size() && s[i] == '.') {
        has_dot = true;
        i++;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            i++;
            frac_digits++;
        }
    }

    if (int_digits + frac_digits == 0) {
        return false;
    }

    bool has_exp = false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        has_exp = true;
        i++;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
            i++;
        }
        std::size_t exp_digits = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            i++;
            exp_digits++;
        }
        if (exp_digits == 0) {
            return false;
        }
    }

    return i == s.size() && (has_dot || has_exp);
}

// YAML 1.2 core schema, plus 0b and 0o prefixed integers.
TokenType
plain_scalar_type(const std::string& s) {
    if (s == "~" || s == "null" || s == "Null" || s == "NULL") {
        return TokenType::Null;
    }

    if (s == "true" || s == "True" || s == "TRUE" || s == "false" || s == "False" || s == "FALSE") {
        return TokenType::Bool;
    }

    const std::size_t sign = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    const std::string unsigned_part = s.substr(sign);

    if (unsigned_part == ".inf" || unsigned_part == ".Inf" || unsigned_part == ".INF") {
        return TokenType::Infinity;
    }

    if (s == ".nan" || s == ".NaN" || s == ".NAN") {
        return TokenType::NaN;
    }

    if (unsigned_part.size() > 2 && unsigned_part[0] == '0') {
        switch (unsigned_part[1]) {
            case 'b':
                if (all_of(unsigned_part, 2, is_bin_digit)) {
                    return TokenType::BinaryInteger;
                }
                break;
            case 'o':
                if (all_of(unsigned_part, 2, is_oct_digit)) {
                    return TokenType::OctetInteger;
                }
                break;
            case 'x':
                if (all_of(unsigned_part, 2, std::isxdigit)) {
                    return TokenType::HexInteger;
                }
                break;
        }
    }

    if (all_of(unsigned_part, 0, std::isdigit)) {
        return TokenType::Integer;
    }

    if (is_float(s)) {
        return TokenType::Float;
    }

    return TokenType::String;
}

struct Cursor {
    std::size_t line = 0;
    std::size_t pos = 0;

    // Continuing a line after a multi-line token; line start handling is
    // already done.
    bool resume = false;
};

class Lexer {
   public:
    explicit Lexer(const std::string& text) {
        std::size_t start = 0;
        while (start < text.size()) {
            auto nl = text.find('\n', start);
            if (nl == std::string::npos) {
                nl = text.size();
            }
            lines_.push_back(text.substr(start, nl - start));
            offsets_.push_back(start);
            start = nl + 1;
        }
    }

    std::vector<Token>
    run() {
        Cursor cursor;
        while (cursor.line < lines_.size()) {
            cursor = lex_line(cursor);
        }
        return std::move(tokens_);
    }

   private:
    Cursor
    lex_line(Cursor cursor);

    Cursor
    lex_quoted(std::size_t li, std::size_t pos);

    std::size_t
    lex_plain(std::size_t li, std::size_t pos);

    std::size_t
    lex_node_property(std::size_t li, std::size_t pos, TokenType type);

    void
    maybe_implicit_null(std::size_t li, std::size_t colon);

    // Column of the node that owns the line, skipping "- " and "? " indicators.
    int64_t
    node_indent(const std::string& s) const {
        auto i = static_cast<std::size_t>(leading_indent(s));
        while (i < s.size() && (s[i] == '-' || s[i] == '?') && blank_at(s, i + 1)) {
            i++;
            while (i < s.size() && s[i] == ' ') {
                i++;
            }
        }
        return static_cast<int64_t>(i);
    }

    bool
    is_comment_line(const std::string& s) const {
        auto i = static_cast<std::size_t>(leading_indent(s));
        while (i < s.size() && is_blank(s[i])) {
            i++;
        }
        return i >= s.size() || s[i] == '#';
    }

    Token&
    emit(TokenType type,
         Indicator indicator,
         std::size_t li,
         std::size_t start,
         std::size_t end,
         std::string value) {
        Token token;
        token.type = type;
        token.indicator = indicator;
        token.raw = lines_[li].substr(start, end - start);
        token.value = std::move(value);
        token.position.line = static_cast<int64_t>(li) + 1;
        token.position.column = utf8_len(lines_[li], 0, start) + 1;
        token.position.offset = offsets_[li] + start;
        token.position.indent_num = indent_num_;
        token.position.indent_level = indent_level_;
#ifdef LOCAL_DEBUG
        fmt::print("{}\n", repr(token));
#endif
        tokens_.push_back(std::move(token));
        return tokens_.back();
    }

    std::vector<std::string> lines_;
    std::vector<std::size_t> offsets_;
    std::vector<Token> tokens_;

    int flow_depth_ = 0;

    // Block scalar content tracking.
    bool in_block_ = false;
    bool block_pending_ = false;
    int64_t block_parent_indent_ = 0;

    std::vector<int64_t> indents_;
    int64_t indent_num_ = 0;
    int64_t indent_level_ = 0;
};

Cursor
Lexer::lex_line(Cursor cursor) {
    const std::size_t li = cursor.line;
    const std::string& s = lines_[li];
    std::size_t pos = cursor.pos;

    if (!cursor.resume) {
        const int64_t indent = leading_indent(s);

        if (in_block_) {
            const bool marker = s.compare(0, 3, "---") == 0 || s.compare(0, 3, "...") == 0;
            if (is_empty(s) && !marker) {
                return {li + 1, 0, false};
            }
            if (indent > block_parent_indent_ && !marker) {
                auto start = static_cast<std::size_t>(indent);
                auto end = trim_end(s, start, s.size());
                emit(TokenType::String, Indicator::NotIndicator, li, start, end, s.substr(start, end - start));
                return {li + 1, 0, false};
            }
            in_block_ = false;
        }

        indent_num_ = indent;
        if (!is_comment_line(s) && flow_depth_ == 0) {
            while (!indents_.empty() && indents_.back() > indent) {
                indents_.pop_back();
            }
            if (indents_.empty() || indents_.back() < indent) {
                indents_.push_back(indent);
            }
            indent_level_ = static_cast<int64_t>(indents_.size()) - 1;
        }

        // Directives only appear at the start of a line.
        if (!s.empty() && s[0] == '%' && flow_depth_ == 0) {
            auto end = s.find(" #");
            end = trim_end(s, 0, end == std::string::npos ? s.size() : end);
            auto name_end = std::min(s.find_first_of(" \t"), end);
            auto name = s.substr(1, name_end - 1);
            auto type = (name == "YAML" || name == "TAG") ? TokenType::Directive : TokenType::Unknown;
            emit(type, Indicator::Directive, li, 0, end, name);
            pos = end;
        }

        if (s.compare(0, 3, "---") == 0 || s.compare(0, 3, "...") == 0) {
            if (blank_at(s, 3)) {
                auto type = s[0] == '-' ? TokenType::DocumentHeader : TokenType::DocumentEnd;
                emit(type, Indicator::BlockStructure, li, 0, 3, "");
                flow_depth_ = 0;
                indents_.clear();
                indent_level_ = 0;
                pos = 3;
            }
        }
    }

    while (pos < s.size()) {
        const char c = s[pos];

        if (is_blank(c)) {
            pos++;
            continue;
        }

        // Comments need a separating blank, otherwise '#' is part of a scalar.
        if (c == '#' && (pos == 0 || is_blank(s[pos - 1]))) {
            auto end = trim_end(s, pos, s.size());
            emit(TokenType::Comment, Indicator::Comment, li, pos, end, s.substr(pos + 1, end - pos - 1));
            pos = s.size();
            break;
        }

        const bool in_flow = flow_depth_ > 0;
        const char next = pos + 1 < s.size() ? s[pos + 1] : '\0';

        switch (c) {
            case '-': {
                if (blank_at(s, pos + 1)) {
                    emit(TokenType::SequenceEntry, Indicator::BlockStructure, li, pos, pos + 1, "");
                    pos++;
                    continue;
                }
            } break;
            case '?': {
                if (blank_at(s, pos + 1)) {
                    emit(TokenType::MappingKey, Indicator::BlockStructure, li, pos, pos + 1, "");
                    pos++;
                    continue;
                }
            } break;
            case ':': {
                // JSON style "key":value is allowed after quoted keys in flow.
                bool adjacent_json_key = false;
                if (in_flow && !tokens_.empty()) {
                    const auto& prev = tokens_.back();
                    adjacent_json_key = (prev.type == TokenType::SingleQuote || prev.type == TokenType::DoubleQuote ||
                                         prev.type == TokenType::MappingEnd || prev.type == TokenType::SequenceEnd) &&
                                        prev.position.line == static_cast<int64_t>(li) + 1 &&
                                        prev.position.offset + prev.raw.size() == offsets_[li] + pos;
                }
                if (blank_at(s, pos + 1) || (in_flow && is_flow_indicator(next)) || adjacent_json_key) {
                    emit(TokenType::MappingValue, Indicator::BlockStructure, li, pos, pos + 1, "");
                    if (!in_flow) {
                        maybe_implicit_null(li, pos);
                    }
                    pos++;
                    continue;
                }
            } break;
            case '[':
            case '{': {
                auto type = c == '[' ? TokenType::SequenceStart : TokenType::MappingStart;
                emit(type, Indicator::FlowCollection, li, pos, pos + 1, "");
                flow_depth_++;
                pos++;
                continue;
            }
            case ']':
            case '}': {
                auto type = c == ']' ? TokenType::SequenceEnd : TokenType::MappingEnd;
                emit(type, Indicator::FlowCollection, li, pos, pos + 1, "");
                flow_depth_ = std::max(0, flow_depth_ - 1);
                pos++;
                continue;
            }
            case ',': {
                if (in_flow) {
                    emit(TokenType::CollectEntry, Indicator::FlowCollection, li, pos, pos + 1, "");
                    pos++;
                    continue;
                }
            } break;
            case '|':
            case '>': {
                auto end = pos + 1;
                while (end < s.size() && (s[end] == '-' || s[end] == '+' || std::isdigit(static_cast<unsigned char>(s[end])))) {
                    end++;
                }
                auto type = c == '|' ? TokenType::Literal : TokenType::Folded;
                emit(type, Indicator::BlockScalar, li, pos, end, s.substr(pos + 1, end - pos - 1));

                const int64_t owner = node_indent(s);
                block_parent_indent_ = static_cast<int64_t>(pos) == owner ? owner - 1 : owner;
                block_pending_ = true;
                pos = end;
                continue;
            }
            case '&': {
                pos = lex_node_property(li, pos, TokenType::Anchor);
                continue;
            }
            case '*': {
                pos = lex_node_property(li, pos, TokenType::Alias);
                continue;
            }
            case '!': {
                pos = lex_node_property(li, pos, TokenType::Tag);
                continue;
            }
            case '"':
            case '\'': {
                auto after = lex_quoted(li, pos);
                if (after.line != li) {
                    return after;
                }
                pos = after.pos;
                continue;
            }
            default:
                break;
        }

        pos = lex_plain(li, pos);
    }

    if (block_pending_) {
        block_pending_ = false;
        in_block_ = true;
    }

    return {li + 1, 0, false};
}

std::size_t
Lexer::lex_node_property(std::size_t li, std::size_t pos, TokenType type) {
    const std::string& s = lines_[li];
    const bool in_flow = flow_depth_ > 0;

    auto end = pos + 1;
    if (type == TokenType::Tag && end < s.size() && s[end] == '<') {
        auto close = s.find('>', end);
        end = close == std::string::npos ? s.size() : close + 1;
    } else {
        while (end < s.size() && !is_blank(s[end]) && !(in_flow && is_flow_indicator(s[end]))) {
            // An anchor or alias directly followed by ": " ends at the colon.
            if (type != TokenType::Tag && s[end] == ':' && blank_at(s, end + 1)) {
                break;
            }
            end++;
        }
    }

    auto indicator = type == TokenType::Alias ? Indicator::NotIndicator : Indicator::NodeProperty;
    emit(type, indicator, li, pos, end, s.substr(pos + 1, end - pos - 1));
    return end;
}

std::size_t
Lexer::lex_plain(std::size_t li, std::size_t pos) {
    const std::string& s = lines_[li];
    const bool in_flow = flow_depth_ > 0;

    auto end = pos;
    while (end < s.size()) {
        const char c = s[end];
        if (c == ':' && (blank_at(s, end + 1) || (in_flow && end + 1 < s.size() && is_flow_indicator(s[end + 1])))) {
            break;
        }
        if (c == '#' && end > pos && is_blank(s[end - 1])) {
            break;
        }
        if (in_flow && is_flow_indicator(c)) {
            break;
        }
        end++;
    }
    end = trim_end(s, pos, end);

    // Always make progress, even on a lone ':' we could not classify.
    if (end == pos) {
        end = pos + 1;
    }

    const std::string raw = s.substr(pos, end - pos);

    if (s[pos] == '@' || s[pos] == '`') {
        emit(TokenType::Invalid, Indicator::InvalidUse, li, pos, end, raw);
    } else if (raw == "<<") {
        emit(TokenType::MergeKey, Indicator::NotIndicator, li, pos, end, raw);
    } else {
        emit(plain_scalar_type(raw), Indicator::NotIndicator, li, pos, end, raw);
    }
    return end;
}

Cursor
Lexer::lex_quoted(std::size_t li, std::size_t pos) {
    const char quote = lines_[li][pos];
    const auto type = quote == '"' ? TokenType::DoubleQuote : TokenType::SingleQuote;
    const int64_t owner_indent = leading_indent(lines_[li]);

    std::string value;
    bool pending_fold = false;

    auto scan = [&](const std::string& s, std::size_t from) -> std::size_t {
        for (std::size_t i = from; i < s.size(); i++) {
            const char c = s[i];
            if (quote == '"' && c == '\\' && i + 1 < s.size()) {
                const char e = s[i + 1];
                switch (e) {
                    case 'n': value.push_back('\n'); break;
                    case 't': value.push_back('\t'); break;
                    case '0': value.push_back('\0'); break;
                    default: value.push_back(e); break;
                }
                i++;
                continue;
            }
            if (quote == '\'' && c == '\'' && i + 1 < s.size() && s[i + 1] == '\'') {
                value.push_back('\'');
                i++;
                continue;
            }
            if (c == quote) {
                return i;
            }
            if (pending_fold && is_blank(c)) {
                continue;
            }
            pending_fold = false;
            value.push_back(c);
        }
        return std::string::npos;
    };

    auto close = scan(lines_[li], pos + 1);
    if (close != std::string::npos) {
        emit(type, Indicator::QuotedScalar, li, pos, close + 1, value);
        return {li, close + 1, true};
    }

    // Look for the closing quote on continuation lines. In block context they
    // must be indented past the line that opened the scalar.
    for (std::size_t lj = li + 1; lj < lines_.size(); lj++) {
        const std::string& s = lines_[lj];
        const bool marker = s.compare(0, 3, "---") == 0 || s.compare(0, 3, "...") == 0;
        if (marker || (flow_depth_ == 0 && !is_empty(s) && leading_indent(s) <= owner_indent)) {
            break;
        }

        while (!value.empty() && is_blank(value.back())) {
            value.pop_back();
        }
        value.push_back(is_empty(s) ? '\n' : ' ');
        pending_fold = true;

        close = scan(s, 0);
        if (close == std::string::npos) {
            continue;
        }

        Token& token = emit(type, Indicator::QuotedScalar, li, pos, lines_[li].size(), value);
        for (std::size_t k = li + 1; k < lj; k++) {
            token.raw += "\n" + lines_[k];
        }
        token.raw += "\n" + s.substr(0, close + 1);

        indent_num_ = leading_indent(s);
        return {lj, close + 1, true};
    }

    // Unterminated; the rest of the line is invalid.
    const std::string& s = lines_[li];
    auto end = trim_end(s, pos, s.size());
    emit(TokenType::Invalid, Indicator::InvalidUse, li, pos, end, s.substr(pos, end - pos));
    return {li + 1, 0, false};
}

// `key:` with nothing after it on the line and no nested block below is an
// implicit null.
void
Lexer::maybe_implicit_null(std::size_t li, std::size_t colon) {
    const std::string& s = lines_[li];
    auto rest = colon + 1;
    while (rest < s.size() && is_blank(s[rest])) {
        rest++;
    }
    if (rest < s.size() && s[rest] != '#') {
        return;
    }

    const int64_t owner = node_indent(s);
    for (std::size_t lj = li + 1; lj < lines_.size(); lj++) {
        const std::string& next = lines_[lj];
        if (is_comment_line(next)) {
            continue;
        }
        const int64_t indent = leading_indent(next);
        if (indent > owner) {
            return;
        }
        // A block sequence may sit at the same indentation as its key.
        auto first = static_cast<std::size_t>(indent);
        if (indent == owner && next[first] == '-' && blank_at(next, first + 1)) {
            return;
        }
        break;
    }

    emit(TokenType::ImplicitNull, Indicator::NotIndicator, li, colon + 1, colon + 1, "");
}

}  // namespace

const char*
yamlview::token_type_name(TokenType type) {
    auto index = static_cast<std::size_t>(type);
    return index < kTokenTypeNames.size() ? kTokenTypeNames[index] : "?";
}

std::string
yamlview::repr(const Token& token) {
    return fmt::format("Token(.type={}, .line={}, .column={}, .raw='{}')",
                       token_type_name(token.type),
                       token.position.line,
                       token.position.column,
                       token.raw);
}

bool
yamlview::is_whitespace(char c) {
    const char whitespaces[] = " \t\r\n\f\v";
    for (const auto whitespace : whitespaces) {
        if (whitespace != '\0' && whitespace == c) {
            return true;
        }
    }
    return false;
}

bool
yamlview::is_empty(const std::string& s) {
    for (char c : s) {
        if (!yamlview::is_whitespace(c)) {
            return false;
        }
    }
    return true;
}

std::vector<Token>
YamlTokenizer::tokenize(const std::string& text) const {
    // Nothing to do.
    if (text.empty()) {
        return {};
    }
    return Lexer(text).run();
}
