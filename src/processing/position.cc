#include "processing/position.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace yamlview;

Span::Span(Position start, Position end) : start_(start), end_(end) {
    if (end < start) {
        throw InvalidSpan(fmt::format("invalid span: {} is before {}", repr(end), repr(start)));
    }
}

Span
Span::line(int64_t n) {
    return Span({n, 1}, {n + 1, 1});
}

Span
Span::lines(int64_t first, int64_t last) {
    return Span({first, 1}, {last + 1, 1});
}

bool
Span::contains(const Position& p) const {
    return start_ <= p && p < end_;
}

bool
Span::contains_span(const Span& other) const {
    return start_ <= other.start_ && other.end_ <= end_;
}

bool
Span::intersects(const Span& other) const {
    if (is_empty() || other.is_empty()) {
        return false;
    }
    return start_ < other.end_ && other.start_ < end_;
}

int64_t
Span::last_line() const {
    if (end_.column == 1 && end_.line > start_.line) {
        return end_.line - 1;
    }
    return end_.line;
}

Span
Span::clip_to_line(int64_t n) const {
    const Span none({n, 1}, {n, 1});
    if (is_empty() || n < first_line() || n > last_line()) {
        return none;
    }

    int64_t first_col = n == start_.line ? start_.column : 1;
    int64_t last_col = n == end_.line ? end_.column : kLineEnd;
    if (last_col <= first_col) {
        return none;
    }
    return Span({n, first_col}, {n, last_col});
}

std::vector<Span>
yamlview::union_adjacent_or_overlapping(std::vector<Span> spans) {
    std::vector<Span> result;
    if (spans.empty()) {
        return result;
    }

    std::sort(spans.begin(), spans.end());

    int64_t first = spans[0].first_line();
    int64_t last = spans[0].last_line();
    for (std::size_t i = 1; i < spans.size(); i++) {
        const auto& s = spans[i];
        if (s.first_line() <= last + 1) {
            last = std::max(last, s.last_line());
            continue;
        }
        result.push_back(Span::lines(first, last));
        first = s.first_line();
        last = s.last_line();
    }
    result.push_back(Span::lines(first, last));
    return result;
}

std::string
yamlview::repr(const Position& p) {
    return fmt::format("{}:{}", p.line, p.column);
}

std::string
yamlview::repr(const Span& s) {
    return fmt::format("[{}, {})", repr(s.start()), repr(s.end()));
}
