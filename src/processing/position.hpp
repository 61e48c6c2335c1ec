#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace yamlview {

// 1-based line and column. Columns count code points, not bytes.
struct Position {
    int64_t line = 1;
    int64_t column = 1;

    bool
    operator==(const Position& other) const {
        return line == other.line && column == other.column;
    }

    bool
    operator!=(const Position& other) const {
        return !(*this == other);
    }

    bool
    operator<(const Position& other) const {
        return line < other.line || (line == other.line && column < other.column);
    }

    bool
    operator<=(const Position& other) const {
        return !(other < *this);
    }
};

class InvalidSpan : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

// Column used by clipped spans that run to the end of a line.
const int64_t kLineEnd = std::numeric_limits<int64_t>::max();

// Half-open range [start, end) of positions.
class Span {
   public:
    Span() = default;

    // Throws InvalidSpan if end < start.
    Span(Position start, Position end);

    // (n,1)..(n+1,1)
    static Span
    line(int64_t n);

    // (first,1)..(last+1,1)
    static Span
    lines(int64_t first, int64_t last);

    const Position&
    start() const {
        return start_;
    }

    const Position&
    end() const {
        return end_;
    }

    bool
    is_empty() const {
        return start_ == end_;
    }

    bool
    contains(const Position& p) const;

    bool
    contains_span(const Span& other) const;

    bool
    intersects(const Span& other) const;

    // First and last line holding at least one position of the span. A span
    // ending at column 1 does not touch its end line.
    int64_t
    first_line() const {
        return start_.line;
    }

    int64_t
    last_line() const;

    // The part of the span that lies on line `n`. The end column is kLineEnd
    // when the span continues past the line. Returns an empty span at (n,1)
    // when there is no overlap.
    Span
    clip_to_line(int64_t n) const;

    bool
    operator==(const Span& other) const {
        return start_ == other.start_ && end_ == other.end_;
    }

    bool
    operator!=(const Span& other) const {
        return !(*this == other);
    }

    bool
    operator<(const Span& other) const {
        if (start_ != other.start_) {
            return start_ < other.start_;
        }
        return end_ < other.end_;
    }

   private:
    Position start_;
    Position end_;
};

// Sort by start and merge spans whose line ranges touch or overlap. The merged
// spans cover whole lines.
std::vector<Span>
union_adjacent_or_overlapping(std::vector<Span> spans);

std::string
repr(const Position& p);

std::string
repr(const Span& s);

}  // namespace yamlview
