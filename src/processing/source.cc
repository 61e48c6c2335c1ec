#include "processing/source.hpp"

#include "util/utf8decode.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace yamlview;

namespace {

// Byte offset of 1-based `column` in `text`, clamped to the end of the line.
std::size_t
column_offset(const std::string& text, int64_t column) {
    if (column <= 1) {
        return 0;
    }
    return utf8_advance_by(text, 0, static_cast<std::size_t>(column - 1));
}

Span
shift_lines(const Span& span, int64_t delta) {
    return Span({span.start().line + delta, span.start().column}, {span.end().line + delta, span.end().column});
}

}  // namespace

std::shared_ptr<Source>
Source::from_string(const std::string& text, SourceOptions options) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            nl = text.size();
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }

    auto source = from_lines(std::move(lines), std::move(options));
    source->trailing_newline_ = !text.empty() && text.back() == '\n';
    return source;
}

std::shared_ptr<Source>
Source::from_lines(std::vector<std::string> lines, SourceOptions options) {
    auto source = std::make_shared<Source>();
    source->name_ = std::move(options.name);
    source->lines_.reserve(lines.size());

    int64_t number = 1;
    for (auto& text : lines) {
        if (options.strip_carriage_returns && !text.empty() && text.back() == '\r') {
            text.pop_back();
        }
        Line line;
        line.text = std::move(text);
        line.number = number++;
        source->lines_.push_back(std::move(line));
    }
    return source;
}

std::shared_ptr<Source>
Source::from_prepared(std::vector<Line> lines, std::optional<std::string> name, bool trailing_newline) {
    auto source = std::make_shared<Source>();
    source->name_ = std::move(name);
    source->lines_ = std::move(lines);
    source->trailing_newline_ = trailing_newline;
    return source;
}

const Line&
Source::line_at(int64_t n) const {
    if (n < 1 || n > line_count()) {
        throw std::out_of_range(fmt::format("line {} is outside 1..{}", n, line_count()));
    }
    return lines_[static_cast<std::size_t>(n - 1)];
}

Line&
Source::mutable_line(int64_t n) {
    if (n < 1 || n > line_count()) {
        throw std::out_of_range(fmt::format("line {} is outside 1..{}", n, line_count()));
    }
    return lines_[static_cast<std::size_t>(n - 1)];
}

const std::string&
Source::line(int64_t n) const {
    return line_at(n).text;
}

std::vector<std::string>
Source::texts() const {
    std::vector<std::string> result;
    result.reserve(lines_.size());
    for (const auto& line : lines_) {
        result.push_back(line.text);
    }
    return result;
}

std::string
Source::content() const {
    std::string result;
    for (std::size_t i = 0; i < lines_.size(); i++) {
        if (i > 0) {
            result.push_back('\n');
        }
        result += lines_[i].text;
    }
    if (trailing_newline_) {
        result.push_back('\n');
    }
    return result;
}

std::string
Source::substring(const Span& span) const {
    std::string result;
    const int64_t first = std::max<int64_t>(span.first_line(), 1);
    const int64_t last = std::min(span.last_line(), line_count());

    for (int64_t n = first; n <= last; n++) {
        const auto clipped = span.clip_to_line(n);
        const std::string& text = line(n);
        if (n > first) {
            result.push_back('\n');
        }
        if (clipped.is_empty()) {
            continue;
        }
        auto start = column_offset(text, clipped.start().column);
        auto end = clipped.end().column == kLineEnd ? text.size() : column_offset(text, clipped.end().column);
        if (end > start) {
            result += text.substr(start, end - start);
        }
    }
    return result;
}

void
Source::classify() {
    classify(YamlClassifier());
}

void
Source::classify(const Classifier& classifier) {
    attach_segments(classifier.classify(texts()));
}

void
Source::attach_segments(std::vector<Segment> segments) {
    std::vector<std::vector<Segment>> per_line(lines_.size());

    for (auto& segment : segments) {
        const auto& span = segment.span;
        const int64_t n = span.start().line;
        if (span.end().line != n) {
            throw SegmentOverlap(fmt::format("segment {} spans more than one line", repr(span)));
        }
        if (n < 1 || n > line_count()) {
            throw SegmentOverlap(fmt::format("segment {} is outside 1..{}", repr(span), line_count()));
        }
        const int64_t line_end = utf8_len(lines_[n - 1].text) + 1;
        if (span.start().column < 1 || span.end().column > line_end) {
            throw SegmentOverlap(fmt::format("segment {} is outside its line", repr(span)));
        }
        if (span.is_empty()) {
            continue;
        }
        per_line[n - 1].push_back(std::move(segment));
    }

    for (std::size_t i = 0; i < per_line.size(); i++) {
        auto& line_segments = per_line[i];
        std::sort(line_segments.begin(), line_segments.end(), [](const Segment& a, const Segment& b) {
            return a.span < b.span;
        });
        for (std::size_t k = 1; k < line_segments.size(); k++) {
            if (line_segments[k - 1].span.intersects(line_segments[k].span)) {
                throw SegmentOverlap(fmt::format("segments {} and {} overlap",
                                                 repr(line_segments[k - 1].span),
                                                 repr(line_segments[k].span)));
            }
        }
    }

    for (std::size_t i = 0; i < per_line.size(); i++) {
        lines_[i].segments = std::move(per_line[i]);
    }
}

void
Source::add_overlay(Category category, const Span& span) {
    if (lines_.empty() || span.is_empty()) {
        return;
    }

    const Position lowest{1, 1};
    const Position highest{line_count() + 1, 1};
    if (span.end() <= lowest || highest <= span.start()) {
        return;
    }

    const Position start = std::max(span.start(), lowest);
    const Position end = std::min(span.end(), highest);
    if (end <= start) {
        return;
    }
    overlays_.push_back({category, Span(start, end)});
}

void
Source::add_overlay(Category category, const std::vector<Span>& spans) {
    for (const auto& span : spans) {
        add_overlay(category, span);
    }
}

void
Source::annotate(int64_t n, Annotation annotation) {
    mutable_line(n).annotations.push_back(std::move(annotation));
}

void
Source::set_flag(int64_t n, LineFlag flag) {
    mutable_line(n).flag = flag;
}

void
Source::set_hunk_start(int64_t n, bool hunk_start) {
    mutable_line(n).hunk_start = hunk_start;
}

std::shared_ptr<Source>
Source::slice(int64_t first, int64_t last) const {
    first = std::max<int64_t>(first, 1);
    last = std::min(last, line_count());

    auto result = std::make_shared<Source>();
    result->name_ = name_;
    if (first > last) {
        return result;
    }

    const int64_t delta = -(first - 1);
    for (int64_t n = first; n <= last; n++) {
        Line copy = lines_[static_cast<std::size_t>(n - 1)];
        for (auto& segment : copy.segments) {
            segment.span = shift_lines(segment.span, delta);
        }
        result->lines_.push_back(std::move(copy));
    }
    result->trailing_newline_ = trailing_newline_ && last == line_count();

    const Span window = Span::lines(first, last);
    for (const auto& overlay : overlays_) {
        if (!overlay.span.intersects(window)) {
            continue;
        }
        const Position start = std::max(overlay.span.start(), window.start());
        const Position end = std::min(overlay.span.end(), window.end());
        result->overlays_.push_back({overlay.category, shift_lines(Span(start, end), delta)});
    }
    return result;
}
