#pragma once

#include "processing/classifier.hpp"
#include "processing/position.hpp"
#include "style/category.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace yamlview {

enum class LineFlag : uint8_t { Default, Inserted, Deleted };

struct Annotation {
    enum class Placement : uint8_t { Above, Below };

    std::string content;

    // Column the annotation points at; used by Below annotations.
    int64_t column = 1;

    Placement placement = Placement::Below;
};

struct Line {
    std::string text;

    // Number shown in gutters. Kept when lines are sliced or diffed.
    int64_t number = 0;

    LineFlag flag = LineFlag::Default;

    // First line of a diff hunk.
    bool hunk_start = false;

    std::vector<Annotation> annotations;

    // Classified segments, sorted and non-overlapping. Empty when the line
    // has not been classified.
    std::vector<Segment> segments;
};

struct Overlay {
    Category category;
    Span span;
};

struct SourceOptions {
    std::optional<std::string> name;

    // Drop a CR that ends a line. When kept it renders as a control picture.
    bool strip_carriage_returns = false;
};

class SegmentOverlap : public std::logic_error {
   public:
    using std::logic_error::logic_error;
};

// Line addressed text with classification and overlay ranges. Lines are
// numbered 1..N.
class Source {
   public:
    Source() = default;

    // Splits on LF. A trailing LF terminates the last line rather than
    // starting an empty one.
    static std::shared_ptr<Source>
    from_string(const std::string& text, SourceOptions options = {});

    static std::shared_ptr<Source>
    from_lines(std::vector<std::string> lines, SourceOptions options = {});

    // Takes prepared lines as they are, numbers and flags included.
    static std::shared_ptr<Source>
    from_prepared(std::vector<Line> lines, std::optional<std::string> name, bool trailing_newline);

    const std::optional<std::string>&
    name() const {
        return name_;
    }

    void
    set_name(std::optional<std::string> name) {
        name_ = std::move(name);
    }

    int64_t
    line_count() const {
        return static_cast<int64_t>(lines_.size());
    }

    bool
    empty() const {
        return lines_.empty();
    }

    // Text of line `n`. Throws std::out_of_range.
    const std::string&
    line(int64_t n) const;

    // Line `n` with its metadata. Throws std::out_of_range.
    const Line&
    line_at(int64_t n) const;

    const std::vector<Line>&
    lines() const {
        return lines_;
    }

    std::vector<std::string>
    texts() const;

    bool
    has_trailing_newline() const {
        return trailing_newline_;
    }

    // The text the source was built from.
    std::string
    content() const;

    // Text covered by `span`; lines are joined with LF. Parts outside the
    // source are ignored.
    std::string
    substring(const Span& span) const;

    // Classify with the YAML classifier.
    void
    classify();

    void
    classify(const Classifier& classifier);

    // Replace all classification. Throws SegmentOverlap if a segment spans
    // lines, falls outside its line or overlaps another.
    void
    attach_segments(std::vector<Segment> segments);

    const std::vector<Segment>&
    segments(int64_t n) const {
        return line_at(n).segments;
    }

    // Overlays are clipped to the lines of the source; overlays that miss the
    // source entirely are dropped.
    void
    add_overlay(Category category, const Span& span);

    void
    add_overlay(Category category, const std::vector<Span>& spans);

    const std::vector<Overlay>&
    overlays() const {
        return overlays_;
    }

    void
    clear_overlays() {
        overlays_.clear();
    }

    void
    annotate(int64_t n, Annotation annotation);

    void
    set_flag(int64_t n, LineFlag flag);

    void
    set_hunk_start(int64_t n, bool hunk_start);

    // Inclusive line range as a new source. The range is clipped; overlays
    // move into the new line numbering, display numbers stay.
    std::shared_ptr<Source>
    slice(int64_t first, int64_t last) const;

   private:
    Line&
    mutable_line(int64_t n);

    std::optional<std::string> name_;
    std::vector<Line> lines_;
    std::vector<Overlay> overlays_;
    bool trailing_newline_ = false;
};

using SourcePtr = std::shared_ptr<Source>;

}  // namespace yamlview
