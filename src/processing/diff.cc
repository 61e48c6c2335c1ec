#include "processing/diff.hpp"

#include "algorithms/myers_greedy.hpp"
#include "algorithms/myers_linear.hpp"
#include "util/hash.hpp"

#include <fmt/format.h>

#include <utility>

//#define LOCAL_DEBUG

using namespace yamlview;

namespace {

// Lines compare by checksum first; equal checksums still compare the text.
struct DiffLine {
    uint32_t checksum;
    const std::string* text;

    bool
    operator==(const DiffLine& other) const {
        return checksum == other.checksum && *text == *other.text;
    }
};

std::vector<DiffLine>
make_diff_lines(const std::vector<std::string>& lines) {
    std::vector<DiffLine> result;
    result.reserve(lines.size());
    for (const auto& line : lines) {
        result.push_back({line_checksum(line), &line});
    }
    return result;
}

EditScript
run_algorithm(const std::vector<std::string>& a, const std::vector<std::string>& b, DiffAlgorithm algorithm) {
    const auto a_lines = make_diff_lines(a);
    const auto b_lines = make_diff_lines(b);
    const DiffInput<DiffLine> input{gsl::span<const DiffLine>(a_lines), gsl::span<const DiffLine>(b_lines)};

    switch (algorithm) {
        case DiffAlgorithm::MyersLinear:
            return MyersLinear<DiffLine>(input).compute();
        case DiffAlgorithm::MyersGreedy:
            break;
    }
    return MyersGreedy<DiffLine>(input).compute();
}

// When several longest common subsequences exist the algorithms pick one
// depending on which side is A. The pair is always diffed in the same
// orientation and mirrored when needed, so diff(a, b) and diff(b, a) keep the
// same common lines.
EditScript
compute_script(const std::vector<std::string>& a, const std::vector<std::string>& b, DiffAlgorithm algorithm) {
    if (!(b < a)) {
        return run_algorithm(a, b, algorithm);
    }

    auto script = run_algorithm(b, a, algorithm);
    for (auto& edit : script) {
        std::swap(edit.a_index, edit.b_index);
        if (edit.type == EditType::Insert) {
            edit.type = EditType::Delete;
        } else if (edit.type == EditType::Delete) {
            edit.type = EditType::Insert;
        }
    }
    order_changes(script);
    return script;
}

std::optional<std::string>
view_name(const Source& origin, const Source& tip) {
    if (origin.name() && tip.name()) {
        return fmt::format("{} → {}", *origin.name(), *tip.name());
    }
    return std::nullopt;
}

// Collects the lines of a diff view in script order.
class ViewBuilder {
   public:
    ViewBuilder(const Source& origin, const Source& tip) : origin_(origin), tip_(tip) {}

    // Append the line an edit refers to; returns its line number in the view.
    int64_t
    add(const Edit& edit) {
        Line line;
        switch (edit.type) {
            case EditType::Common:
                line = origin_.line_at(edit.a_index + 1);
                line.number = tip_.line_at(edit.b_index + 1).number;
                line.flag = LineFlag::Default;
                break;
            case EditType::Delete:
                line = origin_.line_at(edit.a_index + 1);
                line.flag = LineFlag::Deleted;
                break;
            case EditType::Insert:
                line = tip_.line_at(edit.b_index + 1);
                line.flag = LineFlag::Inserted;
                break;
        }
        line.annotations.clear();
        line.hunk_start = false;

        const auto n = static_cast<int64_t>(lines_.size()) + 1;
        for (auto& segment : line.segments) {
            segment.span = Span({n, segment.span.start().column}, {n, segment.span.end().column});
        }
        lines_.push_back(std::move(line));
        return n;
    }

    Line&
    back() {
        return lines_.back();
    }

    SourcePtr
    finish() {
        const bool trailing_newline = tip_.empty() ? origin_.has_trailing_newline() : tip_.has_trailing_newline();
        const bool empty = lines_.empty();
        auto source = Source::from_prepared(std::move(lines_), view_name(origin_, tip_), trailing_newline && !empty);

        for (int64_t n = 1; n <= source->line_count(); n++) {
            switch (source->line_at(n).flag) {
                case LineFlag::Deleted:
                    source->add_overlay(Category::GenericDeleted, Span::line(n));
                    break;
                case LineFlag::Inserted:
                    source->add_overlay(Category::GenericInserted, Span::line(n));
                    break;
                case LineFlag::Default:
                    break;
            }
        }
        return source;
    }

   private:
    const Source& origin_;
    const Source& tip_;
    std::vector<Line> lines_;
};

}  // namespace

std::optional<DiffAlgorithm>
yamlview::diff_algorithm_from_name(const std::string& name) {
    if (name == "myers-greedy") {
        return DiffAlgorithm::MyersGreedy;
    }
    if (name == "myers-linear") {
        return DiffAlgorithm::MyersLinear;
    }
    return {};
}

const char*
yamlview::diff_algorithm_name(DiffAlgorithm algorithm) {
    switch (algorithm) {
        case DiffAlgorithm::MyersGreedy:
            return "myers-greedy";
        case DiffAlgorithm::MyersLinear:
            return "myers-linear";
    }
    return "?";
}

std::vector<DiffEvent>
yamlview::diff_lines(const std::vector<std::string>& a, const std::vector<std::string>& b, DiffAlgorithm algorithm) {
    std::vector<DiffEvent> events;
    for (const auto& edit : compute_script(a, b, algorithm)) {
        switch (edit.type) {
            case EditType::Common:
                events.push_back({DiffOp::Equal, edit.a_index + 1, edit.b_index + 1});
                break;
            case EditType::Delete:
                events.push_back({DiffOp::Delete, edit.a_index + 1, 0});
                break;
            case EditType::Insert:
                events.push_back({DiffOp::Insert, 0, edit.b_index + 1});
                break;
        }
    }
    return events;
}

DiffView
yamlview::full_diff(const Source& origin, const Source& tip, const DiffOptions& options) {
    const auto script = compute_script(origin.texts(), tip.texts(), options.algorithm);

    ViewBuilder builder(origin, tip);
    for (const auto& edit : script) {
        builder.add(edit);
    }

    DiffView view;
    view.source = builder.finish();
    return view;
}

DiffView
yamlview::summary_diff(const Source& origin, const Source& tip, int64_t context_lines, const DiffOptions& options) {
    const auto script = compute_script(origin.texts(), tip.texts(), options.algorithm);

    DiffView view;
    view.hunks = compose_hunks(script, context_lines);

    ViewBuilder builder(origin, tip);
    for (const auto& hunk : view.hunks) {
        int64_t first_changed = 0;
        int64_t last_changed = 0;
        for (auto i = hunk.first_edit; i <= hunk.last_edit; i++) {
            const int64_t n = builder.add(script[i]);
            if (i == hunk.first_edit) {
                builder.back().hunk_start = true;
                if (options.hunk_headers) {
                    builder.back().annotations.push_back({hunk_header(hunk), 1, Annotation::Placement::Above});
                }
            }
            if (script[i].type != EditType::Common) {
                if (first_changed == 0) {
                    first_changed = n;
                }
                last_changed = n;
            }
        }
        assert(first_changed > 0);
        view.highlight_ranges.push_back(Span::lines(first_changed, last_changed));
    }

#ifdef LOCAL_DEBUG
    fmt::print("summary_diff: {} edits, {} hunks\n", script.size(), view.hunks.size());
#endif

    view.source = builder.finish();
    return view;
}

DiffView
yamlview::full_diff(const Revision& from, const Revision& to, const DiffOptions& options) {
    return full_diff(*from.source(), *to.source(), options);
}

DiffView
yamlview::summary_diff(const Revision& from, const Revision& to, int64_t context_lines, const DiffOptions& options) {
    return summary_diff(*from.source(), *to.source(), context_lines, options);
}
