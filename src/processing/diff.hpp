#pragma once

/*
    Line diffs between two sources.

    The result of a diff is itself a Source: unchanged lines, deleted lines
    from the origin and inserted lines from the tip, in script order. Changed
    lines carry GenericDeleted / GenericInserted overlays and line flags, so a
    Printer renders them without knowing about diffs.
*/

#include "algorithms/algorithm.hpp"
#include "processing/diff_hunk.hpp"
#include "processing/position.hpp"
#include "processing/revision.hpp"
#include "processing/source.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace yamlview {

enum class DiffAlgorithm {
    MyersGreedy,
    MyersLinear,
};

// "myers-greedy" or "myers-linear".
std::optional<DiffAlgorithm>
diff_algorithm_from_name(const std::string& name);

const char*
diff_algorithm_name(DiffAlgorithm algorithm);

struct DiffOptions {
    DiffAlgorithm algorithm = DiffAlgorithm::MyersGreedy;

    // Annotate the first line of each summary hunk with "@@ -a,b +c,d @@".
    bool hunk_headers = false;
};

enum class DiffOp { Equal, Delete, Insert };

struct DiffEvent {
    DiffOp op = DiffOp::Equal;

    // 1-based; 0 on the side the event does not touch.
    int64_t a_line = 0;
    int64_t b_line = 0;

    bool
    operator==(const DiffEvent& other) const {
        return op == other.op && a_line == other.a_line && b_line == other.b_line;
    }
};

// Edit script between two line lists. Within a run of changes deletions come
// first.
std::vector<DiffEvent>
diff_lines(const std::vector<std::string>& a,
           const std::vector<std::string>& b,
           DiffAlgorithm algorithm = DiffAlgorithm::MyersGreedy);

struct DiffView {
    SourcePtr source;

    // Changed lines of each hunk, in the coordinates of `source`. Empty for a
    // full diff.
    std::vector<Span> highlight_ranges;

    std::vector<Hunk> hunks;
};

// Every line of both sides.
DiffView
full_diff(const Source& origin, const Source& tip, const DiffOptions& options = {});

// Only changed lines with up to `context_lines` unchanged lines around them.
// Each hunk's first line is flagged as a hunk start.
DiffView
summary_diff(const Source& origin, const Source& tip, int64_t context_lines, const DiffOptions& options = {});

DiffView
full_diff(const Revision& from, const Revision& to, const DiffOptions& options = {});

DiffView
summary_diff(const Revision& from, const Revision& to, int64_t context_lines, const DiffOptions& options = {});

}  // namespace yamlview
