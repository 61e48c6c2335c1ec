#include "processing/diff_hunk.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace yamlview;

namespace {

struct HunkRange {
    int64_t start;
    int64_t end;
};

// Ranges of consecutive deletions and insertions, inclusive.
std::vector<HunkRange>
find_change_ranges(const EditScript& edit_script) {
    std::vector<HunkRange> ranges;
    const auto size = static_cast<int64_t>(edit_script.size());

    int64_t i = 0;
    while (i < size) {
        if (edit_script[static_cast<std::size_t>(i)].type == EditType::Common) {
            i++;
            continue;
        }
        int64_t end = i;
        while (end + 1 < size && edit_script[static_cast<std::size_t>(end + 1)].type != EditType::Common) {
            end++;
        }
        ranges.push_back({i, end});
        i = end + 1;
    }
    return ranges;
}

// Join ranges that share context and pad each with context lines.
std::vector<HunkRange>
extend_ranges(const std::vector<HunkRange>& change_ranges, int64_t edit_count, int64_t context_size) {
    std::vector<HunkRange> joined;
    for (const auto& range : change_ranges) {
        // Separated by at most 2 * context common units.
        if (!joined.empty() && range.start - joined.back().end - 1 <= context_size * 2) {
            joined.back().end = range.end;
        } else {
            joined.push_back(range);
        }
    }

    for (auto& range : joined) {
        range.start = std::max<int64_t>(0, range.start - context_size);
        range.end = std::min(edit_count - 1, range.end + context_size);
    }
    return joined;
}

}  // namespace

std::vector<Hunk>
yamlview::compose_hunks(const EditScript& edit_script, int64_t context_size) {
    context_size = std::max<int64_t>(context_size, 0);

    const auto ranges =
        extend_ranges(find_change_ranges(edit_script), static_cast<int64_t>(edit_script.size()), context_size);

    std::vector<Hunk> hunks;
    std::size_t next = 0;
    int64_t a_before = 0;
    int64_t b_before = 0;
    for (const auto& range : ranges) {
        // Count the lines consumed ahead of the hunk.
        for (; next < static_cast<std::size_t>(range.start); next++) {
            const auto type = edit_script[next].type;
            a_before += type != EditType::Insert ? 1 : 0;
            b_before += type != EditType::Delete ? 1 : 0;
        }

        Hunk hunk;
        hunk.first_edit = static_cast<std::size_t>(range.start);
        hunk.last_edit = static_cast<std::size_t>(range.end);
        for (auto i = hunk.first_edit; i <= hunk.last_edit; i++) {
            switch (edit_script[i].type) {
                case EditType::Insert:
                    hunk.to_count++;
                    break;
                case EditType::Delete:
                    hunk.from_count++;
                    break;
                case EditType::Common:
                    hunk.from_count++;
                    hunk.to_count++;
                    break;
            }
        }
        hunk.from_start = hunk.from_count > 0 ? a_before + 1 : a_before;
        hunk.to_start = hunk.to_count > 0 ? b_before + 1 : b_before;
        hunks.push_back(hunk);
    }

    return hunks;
}

std::string
yamlview::hunk_header(const Hunk& hunk) {
    return fmt::format("@@ -{},{} +{},{} @@", hunk.from_start, hunk.from_count, hunk.to_start, hunk.to_count);
}
