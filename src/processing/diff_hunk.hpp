#pragma once

/*
    Compose diff hunks out of an edit script.

    A hunk is a run of changes padded with up to `context_size` common units on
    either side. Runs separated by at most twice the context are joined.
*/

#include "algorithms/algorithm.hpp"

#include <string>

namespace yamlview {

struct Hunk {
    // 1-based, unified diff convention: when a count is zero the start is the
    // line before the change.
    int64_t from_start = 0;
    int64_t from_count = 0;
    int64_t to_start = 0;
    int64_t to_count = 0;

    // Inclusive range of the edit script covered by the hunk.
    std::size_t first_edit = 0;
    std::size_t last_edit = 0;
};

std::vector<Hunk>
compose_hunks(const EditScript& edit_script, int64_t context_size);

// "@@ -1,3 +1,4 @@"
std::string
hunk_header(const Hunk& hunk);

}  // namespace yamlview
