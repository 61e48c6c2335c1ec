#pragma once

// Common interface of the line diff algorithms. An algorithm turns two spans
// of comparable units into an edit script that rewrites A into B.

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <vector>

namespace yamlview {

struct Coordinate {
    int64_t x;
    int64_t y;
};

struct Move {
    Coordinate from;
    Coordinate to;
};

enum class EditType {
    Delete,
    Insert,
    Common,
};

// Index into A or B. Invalid for the side an edit does not touch.
struct EditIndex {
    bool valid;
    int64_t value;

    EditIndex() : valid(false), value(0) {}

    EditIndex(int64_t in_value) : valid(true), value(in_value) {}

    operator int64_t() const {
        return value;
    }
};

struct Edit {
    EditType type;

    EditIndex a_index;
    EditIndex b_index;
};

using EditScript = std::vector<Edit>;

template <typename Unit>
struct DiffInput {
    gsl::span<const Unit> A;
    gsl::span<const Unit> B;
};

// Reorder each run of changes so that its deletions precede its insertions.
// The script stays valid since A and B indices keep their relative order.
inline void
order_changes(EditScript& script) {
    auto it = script.begin();
    while (it != script.end()) {
        if (it->type == EditType::Common) {
            ++it;
            continue;
        }
        auto run_end = std::find_if(it, script.end(), [](const Edit& e) { return e.type == EditType::Common; });
        std::stable_partition(it, run_end, [](const Edit& e) { return e.type == EditType::Delete; });
        it = run_end;
    }
}

template <typename Unit>
class Algorithm {
   public:
    explicit Algorithm(const DiffInput<Unit>& input) : input_(input) {}

    virtual ~Algorithm() = default;

    // Minimal edit script for A -> B. Inputs without changes give a script of
    // Common edits only.
    EditScript
    compute() {
        const auto N = static_cast<int64_t>(input_.A.size());
        const auto M = static_cast<int64_t>(input_.B.size());

        EditScript script;
        if (N == 0 || M == 0) {
            for (int64_t i = 0; i < N; i++) {
                script.push_back({EditType::Delete, i, {}});
            }
            for (int64_t i = 0; i < M; i++) {
                script.push_back({EditType::Insert, {}, i});
            }
            return script;
        }

        script = diff();
        order_changes(script);
        return script;
    }

   protected:
    // Only called with two non-empty inputs.
    virtual EditScript
    diff() = 0;

    bool
    equal(int64_t x, int64_t y) const {
        return input_.A[static_cast<std::size_t>(x)] == input_.B[static_cast<std::size_t>(y)];
    }

    int64_t
    size_a() const {
        return static_cast<int64_t>(input_.A.size());
    }

    int64_t
    size_b() const {
        return static_cast<int64_t>(input_.B.size());
    }

    DiffInput<Unit> input_;
};

}  // namespace yamlview
