#pragma once

// Greedy version of Myers difference algorithm; O((M+N) D) in time and space.

#include "algorithms/algorithm.hpp"
#include "util/bipolar_array.hpp"

#include <algorithm>
#include <limits>

namespace yamlview {

template <typename Unit>
class MyersGreedy : public Algorithm<Unit> {
   public:
    using Algorithm<Unit>::Algorithm;

   protected:
    EditScript
    diff() override {
        // Snapshots of V are copied once per edit step; keep them narrow.
        const int64_t larger = std::max(this->size_a(), this->size_b());
        if (larger < std::numeric_limits<uint8_t>::max()) {
            return solve<uint8_t>();
        } else if (larger < std::numeric_limits<uint16_t>::max()) {
            return solve<uint16_t>();
        } else if (larger < std::numeric_limits<uint32_t>::max()) {
            return solve<uint32_t>();
        }
        return solve<int64_t>();
    }

   private:
    template <typename Index>
    EditScript
    solve() {
        std::vector<BipolarArray<Index>> trace;
        walk_forward(trace);
        return backtrack(trace);
    }

    // Furthest reaching x per diagonal, one snapshot per edit distance.
    template <typename Index>
    void
    walk_forward(std::vector<BipolarArray<Index>>& trace) {
        const int64_t N = this->size_a();
        const int64_t M = this->size_b();
        const int64_t max = N + M;

        BipolarArray<Index> v{-max, max};
        v[1] = 0;
        for (int64_t d = 0; d <= max; d++) {
            for (int64_t k = -d; k <= d; k += 2) {
                int64_t x = 0;
                if (k == -d || (k != d && v[k - 1] < v[k + 1])) {
                    // Down
                    x = static_cast<int64_t>(v[k + 1]);
                } else {
                    // Right
                    x = static_cast<int64_t>(v[k - 1]) + 1;
                }
                int64_t y = x - k;

                while (x < N && y < M && this->equal(x, y)) {
                    ++x;
                    ++y;
                }

                v[k] = static_cast<Index>(x);

                if (x >= N && y >= M) {
                    trace.push_back(v);
                    return;
                }
            }
            trace.push_back(v);
        }
        assert(0 && "edit distance exceeds N + M");
    }

    template <typename Index>
    EditScript
    backtrack(const std::vector<BipolarArray<Index>>& trace) {
        EditScript script;

        int64_t x = this->size_a();
        int64_t y = this->size_b();
        for (auto d = static_cast<int64_t>(trace.size()); d--;) {
            const auto& v = trace[static_cast<std::size_t>(d)];

            const int64_t k = x - y;
            const int64_t prev_k = (k == -d || (k != d && v[k - 1] < v[k + 1])) ? k + 1 : k - 1;
            const auto prev_x = static_cast<int64_t>(v[prev_k]);
            const int64_t prev_y = prev_x - prev_k;

            while (x > prev_x && y > prev_y) {
                script.push_back({EditType::Common, x - 1, y - 1});
                x--;
                y--;
            }

            if (d > 0) {
                if (x == prev_x) {
                    script.push_back({EditType::Insert, {}, prev_y});
                } else {
                    script.push_back({EditType::Delete, prev_x, {}});
                }
            }

            x = prev_x;
            y = prev_y;
        }

        std::reverse(script.begin(), script.end());
        return script;
    }
};

}  // namespace yamlview
