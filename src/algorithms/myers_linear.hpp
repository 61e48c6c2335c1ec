#pragma once

// Linear space version of Myers difference algorithm. Finds the middle snake of
// the edit graph and recurses on both halves. O((M+N) D) in time.
// https://blog.jcoglan.com/2017/04/25/myers-diff-in-linear-space-implementation/

#include "algorithms/algorithm.hpp"
#include "util/bipolar_array.hpp"

#include <optional>

namespace yamlview {

template <typename Unit>
class MyersLinear : public Algorithm<Unit> {
   public:
    using Algorithm<Unit>::Algorithm;

   protected:
    EditScript
    diff() override {
        std::vector<Coordinate> path;
        if (!find_path({0, 0, this->size_a(), this->size_b()}, path)) {
            return {};
        }
        return walk_snakes(path);
    }

   private:
    struct Box {
        int64_t left;
        int64_t top;
        int64_t right;
        int64_t bottom;

        int64_t
        width() const {
            return right - left;
        }

        int64_t
        height() const {
            return bottom - top;
        }

        int64_t
        size() const {
            return width() + height();
        }

        int64_t
        delta() const {
            return width() - height();
        }
    };

    static bool
    is_odd(int64_t v) {
        return (v & 1) == 1;
    }

    static bool
    is_between(int64_t v, int64_t low, int64_t high) {
        return v >= low && v <= high;
    }

    // Corner points of the path through `box`, in order.
    bool
    find_path(const Box& box, std::vector<Coordinate>& out) {
        assert(box.left >= 0 && box.top >= 0);

        auto snake = midpoint(box);
        if (!snake) {
            return false;
        }

        const auto start = snake->from;
        const auto finish = snake->to;

        const bool head = find_path({box.left, box.top, start.x, start.y}, out);
        if (!head) {
            out.push_back(start);
        }

        const bool tail = find_path({finish.x, finish.y, box.right, box.bottom}, out);
        if (!tail) {
            out.push_back(finish);
        }
        return true;
    }

    std::optional<Move>
    midpoint(const Box& box) {
        if (box.size() == 0) {
            return std::nullopt;
        }

        const int64_t max = 1 + ((box.size() - 1) / 2);

        BipolarArray<int64_t> vf{-max, max};
        vf[1] = box.left;

        BipolarArray<int64_t> vb{-max, max};
        vb[1] = box.bottom;

        for (int64_t d = 0; d <= max; d++) {
            if (auto m = forwards(box, vf, vb, d)) {
                return m;
            }
            if (auto m = backwards(box, vf, vb, d)) {
                return m;
            }
        }
        return std::nullopt;
    }

    std::optional<Move>
    forwards(const Box& box, BipolarArray<int64_t>& vf, const BipolarArray<int64_t>& vb, int64_t d) {
        for (int64_t k = d; k >= -d; k -= 2) {
            const int64_t c = k - box.delta();

            int64_t px = 0;
            int64_t x = 0;
            if (k == -d || (k != d && vf[k - 1] < vf[k + 1])) {
                px = vf[k + 1];
                x = px;
            } else {
                px = vf[k - 1];
                x = px + 1;
            }

            int64_t y = box.top + (x - box.left) - k;
            const int64_t py = (d == 0 || x != px) ? y : y - 1;

            while (x < box.right && y < box.bottom && this->equal(x, y)) {
                x++;
                y++;
            }

            vf[k] = x;

            if (is_odd(box.delta()) && is_between(c, -(d - 1), d - 1) && y >= vb[c]) {
                return Move{{px, py}, {x, y}};
            }
        }
        return std::nullopt;
    }

    std::optional<Move>
    backwards(const Box& box, const BipolarArray<int64_t>& vf, BipolarArray<int64_t>& vb, int64_t d) {
        for (int64_t c = d; c >= -d; c -= 2) {
            const int64_t k = c + box.delta();

            int64_t py = 0;
            int64_t y = 0;
            if (c == -d || (c != d && vb[c - 1] > vb[c + 1])) {
                py = vb[c + 1];
                y = py;
            } else {
                py = vb[c - 1];
                y = py - 1;
            }

            int64_t x = box.left + (y - box.top) + k;
            const int64_t px = (d == 0 || y != py) ? x : x + 1;

            while (x > box.left && y > box.top && this->equal(x - 1, y - 1)) {
                x--;
                y--;
            }

            vb[c] = y;

            if (!is_odd(box.delta()) && is_between(k, -d, d) && x <= vf[k]) {
                return Move{{x, y}, {px, py}};
            }
        }
        return std::nullopt;
    }

    // Expand corner points into single steps.
    EditScript
    walk_snakes(const std::vector<Coordinate>& path) {
        EditScript script;
        for (std::size_t i = 0; i + 1 < path.size(); i++) {
            const Coordinate to = path[i + 1];
            Coordinate from = walk_diagonal(path[i], to, script);

            const int64_t dx = to.x - from.x;
            const int64_t dy = to.y - from.y;
            if (dx < dy) {
                script.push_back({EditType::Insert, {}, from.y});
                from.y++;
            } else if (dx > dy) {
                script.push_back({EditType::Delete, from.x, {}});
                from.x++;
            }

            walk_diagonal(from, to, script);
        }
        return script;
    }

    Coordinate
    walk_diagonal(Coordinate from, const Coordinate& to, EditScript& script) {
        while (from.x < to.x && from.y < to.y && this->equal(from.x, from.y)) {
            script.push_back({EditType::Common, from.x, from.y});
            from.x++;
            from.y++;
        }
        return from;
    }
};

}  // namespace yamlview
