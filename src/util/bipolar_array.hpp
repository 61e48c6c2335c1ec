#pragma once

#include <cassert>
#include <cstdint>
#include <vector>

namespace yamlview {

// Array indexed by the diagonals -D..D of an edit graph. Myers keeps one of
// these per edit distance when backtracking, so copies must stay cheap.
template <typename Type>
class BipolarArray {
   public:
    BipolarArray(int64_t min, int64_t max) : min_(min), max_(max) {
        assert(max >= min);
        values_.assign(static_cast<std::size_t>(max - min + 1), Type{});
    }

    Type&
    operator[](int64_t k) {
        assert(k >= min_ && k <= max_);
        return values_[static_cast<std::size_t>(k - min_)];
    }

    const Type&
    operator[](int64_t k) const {
        assert(k >= min_ && k <= max_);
        return values_[static_cast<std::size_t>(k - min_)];
    }

    int64_t
    min() const {
        return min_;
    }

    int64_t
    max() const {
        return max_;
    }

   private:
    int64_t min_;
    int64_t max_;
    std::vector<Type> values_;
};

}  // namespace yamlview
