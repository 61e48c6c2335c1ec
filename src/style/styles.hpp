#pragma once

#include "style/category.hpp"
#include "style/style.hpp"

#include <array>
#include <cstdint>
#include <utility>
#include <vector>

namespace yamlview {

using StyleOverride = std::pair<Category, Style>;

// Category to Style map with the inheritance walk resolved up front. Immutable
// after construction and safe to share between threads.
class Styles {
   public:
    Styles();

    // `base` is the Text style. A category without an override resolves to its
    // nearest overridden ancestor, or to `base`.
    explicit Styles(Style base, const std::vector<StyleOverride>& overrides = {});

    // New map with `overrides` applied on top of this one's overrides.
    Styles
    with(const std::vector<StyleOverride>& overrides) const;

    const Style&
    style(Category category) const {
        return *resolved_[static_cast<std::size_t>(category)];
    }

    // Shared so that equal resolutions have equal identity.
    const StylePtr&
    style_ptr(Category category) const {
        return resolved_[static_cast<std::size_t>(category)];
    }

    const Style&
    base() const {
        return base_;
    }

    // Categories with an explicit override, in insertion order.
    const std::vector<StyleOverride>&
    overrides() const {
        return overrides_;
    }

    // Unique per constructed map; copies share the id.
    uint64_t
    id() const {
        return id_;
    }

   private:
    Style base_;
    std::vector<StyleOverride> overrides_;
    std::array<StylePtr, kCategoryCount> resolved_;
    uint64_t id_ = 0;
};

}  // namespace yamlview
