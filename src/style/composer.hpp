#pragma once

#include "style/style.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <tuple>

namespace yamlview {

// Colors: the overlay color if visible, else the base color. Attributes are
// unioned. Transforms compose as overlay(base(text)).
Style
override_styles(const Style& base, const Style& overlay);

// Like override_styles, except that two visible colors are mixed in LAB space.
Style
blend_styles(const Style& base, const Style& overlay);

// Memoizes style composition so that repeated requests for the same pair of
// style objects return the same result object. Safe for concurrent use.
class Composer {
   public:
    // Null or empty overlays return `base`, a null base returns `overlay`.
    // `styles_id` keeps results computed for different Styles maps apart.
    StylePtr
    blend(const StylePtr& base, const StylePtr& overlay, bool override_colors, uint64_t styles_id = 0);

    std::size_t
    size() const;

    void
    clear();

   private:
    using Key = std::tuple<const Style*, const Style*, bool, uint64_t>;

    struct Entry {
        // Held so that the key addresses can not be reused while cached.
        StylePtr base;
        StylePtr overlay;
        StylePtr result;
    };

    mutable std::mutex mutex_;
    std::map<Key, Entry> cache_;
};

}  // namespace yamlview
