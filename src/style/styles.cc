#include "style/styles.hpp"

#include <atomic>
#include <cassert>

using namespace yamlview;

namespace {

std::atomic<uint64_t> g_next_styles_id{1};

}  // namespace

Styles::Styles() : Styles(Style{}) {}

Styles::Styles(Style base, const std::vector<StyleOverride>& overrides) : base_(std::move(base)) {
    std::array<StylePtr, kCategoryCount> explicit_styles;

    // Last override for a category wins.
    for (const auto& [category, style] : overrides) {
        auto index = static_cast<std::size_t>(category);
        explicit_styles[index] = std::make_shared<const Style>(style);

        bool replaced = false;
        for (auto& entry : overrides_) {
            if (entry.first == category) {
                entry.second = style;
                replaced = true;
            }
        }
        if (!replaced) {
            overrides_.emplace_back(category, style);
        }
    }

    if (!explicit_styles[0]) {
        explicit_styles[0] = std::make_shared<const Style>(base_);
    }

    // Parents are always declared before their children, so a single forward
    // pass resolves every chain.
    for (std::size_t i = 0; i < kCategoryCount; i++) {
        if (explicit_styles[i]) {
            resolved_[i] = explicit_styles[i];
            continue;
        }
        auto parent = static_cast<std::size_t>(category_parent(static_cast<Category>(i)));
        assert(parent < i);
        resolved_[i] = resolved_[parent];
    }

    id_ = g_next_styles_id.fetch_add(1);
}

Styles
Styles::with(const std::vector<StyleOverride>& overrides) const {
    std::vector<StyleOverride> merged = overrides_;
    merged.insert(merged.end(), overrides.begin(), overrides.end());
    return Styles(base_, merged);
}
