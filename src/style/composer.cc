#include "style/composer.hpp"

using namespace yamlview;

//#define LOCAL_DEBUG
#ifdef LOCAL_DEBUG
#include <fmt/format.h>
#endif

namespace {

Style::Transform
compose_transforms(const Style::Transform& base, const Style::Transform& overlay) {
    if (!base) {
        return overlay;
    }
    if (!overlay) {
        return base;
    }
    return [base, overlay](const std::string& text) { return overlay(base(text)); };
}

Style
compose(const Style& base, const Style& overlay, Color (*mix)(const Color&, const Color&)) {
    Style result;
    result.fg = mix(base.fg, overlay.fg);
    result.bg = mix(base.bg, overlay.bg);
    result.attr = base.attr | overlay.attr;
    result.transform = compose_transforms(base.transform, overlay.transform);
    return result;
}

}  // namespace

Style
yamlview::override_styles(const Style& base, const Style& overlay) {
    return compose(base, overlay, override_color);
}

Style
yamlview::blend_styles(const Style& base, const Style& overlay) {
    return compose(base, overlay, blend_colors);
}

StylePtr
Composer::blend(const StylePtr& base, const StylePtr& overlay, bool override_colors, uint64_t styles_id) {
    if (!overlay || overlay->empty()) {
        return base;
    }
    if (!base) {
        return overlay;
    }

    const Key key{base.get(), overlay.get(), override_colors, styles_id};

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = cache_.find(key); it != cache_.end()) {
        return it->second.result;
    }

    auto result = std::make_shared<const Style>(override_colors ? override_styles(*base, *overlay)
                                                                : blend_styles(*base, *overlay));
#ifdef LOCAL_DEBUG
    fmt::print("composer: {} + {} -> {}\n", repr(*base), repr(*overlay), repr(*result));
#endif
    cache_.emplace(key, Entry{base, overlay, result});
    return result;
}

std::size_t
Composer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void
Composer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}
