#include "style/theme.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>

using namespace yamlview;

namespace {

struct ThemeEntry {
    ThemeFactory factory;
    Mode mode;
};

struct ThemeRegistry {
    std::shared_mutex mutex;
    std::map<std::string, ThemeEntry> entries;

    ThemeRegistry() {
        entries["dracula"] = {themes::dracula, Mode::Dark};
        entries["monokai"] = {themes::monokai, Mode::Dark};
        entries["github"] = {themes::github, Mode::Light};
        entries["bw"] = {themes::bw, Mode::Light};
    }
};

ThemeRegistry&
registry() {
    static ThemeRegistry instance;
    return instance;
}

}  // namespace

void
yamlview::theme_register(const std::string& name, ThemeFactory factory, Mode mode) {
    auto& r = registry();
    std::unique_lock<std::shared_mutex> lock(r.mutex);
    r.entries[name] = {std::move(factory), mode};
}

std::optional<Styles>
yamlview::theme_styles(const std::string& name) {
    ThemeFactory factory;
    {
        auto& r = registry();
        std::shared_lock<std::shared_mutex> lock(r.mutex);
        auto it = r.entries.find(name);
        if (it == r.entries.end() || !it->second.factory) {
            return {};
        }
        factory = it->second.factory;
    }
    // Factories run unlocked so that they may consult the registry themselves.
    return factory();
}

std::optional<Mode>
yamlview::theme_mode(const std::string& name) {
    auto& r = registry();
    std::shared_lock<std::shared_mutex> lock(r.mutex);
    if (auto it = r.entries.find(name); it != r.entries.end()) {
        return it->second.mode;
    }
    return {};
}

std::vector<std::string>
yamlview::theme_list() {
    auto& r = registry();
    std::shared_lock<std::shared_mutex> lock(r.mutex);
    std::vector<std::string> names;
    for (const auto& [name, _entry] : r.entries) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string>
yamlview::theme_list(Mode mode) {
    auto& r = registry();
    std::shared_lock<std::shared_mutex> lock(r.mutex);
    std::vector<std::string> names;
    for (const auto& [name, entry] : r.entries) {
        if (entry.mode == mode) {
            names.push_back(name);
        }
    }
    return names;
}

const Styles&
yamlview::default_styles() {
    static const Styles styles = themes::dracula();
    return styles;
}
