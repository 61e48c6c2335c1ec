#include "config.hpp"

#include <output/gutter.hpp>
#include <style/category.hpp>
#include <style/style.hpp>
#include <util/tty.hpp>

#include <fmt/format.h>
#include <sago/platform_folders.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

using namespace yamlview;

static std::string config_doc_general = R"foo(# General configuration for yamlview
#
# printer.theme          built-in: dracula, monokai, github, bw; or a theme
#                        file in the themes/ directory next to this file
# printer.gutter         none, line-numbers, diff, default
# printer.overlay_mode   blend, override-first
# printer.color_profile  auto, truecolor, 256, 16, none
# printer.width          0 disables wrapping, negative uses the terminal width
# diff.algorithm         myers-greedy, myers-linear
#
)foo";

enum class ConfigVariableType {
    Bool,
    Int,
    String,
    StringList,
};

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

namespace {

std::vector<std::string>
split_path(const std::string& path) {
    std::vector<std::string> keys;
    std::stringstream stream(path);
    std::string key;
    while (std::getline(stream, key, '.')) {
        keys.push_back(key);
    }
    return keys;
}

std::optional<YAML::Node>
lookup_value_by_path(const YAML::Node& node, const std::vector<std::string>& keys, std::size_t index = 0) {
    if (index == keys.size()) {
        return node;
    }
    if (!node.IsMap()) {
        return {};
    }
    const YAML::Node child = node[keys[index]];
    if (!child) {
        return {};
    }
    return lookup_value_by_path(child, keys, index + 1);
}

// Assigning a node to a node variable writes through to the tree; reset()
// rebinds the variable instead.
void
set_value_at(YAML::Node& root, const std::string& path, const YAML::Node& value) {
    const auto keys = split_path(path);
    YAML::Node node;
    node.reset(root);
    for (std::size_t i = 0; i + 1 < keys.size(); i++) {
        YAML::Node child = node[keys[i]];
        node.reset(child);
    }
    node[keys.back()] = value;
}

ConfigLoadResult
config_load_file(const std::string& config_path, YAML::Node& config_table, std::string& error) {
    if (!std::filesystem::exists(config_path)) {
        error = fmt::format("no such file: {}", config_path);
        return ConfigLoadResult::DoesNotExist;
    }

    try {
        config_table = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        error = e.what();
        return ConfigLoadResult::Invalid;
    }

    if (config_table.IsNull()) {
        config_table = YAML::Node(YAML::NodeType::Map);
    }
    if (!config_table.IsMap()) {
        error = "expected a mapping at the top level";
        return ConfigLoadResult::Invalid;
    }
    return ConfigLoadResult::Ok;
}

bool
config_save(const std::string& config_path, const std::string& header, const YAML::Node& config_value) {
    const auto parent = std::filesystem::path(config_path).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        fmt::print(stderr, "error: failed to open '{}' for writing.\n", config_path);
        fmt::print(stderr, "   errno ({}) = {}\n", errno, strerror(errno));
        return false;
    }

    YAML::Emitter out;
    out << config_value;

    const std::string serialized = header + out.c_str() + "\n";
    fwrite(serialized.c_str(), serialized.size(), 1, f);
    fclose(f);
    return true;
}

// Read the options present in `config` into their targets. With `fill_missing`
// set, options absent from `config` are written into it from the targets.
void
apply_option_table(YAML::Node& config, const OptionVector& options, bool fill_missing) {
    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = lookup_value_by_path(config, split_path(path)); stored_value) {
            try {
                switch (type) {
                    case ConfigVariableType::Bool: {
                        *static_cast<bool*>(ptr) = stored_value->as<bool>();
                    } break;
                    case ConfigVariableType::Int: {
                        *static_cast<int64_t*>(ptr) = stored_value->as<int64_t>();
                    } break;
                    case ConfigVariableType::String: {
                        *static_cast<std::string*>(ptr) = stored_value->as<std::string>();
                    } break;
                    case ConfigVariableType::StringList: {
                        *static_cast<std::vector<std::string>*>(ptr) = stored_value->as<std::vector<std::string>>();
                    } break;
                }
            } catch (const YAML::Exception& e) {
                fmt::print(stderr, "warning: ignoring '{}': {}\n", path, e.what());
            }
        } else if (fill_missing) {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            switch (type) {
                case ConfigVariableType::Bool: {
                    set_value_at(config, path, YAML::Node(*static_cast<bool*>(ptr)));
                } break;
                case ConfigVariableType::Int: {
                    set_value_at(config, path, YAML::Node(*static_cast<int64_t*>(ptr)));
                } break;
                case ConfigVariableType::String: {
                    set_value_at(config, path, YAML::Node(*static_cast<std::string*>(ptr)));
                } break;
                case ConfigVariableType::StringList: {
                    YAML::Node list(YAML::NodeType::Sequence);
                    for (const auto& item : *static_cast<std::vector<std::string>*>(ptr)) {
                        list.push_back(item);
                    }
                    set_value_at(config, path, list);
                } break;
            }
        }
    }
}

// The table is built from a mutable Options; writers pass a copy.
OptionVector
option_table(Options& options) {
    // clang-format off
    return {
        { "printer.theme",          ConfigVariableType::String,     &options.theme },
        { "printer.control_escape", ConfigVariableType::Bool,       &options.control_escape },
        { "printer.tab_width",      ConfigVariableType::Int,        &options.tab_width },
        { "printer.width",          ConfigVariableType::Int,        &options.width },
        { "printer.gutter",         ConfigVariableType::String,     &options.gutter },
        { "printer.annotations",    ConfigVariableType::Bool,       &options.annotations },
        { "printer.overlay_mode",   ConfigVariableType::String,     &options.overlay_mode },
        { "printer.color_profile",  ConfigVariableType::String,     &options.color_profile },

        { "diff.context_lines",     ConfigVariableType::Int,        &options.context_lines },
        { "diff.algorithm",         ConfigVariableType::String,     &options.algorithm },
        { "diff.hunk_headers",      ConfigVariableType::Bool,       &options.hunk_headers },

        { "finder.case_fold",       ConfigVariableType::Bool,       &options.case_fold },
        { "finder.diacritic_fold",  ConfigVariableType::Bool,       &options.diacritic_fold },
        { "finder.width_fold",      ConfigVariableType::Bool,       &options.width_fold },
        { "finder.transformers",    ConfigVariableType::StringList, &options.transformers },
    };
    // clang-format on
}

std::optional<Mode>
mode_from_name(const std::string& name) {
    if (name == "light") {
        return Mode::Light;
    }
    if (name == "dark") {
        return Mode::Dark;
    }
    return {};
}

}  // namespace

std::string
yamlview::config_get_directory() {
    return fmt::format("{}/yamlview", sago::getConfigHome());
}

std::string
yamlview::config_get_themes_directory() {
    return fmt::format("{}/themes", config_get_directory());
}

ConfigLoadResult
yamlview::config_load_options(const std::string& path, Options& options, std::string& error) {
    YAML::Node config;
    const auto result = config_load_file(path, config, error);
    if (result == ConfigLoadResult::Ok) {
        apply_option_table(config, option_table(options), false);
    }
    return result;
}

bool
yamlview::config_write_defaults(const std::string& path, const Options& options) {
    Options values = options;
    YAML::Node config(YAML::NodeType::Map);
    apply_option_table(config, option_table(values), true);
    return config_save(path, config_doc_general, config);
}

void
yamlview::config_apply_options(Options& options) {
    config_apply_options(options, config_get_directory());
}

void
yamlview::config_apply_options(Options& options, const std::string& config_root) {
    const std::string config_file_name = "yamlview.yaml";
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    // User themes must be registered before options.theme is resolved
    config_load_user_themes(fmt::format("{}/themes", config_root));

    bool flush_config_to_disk = false;

    std::string error;
    YAML::Node config(YAML::NodeType::Map);
    switch (config_load_file(config_path, config, error)) {
        case ConfigLoadResult::Ok: {
        } break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", error, config_path);
            return;
        }
        case ConfigLoadResult::DoesNotExist: {
            fmt::print(stderr, "warning: could not find default config. creating file:\n\t{}\n", config_path);
            flush_config_to_disk = true;
        } break;
    };

    apply_option_table(config, option_table(options), flush_config_to_disk);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_save(config_path, config_doc_general, config);
    }
}

std::optional<ColorProfile>
yamlview::color_profile_from_name(const std::string& name) {
    if (name == "auto") {
        return tty_detect_color_profile();
    }
    if (name == "truecolor" || name == "24bit") {
        return ColorProfile::TrueColor;
    }
    if (name == "256") {
        return ColorProfile::Ansi256;
    }
    if (name == "16") {
        return ColorProfile::Ansi16;
    }
    if (name == "none") {
        return ColorProfile::None;
    }
    return {};
}

std::optional<OverlayMode>
yamlview::overlay_mode_from_name(const std::string& name) {
    if (name == "blend") {
        return OverlayMode::Blend;
    }
    if (name == "override-first") {
        return OverlayMode::OverrideFirst;
    }
    return {};
}

PrinterOptions
yamlview::config_printer_options(const Options& options) {
    PrinterOptions result;

    if (auto styles = theme_styles(options.theme)) {
        result.styles = *styles;
    } else {
        fmt::print(stderr, "warning: unknown theme '{}', using '{}'\n", options.theme, kDefaultTheme);
    }

    result.control_escape = options.control_escape;
    result.tab_width = options.tab_width > 0 ? options.tab_width : result.tab_width;
    result.width = options.width;
    result.annotations = options.annotations;

    if (options.gutter != "none") {
        if (auto gutter = gutters::from_name(options.gutter)) {
            result.gutter = *gutter;
        } else {
            fmt::print(stderr, "warning: unknown gutter '{}'\n", options.gutter);
        }
    }

    if (auto mode = overlay_mode_from_name(options.overlay_mode)) {
        result.overlay_mode = *mode;
    } else {
        fmt::print(stderr, "warning: unknown overlay mode '{}'\n", options.overlay_mode);
    }

    if (auto profile = color_profile_from_name(options.color_profile)) {
        result.color_profile = *profile;
    } else {
        fmt::print(stderr, "warning: unknown color profile '{}'\n", options.color_profile);
    }

    return result;
}

DiffOptions
yamlview::config_diff_options(const Options& options) {
    DiffOptions result;
    if (auto algorithm = diff_algorithm_from_name(options.algorithm)) {
        result.algorithm = *algorithm;
    } else {
        fmt::print(stderr, "warning: unknown diff algorithm '{}'\n", options.algorithm);
    }
    result.hunk_headers = options.hunk_headers;
    return result;
}

NormalizerOptions
yamlview::config_normalizer_options(const Options& options) {
    NormalizerOptions result;
    result.case_fold = options.case_fold;
    result.diacritic_fold = options.diacritic_fold;
    result.width_fold = options.width_fold;
    result.transformers = options.transformers;
    return result;
}

ConfigLoadResult
yamlview::config_load_theme(const std::string& path, std::string& name, std::string& error) {
    YAML::Node config;
    if (auto result = config_load_file(path, config, error); result != ConfigLoadResult::Ok) {
        return result;
    }

    std::string mode_name = "dark";
    std::string base = "";
    name = std::filesystem::path(path).stem().string();

    // clang-format off
    const OptionVector options = {
        { "name", ConfigVariableType::String, &name },
        { "mode", ConfigVariableType::String, &mode_name },
        { "base", ConfigVariableType::String, &base },
    };
    // clang-format on
    apply_option_table(config, options, false);

    auto mode = mode_from_name(mode_name);
    if (!mode) {
        error = fmt::format("unknown mode '{}'", mode_name);
        return ConfigLoadResult::Invalid;
    }

    auto base_style = parse_style(base);
    if (!base_style) {
        error = fmt::format("invalid base style '{}'", base);
        return ConfigLoadResult::Invalid;
    }

    std::vector<StyleOverride> overrides;
    if (auto styles = lookup_value_by_path(config, {"styles"}); styles && styles->IsMap()) {
        for (const auto& entry : *styles) {
            std::string key;
            std::string value;
            try {
                key = entry.first.as<std::string>();
                value = entry.second.as<std::string>();
            } catch (const YAML::Exception& e) {
                fmt::print(stderr, "warning: {}: ignoring style entry: {}\n", path, e.what());
                continue;
            }

            auto category = category_from_name(key);
            if (!category) {
                fmt::print(stderr, "warning: {}: unknown category '{}'\n", path, key);
                continue;
            }

            auto style = parse_style(value);
            if (!style) {
                fmt::print(stderr, "warning: {}: invalid style '{}' for '{}'\n", path, value, key);
                continue;
            }
            overrides.emplace_back(*category, *style);
        }
    }

    const Styles styles(*base_style, overrides);
    theme_register(name, [styles]() { return styles; }, *mode);
    return ConfigLoadResult::Ok;
}

std::vector<std::string>
yamlview::config_load_user_themes(const std::string& directory) {
    std::vector<std::string> names;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return names;
    }

    std::vector<std::filesystem::path> paths;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        const auto& path = entry.path();
        if (entry.is_regular_file() && (path.extension() == ".yaml" || path.extension() == ".yml")) {
            paths.push_back(path);
        }
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& path : paths) {
        std::string name;
        std::string error;
        if (config_load_theme(path.string(), name, error) == ConfigLoadResult::Ok) {
            names.push_back(name);
        } else {
            fmt::print(stderr, "error: {}\n\twhile loading theme: {}\n", error, path.string());
        }
    }
    return names;
}
