#pragma once

#include "output/printer.hpp"
#include "processing/diff.hpp"
#include "processing/normalizer.hpp"
#include "style/theme.hpp"
#include "util/color.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace yamlview {

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

// Settings stored in yamlview.yaml. Names are kept as written in the file and
// resolved by the config_*_options functions below.
struct Options {
    // printer
    std::string theme = kDefaultTheme;
    bool control_escape = true;
    int64_t tab_width = 8;
    int64_t width = 0;
    std::string gutter = "none";
    bool annotations = true;
    std::string overlay_mode = "blend";
    std::string color_profile = "auto";

    // diff
    int64_t context_lines = 3;
    std::string algorithm = "myers-greedy";
    bool hunk_headers = false;

    // finder
    bool case_fold = true;
    bool diacritic_fold = true;
    bool width_fold = false;
    std::vector<std::string> transformers;
};

std::string
config_get_directory();

std::string
config_get_themes_directory();

// Values missing from the file keep what `options` already holds. `error` is
// set when the result is Invalid.
ConfigLoadResult
config_load_options(const std::string& path, Options& options, std::string& error);

// Write every option to `path`, creating the parent directory if needed.
bool
config_write_defaults(const std::string& path, const Options& options);

// Load <config dir>/yamlview.yaml into `options` and register the themes in
// <config dir>/themes. A missing file is created with the current values.
void
config_apply_options(Options& options);

void
config_apply_options(Options& options, const std::string& config_root);

std::optional<ColorProfile>
color_profile_from_name(const std::string& name);

std::optional<OverlayMode>
overlay_mode_from_name(const std::string& name);

// Unknown names fall back to the defaults with a warning.
PrinterOptions
config_printer_options(const Options& options);

DiffOptions
config_diff_options(const Options& options);

NormalizerOptions
config_normalizer_options(const Options& options);

// Parse a theme file and register it. `name` receives the registered name.
ConfigLoadResult
config_load_theme(const std::string& path, std::string& name, std::string& error);

// Register every *.yaml theme in `directory`. Returns the registered names.
std::vector<std::string>
config_load_user_themes(const std::string& directory);

}  // namespace yamlview
