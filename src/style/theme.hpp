#pragma once

#include "style/styles.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace yamlview {

enum class Mode { Light, Dark };

using ThemeFactory = std::function<Styles()>;

const char* const kDefaultTheme = "dracula";

// Process wide theme registry. Registration replaces any theme with the same
// name. All functions are safe to call from multiple threads.
void
theme_register(const std::string& name, ThemeFactory factory, Mode mode);

// Build the named theme; nullopt if no such theme is registered.
std::optional<Styles>
theme_styles(const std::string& name);

std::optional<Mode>
theme_mode(const std::string& name);

// Sorted theme names.
std::vector<std::string>
theme_list();

std::vector<std::string>
theme_list(Mode mode);

// The built-in dark theme.
const Styles&
default_styles();

namespace themes {

Styles
dracula();

Styles
monokai();

Styles
github();

Styles
bw();

}  // namespace themes

}  // namespace yamlview
