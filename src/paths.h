#pragma once
#include <string>

namespace bme {

// Configuration directory (config file and default data directory).
// Windows: %APPDATA%\\budgetme
// macOS:   $HOME/Library/Application Support/budgetme
// Linux:   $XDG_CONFIG_HOME/budgetme, else $HOME/.config/budgetme
std::string config_dir();

// Replaces a leading "~" with the home directory.
std::string expand_home(const std::string& path);

std::string join_path(const std::string& a, const std::string& b);

}
