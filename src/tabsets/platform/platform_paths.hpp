#pragma once

#include <string>

namespace platform {

// Directory holding tabsets' own config.json.
std::string config_dir();

// Configuration directory of the terminal host (WezTerm).
std::string host_config_dir();

// Expands a leading "~/" against $HOME. Other paths are returned unchanged.
std::string expand_home(const std::string& path);

} // namespace platform
