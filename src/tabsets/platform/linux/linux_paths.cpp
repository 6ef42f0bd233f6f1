#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/tabsets";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/tabsets";
}

std::string host_config_dir() {
    // Set by wezterm for every process it spawns.
    const char* wez = std::getenv("WEZTERM_CONFIG_DIR");
    if (wez && *wez) return wez;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/wezterm";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/wezterm";
}

std::string expand_home(const std::string& path) {
    if (path != "~" && !path.starts_with("~/")) return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

} // namespace platform
