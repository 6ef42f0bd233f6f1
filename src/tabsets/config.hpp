#pragma once

#include <string>

struct Config {
    // Empty means "<host config dir>/tabsets", resolved by load().
    std::string tabsets_dir;

    // Only applied when a tabset is loaded into an empty window.
    bool restore_colors = false;
    bool restore_dimensions = false;

    // Selection UI only.
    bool fuzzy_selector = false;

    // Host CLI used by the wezterm adapter.
    std::string wezterm = "wezterm";

    static Config load(const std::string& path);
    static Config load_default();

    static std::string default_tabsets_dir();
};
