#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void finalize(Config& cfg) {
    if (cfg.tabsets_dir.empty()) {
        cfg.tabsets_dir = Config::default_tabsets_dir();
    } else {
        cfg.tabsets_dir = platform::expand_home(cfg.tabsets_dir);
    }
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        finalize(cfg);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("tabsets_dir")) cfg.tabsets_dir = j["tabsets_dir"].get<std::string>();
        if (j.contains("restore_colors")) cfg.restore_colors = j["restore_colors"].get<bool>();
        if (j.contains("restore_dimensions")) cfg.restore_dimensions = j["restore_dimensions"].get<bool>();
        if (j.contains("fuzzy_selector")) cfg.fuzzy_selector = j["fuzzy_selector"].get<bool>();
        if (j.contains("wezterm")) cfg.wezterm = j["wezterm"].get<std::string>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        cfg = Config{};
    }

    finalize(cfg);
    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (!dir.empty()) {
        auto config_path = fs::path(dir) / "config.json";
        if (fs::exists(config_path)) {
            return load(config_path.string());
        }
    }

    Config cfg;
    finalize(cfg);
    return cfg;
}

std::string Config::default_tabsets_dir() {
    auto dir = platform::host_config_dir();
    if (dir.empty()) return "/tmp/tabsets";
    return dir + "/tabsets";
}
