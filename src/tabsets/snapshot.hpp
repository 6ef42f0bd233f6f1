#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct PaneRecord {
    int left = 0;     // horizontal grid position (cells)
    std::string cwd;  // file:// URI or plain path
    std::string exe;  // foreground command name or absolute path

    bool operator==(const PaneRecord&) const = default;
};

struct TabRecord {
    std::string title;
    std::vector<PaneRecord> panes;  // host order; replayed verbatim

    bool operator==(const TabRecord&) const = default;
};

struct Snapshot {
    int window_width = 0;   // pixels
    int window_height = 0;  // pixels
    nlohmann::json colors = nlohmann::json::object();  // opaque host color theme
    std::vector<TabRecord> tabs;

    bool operator==(const Snapshot&) const = default;
};

// Throw nlohmann::json::exception on missing or mistyped fields.
void to_json(nlohmann::json& j, const PaneRecord& pane);
void from_json(const nlohmann::json& j, PaneRecord& pane);
void to_json(nlohmann::json& j, const TabRecord& tab);
void from_json(const nlohmann::json& j, TabRecord& tab);
void to_json(nlohmann::json& j, const Snapshot& snapshot);
void from_json(const nlohmann::json& j, Snapshot& snapshot);
