#include "snapshot.hpp"

using json = nlohmann::json;

void to_json(json& j, const PaneRecord& pane) {
    j = json{{"left", pane.left}, {"cwd", pane.cwd}, {"exe", pane.exe}};
}

void from_json(const json& j, PaneRecord& pane) {
    j.at("left").get_to(pane.left);
    j.at("cwd").get_to(pane.cwd);
    j.at("exe").get_to(pane.exe);
}

void to_json(json& j, const TabRecord& tab) {
    j = json{{"title", tab.title}, {"panes", tab.panes}};
}

void from_json(const json& j, TabRecord& tab) {
    j.at("title").get_to(tab.title);
    j.at("panes").get_to(tab.panes);
}

void to_json(json& j, const Snapshot& snapshot) {
    j = json{
        {"window_width", snapshot.window_width},
        {"window_height", snapshot.window_height},
        {"colors", snapshot.colors},
        {"tabs", snapshot.tabs},
    };
}

void from_json(const json& j, Snapshot& snapshot) {
    j.at("window_width").get_to(snapshot.window_width);
    j.at("window_height").get_to(snapshot.window_height);

    // Older records may carry a null theme when the host had no overrides.
    const auto& colors = j.at("colors");
    if (colors.is_null()) {
        snapshot.colors = json::object();
    } else {
        snapshot.colors = colors.get<json::object_t>();
    }

    j.at("tabs").get_to(snapshot.tabs);
}
