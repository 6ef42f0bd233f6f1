#pragma once

#include "platform/terminal_host.hpp"

#include <format>
#include <map>
#include <set>
#include <string>
#include <vector>

// In-memory terminal. Records every mutating call in `calls`.
class FakeTerminalHost : public TerminalHost {
public:
    struct Pane {
        PaneId id;
        int left;
        std::string cwd;
        std::string fg;
        std::vector<std::string> typed;
    };

    struct Tab {
        TabId id;
        std::string title;
        std::vector<Pane> panes;
        PaneId active;
    };

    struct Window {
        WindowDimensions dims;
        nlohmann::json colors = nlohmann::json::object();
        std::vector<Tab> tabs;
    };

    std::map<WindowId, Window> windows;
    std::vector<std::string> calls;

    // Failure injection.
    bool unreachable = false;
    int spawn_budget = -1;                 // successful spawns allowed; -1 = unlimited
    std::set<std::string> failing_split_cwds;
    bool refuse_chrome = false;

    WindowId add_window(int pixel_width = 800, int pixel_height = 600) {
        WindowId id = next_id_++;
        windows[id].dims = WindowDimensions{.pixel_width = pixel_width, .pixel_height = pixel_height,
                                            .is_full_screen = false};
        return id;
    }

    TabId add_tab(WindowId window, std::string title, std::vector<Pane> panes) {
        TabId id = next_id_++;
        for (auto& p : panes) p.id = next_id_++;
        PaneId active = panes.front().id;
        windows[window].tabs.push_back(Tab{id, std::move(title), std::move(panes), active});
        return id;
    }

    Tab* find_tab(TabId tab) {
        for (auto& [_, w] : windows)
            for (auto& t : w.tabs)
                if (t.id == tab) return &t;
        return nullptr;
    }

    Pane* find_pane(PaneId pane, Tab** owner = nullptr) {
        for (auto& [_, w] : windows)
            for (auto& t : w.tabs)
                for (auto& p : t.panes)
                    if (p.id == pane) {
                        if (owner) *owner = &t;
                        return &p;
                    }
        return nullptr;
    }

    std::expected<WindowDimensions, std::string> window_dimensions(WindowId window) override {
        if (unreachable || !windows.contains(window)) return std::unexpected("no window");
        return windows[window].dims;
    }

    std::expected<nlohmann::json, std::string> window_colors(WindowId window) override {
        if (unreachable || !windows.contains(window)) return std::unexpected("no window");
        return windows[window].colors;
    }

    std::expected<void, std::string> set_window_colors(WindowId window, const nlohmann::json& colors) override {
        calls.push_back("set_window_colors");
        if (refuse_chrome) return std::unexpected("unsupported");
        windows[window].colors = colors;
        return {};
    }

    std::expected<void, std::string> set_window_size(WindowId window, int pixel_width, int pixel_height) override {
        calls.push_back(std::format("set_window_size {}x{}", pixel_width, pixel_height));
        if (refuse_chrome) return std::unexpected("unsupported");
        windows[window].dims.pixel_width = pixel_width;
        windows[window].dims.pixel_height = pixel_height;
        return {};
    }

    std::expected<std::vector<TabId>, std::string> tabs(WindowId window) override {
        if (unreachable || !windows.contains(window)) return std::unexpected("no window");
        std::vector<TabId> ids;
        for (auto& t : windows[window].tabs) ids.push_back(t.id);
        return ids;
    }

    std::expected<std::string, std::string> tab_title(TabId tab) override {
        auto* t = find_tab(tab);
        if (unreachable || !t) return std::unexpected("no tab");
        return t->title;
    }

    std::expected<void, std::string> set_tab_title(TabId tab, const std::string& title) override {
        calls.push_back(std::format("set_tab_title {}", title));
        auto* t = find_tab(tab);
        if (!t) return std::unexpected("no tab");
        t->title = title;
        return {};
    }

    std::expected<void, std::string> activate_tab(TabId tab) override {
        calls.push_back("activate_tab");
        if (!find_tab(tab)) return std::unexpected("no tab");
        return {};
    }

    std::expected<std::vector<PaneInfo>, std::string> panes_with_info(TabId tab) override {
        auto* t = find_tab(tab);
        if (unreachable || !t) return std::unexpected("no tab");
        std::vector<PaneInfo> infos;
        for (auto& p : t->panes) {
            infos.push_back(PaneInfo{.pane = p.id, .left = p.left, .cwd = p.cwd, .foreground_process = p.fg});
        }
        return infos;
    }

    std::expected<PaneId, std::string> active_pane(TabId tab) override {
        auto* t = find_tab(tab);
        if (!t) return std::unexpected("no tab");
        return t->active;
    }

    std::expected<void, std::string> activate_pane(PaneId pane) override {
        Tab* owner = nullptr;
        if (!find_pane(pane, &owner)) return std::unexpected("no pane");
        calls.push_back(std::format("activate_pane {}", pane_index(pane)));
        owner->active = pane;
        return {};
    }

    std::expected<SpawnedTab, std::string> spawn_tab(WindowId window, const std::string& cwd) override {
        calls.push_back(std::format("spawn_tab {}", cwd));
        if (spawn_budget == 0) return std::unexpected("spawn refused");
        if (spawn_budget > 0) --spawn_budget;

        TabId id = add_tab(window, "", {Pane{0, 0, "file://" + cwd, "bash", {}}});
        auto* t = find_tab(id);
        return SpawnedTab{.tab = id, .pane = t->panes.front().id};
    }

    std::expected<PaneId, std::string> split_pane(PaneId pane, SplitDirection direction,
                                                  const std::string& cwd) override {
        calls.push_back(std::format("split_pane {} {} {}", pane_index(pane),
                                    direction == SplitDirection::Right ? "right" : "bottom", cwd));
        if (failing_split_cwds.contains(cwd)) return std::unexpected("split refused");

        Tab* owner = nullptr;
        auto* parent = find_pane(pane, &owner);
        if (!parent) return std::unexpected("no pane");

        int left = direction == SplitDirection::Right ? parent->left + 40 : parent->left;
        PaneId id = next_id_++;
        owner->panes.push_back(Pane{id, left, "file://" + cwd, "bash", {}});
        owner->active = id;
        return id;
    }

    std::expected<void, std::string> send_text(PaneId pane, const std::string& text) override {
        calls.push_back(std::format("send_text {} {}", pane_index(pane), escape(text)));
        Tab* owner = nullptr;
        auto* p = find_pane(pane, &owner);
        if (!p) return std::unexpected("no pane");
        p->typed.push_back(text);

        if (text == "exit\r") {
            std::erase_if(owner->panes, [pane](const Pane& x) { return x.id == pane; });
            for (auto& [_, w] : windows) {
                std::erase_if(w.tabs, [](const Tab& t) { return t.panes.empty(); });
            }
        }
        return {};
    }

    // "<tab position>.<pane position>" within its window, stable for assertions.
    std::string pane_index(PaneId pane) {
        for (auto& [_, w] : windows)
            for (size_t ti = 0; ti < w.tabs.size(); ++ti)
                for (size_t pi = 0; pi < w.tabs[ti].panes.size(); ++pi)
                    if (w.tabs[ti].panes[pi].id == pane) return std::format("{}.{}", ti, pi);
        return "?";
    }

private:
    static std::string escape(const std::string& text) {
        std::string out;
        for (char c : text) {
            if (c == '\n') out += "\\n";
            else if (c == '\r') out += "\\r";
            else out += c;
        }
        return out;
    }

    int next_id_ = 1;
};
