#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using WindowId = int;
using TabId = int;
using PaneId = int;

enum class SplitDirection { Right, Bottom };

struct WindowDimensions {
    int pixel_width = 0;
    int pixel_height = 0;
    bool is_full_screen = false;
};

struct PaneInfo {
    PaneId pane = -1;
    int left = 0;                    // grid column of the pane's left edge
    std::string cwd;                 // usually a file:// URI
    std::string foreground_process;  // name or absolute path; empty if unknown
};

struct SpawnedTab {
    TabId tab = -1;
    PaneId pane = -1;  // the tab's initial pane
};

// Window, tab and pane primitives of the terminal application.
// New panes are always created inside the active tab.
class TerminalHost {
public:
    virtual ~TerminalHost() = default;

    virtual std::expected<WindowDimensions, std::string> window_dimensions(WindowId window) = 0;
    virtual std::expected<nlohmann::json, std::string> window_colors(WindowId window) = 0;
    virtual std::expected<void, std::string> set_window_colors(WindowId window, const nlohmann::json& colors) = 0;
    virtual std::expected<void, std::string> set_window_size(WindowId window, int pixel_width, int pixel_height) = 0;

    // Tabs of a window, in display order.
    virtual std::expected<std::vector<TabId>, std::string> tabs(WindowId window) = 0;
    virtual std::expected<std::string, std::string> tab_title(TabId tab) = 0;
    virtual std::expected<void, std::string> set_tab_title(TabId tab, const std::string& title) = 0;
    virtual std::expected<void, std::string> activate_tab(TabId tab) = 0;

    // Panes of a tab, in the host's pane order.
    virtual std::expected<std::vector<PaneInfo>, std::string> panes_with_info(TabId tab) = 0;
    virtual std::expected<PaneId, std::string> active_pane(TabId tab) = 0;
    virtual std::expected<void, std::string> activate_pane(PaneId pane) = 0;

    virtual std::expected<SpawnedTab, std::string> spawn_tab(WindowId window, const std::string& cwd) = 0;
    virtual std::expected<PaneId, std::string> split_pane(PaneId pane, SplitDirection direction,
                                                          const std::string& cwd) = 0;

    // Literal text, as if typed; "\r" or "\n" submits a line.
    virtual std::expected<void, std::string> send_text(PaneId pane, const std::string& text) = 0;
};
