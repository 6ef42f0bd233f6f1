#pragma once

#include "platform/linux/procfs_foreground.hpp"
#include "platform/terminal_host.hpp"

#include <expected>
#include <functional>
#include <string>
#include <vector>

// One row of `wezterm cli list --format json`.
struct CliPaneEntry {
    WindowId window_id = -1;
    TabId tab_id = -1;
    PaneId pane_id = -1;
    std::string tab_title;
    std::string cwd;
    std::string tty_name;
    int left_col = 0;
    int top_row = 0;
    int cols = 0;
    int rows = 0;
    int pixel_width = 0;
    int pixel_height = 0;
    bool is_active = false;
};

// TerminalHost driven through the `wezterm cli` sub-commands. Colors and
// window size are not reachable that way: captured colors are empty and
// setting either reports an error.
class WeztermCliHost : public TerminalHost {
public:
    using Runner = std::function<std::expected<std::string, std::string>(const std::vector<std::string>&)>;

    explicit WeztermCliHost(std::string wezterm);
    WeztermCliHost(std::string wezterm, Runner runner);

    // Window containing $WEZTERM_PANE, else the first listed window.
    std::expected<WindowId, std::string> current_window();

    static std::expected<std::vector<CliPaneEntry>, std::string> parse_list(const std::string& json_text);

    std::expected<WindowDimensions, std::string> window_dimensions(WindowId window) override;
    std::expected<nlohmann::json, std::string> window_colors(WindowId window) override;
    std::expected<void, std::string> set_window_colors(WindowId window, const nlohmann::json& colors) override;
    std::expected<void, std::string> set_window_size(WindowId window, int pixel_width, int pixel_height) override;

    std::expected<std::vector<TabId>, std::string> tabs(WindowId window) override;
    std::expected<std::string, std::string> tab_title(TabId tab) override;
    std::expected<void, std::string> set_tab_title(TabId tab, const std::string& title) override;
    std::expected<void, std::string> activate_tab(TabId tab) override;

    std::expected<std::vector<PaneInfo>, std::string> panes_with_info(TabId tab) override;
    std::expected<PaneId, std::string> active_pane(TabId tab) override;
    std::expected<void, std::string> activate_pane(PaneId pane) override;

    std::expected<SpawnedTab, std::string> spawn_tab(WindowId window, const std::string& cwd) override;
    std::expected<PaneId, std::string> split_pane(PaneId pane, SplitDirection direction,
                                                  const std::string& cwd) override;
    std::expected<void, std::string> send_text(PaneId pane, const std::string& text) override;

private:
    std::expected<std::string, std::string> cli(std::vector<std::string> args);
    std::expected<std::vector<CliPaneEntry>, std::string> list();
    std::expected<std::vector<CliPaneEntry>, std::string> list_tab(TabId tab);

    static std::expected<PaneId, std::string> parse_pane_id(const std::string& output);

    std::string wezterm_;
    Runner run_;
    ProcfsForeground foreground_;
};
