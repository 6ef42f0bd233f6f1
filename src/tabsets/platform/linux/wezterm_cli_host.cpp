#include "platform/linux/wezterm_cli_host.hpp"

#include "platform/linux/child_process.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <iterator>
#include <print>

using json = nlohmann::json;

WeztermCliHost::WeztermCliHost(std::string wezterm)
    : WeztermCliHost(std::move(wezterm), run_child_process) {}

WeztermCliHost::WeztermCliHost(std::string wezterm, Runner runner)
    : wezterm_(std::move(wezterm)), run_(std::move(runner)) {}

std::expected<WindowId, std::string> WeztermCliHost::current_window() {
    auto entries = list();
    if (!entries) return std::unexpected(entries.error());
    if (entries->empty()) return std::unexpected("no wezterm windows");

    if (const char* env = std::getenv("WEZTERM_PANE")) {
        std::string value(env);
        PaneId pane = -1;
        auto [ptr, err] = std::from_chars(value.data(), value.data() + value.size(), pane);
        if (err == std::errc{}) {
            auto it = std::ranges::find_if(*entries, [pane](const CliPaneEntry& e) { return e.pane_id == pane; });
            if (it != entries->end()) return it->window_id;
        }
        std::println(stderr, "wezterm: pane {} from $WEZTERM_PANE not listed", value);
    }
    return entries->front().window_id;
}

std::expected<std::vector<CliPaneEntry>, std::string> WeztermCliHost::parse_list(const std::string& json_text) {
    std::vector<CliPaneEntry> entries;
    try {
        auto j = json::parse(json_text);
        if (!j.is_array()) return std::unexpected("wezterm cli list: expected a JSON array");

        for (auto& row : j) {
            CliPaneEntry e;
            e.window_id = row.at("window_id").get<int>();
            e.tab_id = row.at("tab_id").get<int>();
            e.pane_id = row.at("pane_id").get<int>();
            e.tab_title = row.value("tab_title", "");
            e.cwd = row.value("cwd", "");
            e.tty_name = row.contains("tty_name") && row["tty_name"].is_string()
                             ? row["tty_name"].get<std::string>()
                             : std::string{};
            e.left_col = row.value("left_col", 0);
            e.top_row = row.value("top_row", 0);
            e.is_active = row.value("is_active", false);
            if (row.contains("size")) {
                auto& size = row["size"];
                e.cols = size.value("cols", 0);
                e.rows = size.value("rows", 0);
                e.pixel_width = size.value("pixel_width", 0);
                e.pixel_height = size.value("pixel_height", 0);
            }
            entries.push_back(std::move(e));
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("wezterm cli list: ") + e.what());
    }
    return entries;
}

std::expected<WindowDimensions, std::string> WeztermCliHost::window_dimensions(WindowId window) {
    auto entries = list();
    if (!entries) return std::unexpected(entries.error());

    auto first = std::ranges::find_if(*entries, [window](const CliPaneEntry& e) { return e.window_id == window; });
    if (first == entries->end()) return std::unexpected("no such window " + std::to_string(window));

    // Every tab fills the window; measure the first one by its panes' extents.
    WindowDimensions dims;
    for (const auto& e : *entries) {
        if (e.tab_id != first->tab_id || e.cols <= 0 || e.rows <= 0) continue;
        dims.pixel_width = std::max(dims.pixel_width, (e.left_col + e.cols) * e.pixel_width / e.cols);
        dims.pixel_height = std::max(dims.pixel_height, (e.top_row + e.rows) * e.pixel_height / e.rows);
    }
    return dims;
}

std::expected<json, std::string> WeztermCliHost::window_colors(WindowId /*window*/) {
    return json::object();
}

std::expected<void, std::string> WeztermCliHost::set_window_colors(WindowId /*window*/, const json& /*colors*/) {
    return std::unexpected("setting colors is not supported by wezterm cli");
}

std::expected<void, std::string> WeztermCliHost::set_window_size(WindowId /*window*/, int /*pixel_width*/,
                                                                 int /*pixel_height*/) {
    return std::unexpected("resizing windows is not supported by wezterm cli");
}

std::expected<std::vector<TabId>, std::string> WeztermCliHost::tabs(WindowId window) {
    auto entries = list();
    if (!entries) return std::unexpected(entries.error());

    std::vector<TabId> result;
    for (const auto& e : *entries) {
        if (e.window_id != window) continue;
        if (std::ranges::find(result, e.tab_id) == result.end()) result.push_back(e.tab_id);
    }
    if (result.empty()) return std::unexpected("no such window " + std::to_string(window));
    return result;
}

std::expected<std::string, std::string> WeztermCliHost::tab_title(TabId tab) {
    auto panes = list_tab(tab);
    if (!panes) return std::unexpected(panes.error());
    return panes->front().tab_title;
}

std::expected<void, std::string> WeztermCliHost::set_tab_title(TabId tab, const std::string& title) {
    auto res = cli({"set-tab-title", "--tab-id", std::to_string(tab), title});
    if (!res) return std::unexpected(res.error());
    return {};
}

std::expected<void, std::string> WeztermCliHost::activate_tab(TabId tab) {
    auto res = cli({"activate-tab", "--tab-id", std::to_string(tab)});
    if (!res) return std::unexpected(res.error());
    return {};
}

std::expected<std::vector<PaneInfo>, std::string> WeztermCliHost::panes_with_info(TabId tab) {
    auto panes = list_tab(tab);
    if (!panes) return std::unexpected(panes.error());

    std::vector<PaneInfo> infos;
    for (const auto& e : *panes) {
        infos.push_back(PaneInfo{
            .pane = e.pane_id,
            .left = e.left_col,
            .cwd = e.cwd,
            .foreground_process = foreground_.foreground_process(e.tty_name),
        });
    }
    return infos;
}

std::expected<PaneId, std::string> WeztermCliHost::active_pane(TabId tab) {
    auto panes = list_tab(tab);
    if (!panes) return std::unexpected(panes.error());

    auto it = std::ranges::find_if(*panes, [](const CliPaneEntry& e) { return e.is_active; });
    if (it == panes->end()) return panes->front().pane_id;
    return it->pane_id;
}

std::expected<void, std::string> WeztermCliHost::activate_pane(PaneId pane) {
    auto res = cli({"activate-pane", "--pane-id", std::to_string(pane)});
    if (!res) return std::unexpected(res.error());
    return {};
}

std::expected<SpawnedTab, std::string> WeztermCliHost::spawn_tab(WindowId window, const std::string& cwd) {
    std::vector<std::string> args = {"spawn", "--window-id", std::to_string(window)};
    if (!cwd.empty()) {
        args.push_back("--cwd");
        args.push_back(cwd);
    }

    auto out = cli(std::move(args));
    if (!out) return std::unexpected(out.error());

    auto pane = parse_pane_id(*out);
    if (!pane) return std::unexpected(pane.error());

    auto entries = list();
    if (!entries) return std::unexpected(entries.error());
    auto it = std::ranges::find_if(*entries, [&](const CliPaneEntry& e) { return e.pane_id == *pane; });
    if (it == entries->end()) return std::unexpected("spawned pane " + std::to_string(*pane) + " vanished");

    return SpawnedTab{.tab = it->tab_id, .pane = *pane};
}

std::expected<PaneId, std::string> WeztermCliHost::split_pane(PaneId pane, SplitDirection direction,
                                                              const std::string& cwd) {
    std::vector<std::string> args = {
        "split-pane", "--pane-id", std::to_string(pane),
        direction == SplitDirection::Right ? "--right" : "--bottom",
    };
    if (!cwd.empty()) {
        args.push_back("--cwd");
        args.push_back(cwd);
    }

    auto out = cli(std::move(args));
    if (!out) return std::unexpected(out.error());
    return parse_pane_id(*out);
}

std::expected<void, std::string> WeztermCliHost::send_text(PaneId pane, const std::string& text) {
    auto res = cli({"send-text", "--pane-id", std::to_string(pane), "--no-paste", text});
    if (!res) return std::unexpected(res.error());
    return {};
}

std::expected<std::string, std::string> WeztermCliHost::cli(std::vector<std::string> args) {
    args.insert(args.begin(), {wezterm_, "cli"});
    return run_(args);
}

std::expected<std::vector<CliPaneEntry>, std::string> WeztermCliHost::list() {
    auto out = cli({"list", "--format", "json"});
    if (!out) return std::unexpected(out.error());
    return parse_list(*out);
}

std::expected<std::vector<CliPaneEntry>, std::string> WeztermCliHost::list_tab(TabId tab) {
    auto entries = list();
    if (!entries) return std::unexpected(entries.error());

    std::vector<CliPaneEntry> panes;
    std::ranges::copy_if(*entries, std::back_inserter(panes), [tab](const CliPaneEntry& e) { return e.tab_id == tab; });
    if (panes.empty()) return std::unexpected("no such tab " + std::to_string(tab));
    return panes;
}

std::expected<PaneId, std::string> WeztermCliHost::parse_pane_id(const std::string& output) {
    auto begin = output.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::unexpected("wezterm cli printed no pane id");
    auto end = output.find_last_not_of(" \t\r\n") + 1;

    PaneId pane = -1;
    auto [ptr, err] = std::from_chars(output.data() + begin, output.data() + end, pane);
    if (err != std::errc{} || ptr != output.data() + end) {
        return std::unexpected("unexpected pane id '" + output.substr(begin, end - begin) + "'");
    }
    return pane;
}
