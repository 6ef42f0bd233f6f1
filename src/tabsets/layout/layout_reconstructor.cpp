#include "layout_reconstructor.hpp"

#include "../process_name.hpp"

#include <algorithm>
#include <print>

std::vector<std::optional<SplitDirection>> plan_splits(const TabRecord& tab) {
    std::vector<std::optional<SplitDirection>> plan;
    plan.reserve(tab.panes.size());
    for (size_t i = 0; i < tab.panes.size(); ++i) {
        if (i == 0) {
            plan.push_back(std::nullopt);
        } else if (tab.panes[i].left == tab.panes[i - 1].left) {
            plan.push_back(SplitDirection::Bottom);
        } else {
            plan.push_back(SplitDirection::Right);
        }
    }
    return plan;
}

LayoutReconstructor::LayoutReconstructor(TerminalHost& host, const ExecutableResolver& resolver,
                                         RestoreOptions options, bool verbose)
    : host_(host), resolver_(resolver), options_(options), verbose_(verbose) {}

std::expected<void, ReconstructError> LayoutReconstructor::reconstruct(WindowId window,
                                                                       const Snapshot& snapshot) {
    if (!is_valid(snapshot)) {
        std::println(stderr, "restore: invalid or empty tabset data");
        return std::unexpected(ReconstructError::InvalidSnapshot);
    }

    if (clear_if_empty(window)) {
        restore_chrome(window, snapshot);
    }

    for (const auto& tab : snapshot.tabs) {
        if (!replay_tab(window, tab)) break;
    }

    log("Tabset recreated");
    return {};
}

bool LayoutReconstructor::is_valid(const Snapshot& snapshot) {
    if (snapshot.tabs.empty()) return false;
    return std::ranges::none_of(snapshot.tabs, [](const TabRecord& t) { return t.panes.empty(); });
}

bool LayoutReconstructor::clear_if_empty(WindowId window) {
    auto tabs = host_.tabs(window);
    if (!tabs) {
        std::println(stderr, "restore: could not list tabs: {}", tabs.error());
        return false;
    }
    if (tabs->size() != 1) return false;

    auto panes = host_.panes_with_info(tabs->front());
    if (!panes) {
        std::println(stderr, "restore: could not list panes: {}", panes.error());
        return false;
    }
    if (panes->size() != 1) return false;

    const auto& initial = panes->front();
    if (!is_shell(initial.foreground_process)) {
        log("Initial tab left open, '" + initial.foreground_process + "' is running");
        return false;
    }

    if (auto res = host_.send_text(initial.pane, "exit\r"); !res) {
        std::println(stderr, "restore: could not close initial pane: {}", res.error());
        return false;
    }
    log("Existing single empty tab closed");
    return true;
}

void LayoutReconstructor::restore_chrome(WindowId window, const Snapshot& snapshot) {
    if (options_.restore_colors) {
        if (auto res = host_.set_window_colors(window, snapshot.colors); !res) {
            std::println(stderr, "restore: colors not restored: {}", res.error());
        }
    }
    if (options_.restore_dimensions) {
        auto res = host_.set_window_size(window, snapshot.window_width, snapshot.window_height);
        if (!res) {
            std::println(stderr, "restore: dimensions not restored: {}", res.error());
        }
    }
}

bool LayoutReconstructor::replay_tab(WindowId window, const TabRecord& tab) {
    auto cwd = path_from_cwd(tab.panes.front().cwd, options_.path_style);

    auto spawned = host_.spawn_tab(window, cwd);
    if (!spawned) {
        std::println(stderr, "restore: failed to create a new tab: {}", spawned.error());
        return false;
    }

    if (auto res = host_.set_tab_title(spawned->tab, tab.title); !res) {
        std::println(stderr, "restore: could not set tab title: {}", res.error());
    }
    if (auto res = host_.activate_tab(spawned->tab); !res) {
        std::println(stderr, "restore: could not activate tab: {}", res.error());
    }

    auto plan = plan_splits(tab);
    for (size_t i = 0; i < tab.panes.size(); ++i) {
        const auto& record = tab.panes[i];

        PaneId pane = spawned->pane;
        if (plan[i]) {
            auto active = host_.active_pane(spawned->tab);
            if (!active) {
                std::println(stderr, "restore: no active pane to split: {}", active.error());
                continue;
            }

            auto split = host_.split_pane(*active, *plan[i], path_from_cwd(record.cwd, options_.path_style));
            if (!split) {
                std::println(stderr, "restore: failed to create a new pane: {}", split.error());
                continue;
            }
            pane = *split;
        }

        replay_command(pane, record);
    }

    if (auto res = host_.activate_pane(spawned->pane); !res) {
        std::println(stderr, "restore: could not activate first pane: {}", res.error());
    }
    return true;
}

void LayoutReconstructor::replay_command(PaneId pane, const PaneRecord& record) {
    if (record.exe.empty() || is_shell(record.exe)) return;

    auto exe = resolver_.resolve(record.exe);
    if (!exe) return;

    if (auto res = host_.send_text(pane, *exe + "\n"); !res) {
        std::println(stderr, "restore: could not start '{}': {}", *exe, res.error());
    }
}

void LayoutReconstructor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tabsets] {}", msg);
    }
}
