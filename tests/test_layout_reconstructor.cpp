#include <catch2/catch_test_macros.hpp>

#include "fake_filesystem.hpp"
#include "fake_terminal_host.hpp"
#include "layout/layout_reconstructor.hpp"

#include <string>
#include <vector>

namespace {

PaneRecord pane(int left, const std::string& path, const std::string& exe) {
    return PaneRecord{.left = left, .cwd = "file://" + path, .exe = exe};
}

TabRecord tab_with_lefts(std::vector<int> lefts) {
    TabRecord tab{.title = "t", .panes = {}};
    for (int l : lefts) tab.panes.push_back(pane(l, "/x", "bash"));
    return tab;
}

Snapshot work_snapshot() {
    Snapshot s;
    s.window_width = 1024;
    s.window_height = 768;
    s.colors = {{"background", "#202020"}};
    s.tabs = {
        TabRecord{.title = "A", .panes = {pane(0, "/home/u/proj", "bash")}},
        TabRecord{.title = "B", .panes = {pane(0, "/home/u/proj", "bash"), pane(40, "/home/u/proj/sub", "top")}},
    };
    return s;
}

bool called(const FakeTerminalHost& host, const std::string& prefix) {
    for (const auto& c : host.calls)
        if (c.starts_with(prefix)) return true;
    return false;
}

} // namespace

TEST_CASE("Split planning", "[restore]") {

    SECTION("StackedThenBeside") {
        auto plan = plan_splits(tab_with_lefts({0, 0, 40}));
        REQUIRE(plan.size() == 3);
        REQUIRE_FALSE(plan[0].has_value());
        REQUIRE(plan[1] == SplitDirection::Bottom);
        REQUIRE(plan[2] == SplitDirection::Right);
    }

    SECTION("BesideThenStacked") {
        auto plan = plan_splits(tab_with_lefts({0, 40, 40}));
        REQUIRE(plan.size() == 3);
        REQUIRE_FALSE(plan[0].has_value());
        REQUIRE(plan[1] == SplitDirection::Right);
        REQUIRE(plan[2] == SplitDirection::Bottom);
    }

    SECTION("OnlyPreviousSiblingMatters") {
        auto plan = plan_splits(tab_with_lefts({0, 40, 0}));
        REQUIRE(plan[2] == SplitDirection::Right);
    }

    SECTION("SinglePane") {
        auto plan = plan_splits(tab_with_lefts({12}));
        REQUIRE(plan.size() == 1);
        REQUIRE_FALSE(plan[0].has_value());
    }
}

TEST_CASE("LayoutReconstructor", "[restore]") {
    FakeTerminalHost host;
    FakeFileSystem fs;
    fs.search_path["top"] = "/usr/bin/top";
    ExecutableResolver resolver(fs);

    RestoreOptions options;
    auto window = host.add_window(800, 600);

    SECTION("RejectsEmptySnapshot") {
        host.add_tab(window, "", {{0, 0, "file:///", "bash", {}}});
        LayoutReconstructor r(host, resolver, options);

        Snapshot s;
        auto res = r.reconstruct(window, s);
        REQUIRE_FALSE(res);
        REQUIRE(res.error() == ReconstructError::InvalidSnapshot);
        REQUIRE(host.calls.empty());
    }

    SECTION("RejectsTabWithoutPanes") {
        host.add_tab(window, "", {{0, 0, "file:///", "bash", {}}});
        LayoutReconstructor r(host, resolver, options);

        auto s = work_snapshot();
        s.tabs.push_back(TabRecord{.title = "empty", .panes = {}});
        REQUIRE_FALSE(r.reconstruct(window, s));
        REQUIRE(host.calls.empty());
    }

    SECTION("WorkTabsetIntoEmptyWindow") {
        host.add_tab(window, "", {{0, 0, "file:///home/u", "/bin/bash", {}}});
        LayoutReconstructor r(host, resolver, options);

        REQUIRE(r.reconstruct(window, work_snapshot()));
        REQUIRE(host.calls == std::vector<std::string>{
            "send_text 0.0 exit\\r",
            "spawn_tab /home/u/proj",
            "set_tab_title A",
            "activate_tab",
            "activate_pane 0.0",
            "spawn_tab /home/u/proj",
            "set_tab_title B",
            "activate_tab",
            "split_pane 1.0 right /home/u/proj/sub",
            "send_text 1.1 /usr/bin/top\\n",
            "activate_pane 1.0",
        });

        auto& tabs = host.windows[window].tabs;
        REQUIRE(tabs.size() == 2);
        REQUIRE(tabs[0].title == "A");
        REQUIRE(tabs[0].panes.size() == 1);
        REQUIRE(tabs[0].panes[0].typed.empty());
        REQUIRE(tabs[1].title == "B");
        REQUIRE(tabs[1].panes.size() == 2);
        REQUIRE(tabs[1].panes[1].left > tabs[1].panes[0].left);
        REQUIRE(tabs[1].panes[1].typed == std::vector<std::string>{"/usr/bin/top\n"});
        REQUIRE(tabs[1].active == tabs[1].panes[0].id);
    }

    SECTION("BusyLonePaneIsKept") {
        host.add_tab(window, "editor", {{0, 0, "file:///home/u", "vim", {}}});
        LayoutReconstructor r(host, resolver, options);

        REQUIRE(r.reconstruct(window, work_snapshot()));
        REQUIRE_FALSE(called(host, "send_text 0.0 exit"));

        auto& tabs = host.windows[window].tabs;
        REQUIRE(tabs.size() == 3);
        REQUIRE(tabs[0].title == "editor");
        REQUIRE(tabs[1].title == "A");
        REQUIRE(tabs[2].title == "B");
    }

    SECTION("SeveralTabsAreNotCleared") {
        host.add_tab(window, "one", {{0, 0, "file:///", "bash", {}}});
        host.add_tab(window, "two", {{0, 0, "file:///", "bash", {}}});
        LayoutReconstructor r(host, resolver, options);

        REQUIRE(r.reconstruct(window, work_snapshot()));
        REQUIRE_FALSE(called(host, "send_text 0.0 exit"));
        REQUIRE(host.windows[window].tabs.size() == 4);
    }

    SECTION("LoneTabWithSplitsIsNotCleared") {
        host.add_tab(window, "one", {{0, 0, "file:///", "bash", {}}, {0, 40, "file:///", "bash", {}}});
        LayoutReconstructor r(host, resolver, options);

        REQUIRE(r.reconstruct(window, work_snapshot()));
        REQUIRE_FALSE(called(host, "send_text 0.0 exit"));
        REQUIRE(host.windows[window].tabs.size() == 3);
    }

    SECTION("ChromeRestoredIntoEmptyWindow") {
        host.add_tab(window, "", {{0, 0, "file:///", "zsh", {}}});
        options.restore_colors = true;
        options.restore_dimensions = true;
        LayoutReconstructor r(host, resolver, options);

        REQUIRE(r.reconstruct(window, work_snapshot()));
        REQUIRE(host.windows[window].dims.pixel_width == 1024);
        REQUIRE(host.windows[window].dims.pixel_height == 768);
        REQUIRE(host.windows[window].colors["background"] == "#202020");
    }

    SECTION("ChromeLeftAloneWhenOptionsOff") {
        host.add_tab(window, "", {{0, 0, "file:///", "zsh", {}}});
        LayoutReconstructor r(host, resolver, options);

        REQUIRE(r.reconstruct(window, work_snapshot()));
        REQUIRE_FALSE(called(host, "set_window_colors"));
        REQUIRE_FALSE(called(host, "set_window_size"));
    }

    SECTION("ChromeNeverTouchedInBusyWindow") {
        host.add_tab(window, "", {{0, 0, "file:///", "htop", {}}});
        options.restore_colors = true;
        options.restore_dimensions = true;
        LayoutReconstructor r(host, resolver, options);

        REQUIRE(r.reconstruct(window, work_snapshot()));
        REQUIRE_FALSE(called(host, "set_window_colors"));
        REQUIRE_FALSE(called(host, "set_window_size"));
        REQUIRE(host.windows[window].dims.pixel_width == 800);
    }

    SECTION("ChromeRefusalIsNotFatal") {
        host.add_tab(window, "", {{0, 0, "file:///", "bash", {}}});
        host.refuse_chrome = true;
        options.restore_colors = true;
        options.restore_dimensions = true;
        LayoutReconstructor r(host, resolver, options);

        REQUIRE(r.reconstruct(window, work_snapshot()));
        REQUIRE(host.windows[window].tabs.size() == 2);
    }

    SECTION("TabFailureStopsRemainingTabs") {
        host.add_tab(window, "", {{0, 0, "file:///", "vim", {}}});
        host.spawn_budget = 1;
        LayoutReconstructor r(host, resolver, options);

        auto s = work_snapshot();
        s.tabs.push_back(TabRecord{.title = "C", .panes = {pane(0, "/tmp", "bash")}});

        REQUIRE(r.reconstruct(window, s));
        int spawns = 0;
        for (const auto& c : host.calls)
            if (c.starts_with("spawn_tab")) ++spawns;
        REQUIRE(spawns == 2);
        REQUIRE_FALSE(called(host, "spawn_tab /tmp"));

        // Nothing is rolled back
        auto& tabs = host.windows[window].tabs;
        REQUIRE(tabs.size() == 2);
        REQUIRE(tabs[1].title == "A");
    }

    SECTION("PaneFailureContinuesWithNextPane") {
        host.add_tab(window, "", {{0, 0, "file:///", "vim", {}}});
        host.failing_split_cwds.insert("/b");
        LayoutReconstructor r(host, resolver, options);

        Snapshot s;
        s.tabs = {TabRecord{.title = "T", .panes = {
            pane(0, "/a", "bash"), pane(40, "/b", "top"), pane(40, "/c", "top"),
        }}};

        REQUIRE(r.reconstruct(window, s));
        REQUIRE(called(host, "split_pane 1.0 right /b"));
        REQUIRE(called(host, "split_pane 1.0 bottom /c"));

        auto& t = host.windows[window].tabs[1];
        REQUIRE(t.panes.size() == 2);
        REQUIRE(t.panes[1].typed == std::vector<std::string>{"/usr/bin/top\n"});
    }

    SECTION("SplitsFollowActivePane") {
        host.add_tab(window, "", {{0, 0, "file:///", "vim", {}}});
        LayoutReconstructor r(host, resolver, options);

        Snapshot s;
        s.tabs = {TabRecord{.title = "T", .panes = {
            pane(0, "/a", "bash"), pane(0, "/b", "bash"), pane(40, "/c", "bash"),
        }}};

        REQUIRE(r.reconstruct(window, s));
        REQUIRE(called(host, "split_pane 1.0 bottom /b"));
        REQUIRE(called(host, "split_pane 1.1 right /c"));
    }

    SECTION("UnresolvedCommandIsSkipped") {
        host.add_tab(window, "", {{0, 0, "file:///", "vim", {}}});
        LayoutReconstructor r(host, resolver, options);

        Snapshot s;
        s.tabs = {TabRecord{.title = "T", .panes = {
            pane(0, "/a", "no_such_program_xyz"), pane(40, "/b", "top"),
        }}};

        REQUIRE(r.reconstruct(window, s));
        auto& t = host.windows[window].tabs[1];
        REQUIRE(t.panes.size() == 2);
        REQUIRE(t.panes[0].typed.empty());
        REQUIRE(t.panes[1].typed == std::vector<std::string>{"/usr/bin/top\n"});
    }

    SECTION("DirectlyExecutablePathTypedAsRecorded") {
        host.add_tab(window, "", {{0, 0, "file:///", "vim", {}}});
        fs.executables.insert("/opt/tools/monitor");
        LayoutReconstructor r(host, resolver, options);

        Snapshot s;
        s.tabs = {TabRecord{.title = "T", .panes = {pane(0, "/a", "/opt/tools/monitor")}}};

        REQUIRE(r.reconstruct(window, s));
        REQUIRE(host.windows[window].tabs[1].panes[0].typed == std::vector<std::string>{"/opt/tools/monitor\n"});
    }

    SECTION("PlainPathCwdPassesThrough") {
        host.add_tab(window, "", {{0, 0, "file:///", "vim", {}}});
        LayoutReconstructor r(host, resolver, options);

        Snapshot s;
        s.tabs = {TabRecord{.title = "T", .panes = {PaneRecord{.left = 0, .cwd = "/srv/data", .exe = "bash"}}}};

        REQUIRE(r.reconstruct(window, s));
        REQUIRE(called(host, "spawn_tab /srv/data"));
    }
}
