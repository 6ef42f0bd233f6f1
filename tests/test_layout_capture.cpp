#include <catch2/catch_test_macros.hpp>

#include "fake_terminal_host.hpp"
#include "layout/layout_capture.hpp"

TEST_CASE("LayoutCapture", "[capture]") {
    FakeTerminalHost host;
    LayoutCapture capture(host);

    auto window = host.add_window(1600, 900);
    host.windows[window].colors = {{"background", "#000000"}};
    host.add_tab(window, "A", {{0, 0, "file:///home/u/proj", "/bin/bash", {}}});
    host.add_tab(window, "B", {
        {0, 0, "file:///home/u/proj", "bash", {}},
        {0, 40, "file:///home/u/proj/sub", "/usr/bin/top", {}},
    });

    SECTION("ReadsWholeWindow") {
        auto s = capture.capture(window);
        REQUIRE(s.has_value());
        REQUIRE(s->window_width == 1600);
        REQUIRE(s->window_height == 900);
        REQUIRE(s->colors["background"] == "#000000");
        REQUIRE(s->tabs.size() == 2);
        REQUIRE(s->tabs[0].title == "A");
        REQUIRE(s->tabs[0].panes.size() == 1);
        REQUIRE(s->tabs[0].panes[0].exe == "/bin/bash");
        REQUIRE(s->tabs[1].title == "B");
        REQUIRE(s->tabs[1].panes.size() == 2);
        REQUIRE(s->tabs[1].panes[1].left == 40);
        REQUIRE(s->tabs[1].panes[1].cwd == "file:///home/u/proj/sub");
        REQUIRE(s->tabs[1].panes[1].exe == "/usr/bin/top");
    }

    SECTION("DoesNotMutate") {
        REQUIRE(capture.capture(window).has_value());
        REQUIRE(host.calls.empty());
    }

    SECTION("HostFailurePropagates") {
        host.unreachable = true;
        auto s = capture.capture(window);
        REQUIRE_FALSE(s.has_value());
        REQUIRE_FALSE(s.error().empty());
    }
}
