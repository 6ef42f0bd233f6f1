#pragma once

#include "../cwd_path.hpp"
#include "../executable_resolver.hpp"
#include "../platform/terminal_host.hpp"
#include "../snapshot.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

enum class ReconstructError { InvalidSnapshot };

struct RestoreOptions {
    bool restore_colors = false;
    bool restore_dimensions = false;
    PathStyle path_style = PathStyle::Posix;
};

// Split direction for every pane of a tab. The first pane is the tab's
// initial pane (nullopt); each later pane goes below its predecessor when
// both share the same left column, and to its right otherwise.
std::vector<std::optional<SplitDirection>> plan_splits(const TabRecord& tab);

// Replays a snapshot into a live window. Only the layout and the foreground
// command names come back: typing a command name re-launches the program,
// it does not restore shell history, environment or program state.
class LayoutReconstructor {
public:
    LayoutReconstructor(TerminalHost& host, const ExecutableResolver& resolver,
                        RestoreOptions options, bool verbose = false);

    // Fails only for a structurally empty snapshot, before touching the
    // window. Tabs or panes that cannot be created are logged and skipped;
    // whatever was built stays in place.
    std::expected<void, ReconstructError> reconstruct(WindowId window, const Snapshot& snapshot);

private:
    static bool is_valid(const Snapshot& snapshot);

    // Exits the lone shell of a fresh window. True if the window was empty.
    bool clear_if_empty(WindowId window);
    void restore_chrome(WindowId window, const Snapshot& snapshot);
    bool replay_tab(WindowId window, const TabRecord& tab);
    void replay_command(PaneId pane, const PaneRecord& record);

    void log(const std::string& msg);

    TerminalHost& host_;
    const ExecutableResolver& resolver_;
    RestoreOptions options_;
    bool verbose_;
};
