#include "layout_capture.hpp"

LayoutCapture::LayoutCapture(TerminalHost& host)
    : host_(host) {}

std::expected<Snapshot, std::string> LayoutCapture::capture(WindowId window) const {
    auto dims = host_.window_dimensions(window);
    if (!dims) return std::unexpected(dims.error());

    auto colors = host_.window_colors(window);
    if (!colors) return std::unexpected(colors.error());

    Snapshot snapshot;
    snapshot.window_width = dims->pixel_width;
    snapshot.window_height = dims->pixel_height;
    snapshot.colors = colors->is_null() ? nlohmann::json::object() : std::move(*colors);

    auto tabs = host_.tabs(window);
    if (!tabs) return std::unexpected(tabs.error());

    for (TabId tab : *tabs) {
        auto title = host_.tab_title(tab);
        if (!title) return std::unexpected(title.error());

        auto panes = host_.panes_with_info(tab);
        if (!panes) return std::unexpected(panes.error());

        TabRecord record{.title = std::move(*title), .panes = {}};
        for (auto& info : *panes) {
            record.panes.push_back(PaneRecord{
                .left = info.left,
                .cwd = std::move(info.cwd),
                .exe = std::move(info.foreground_process),
            });
        }
        snapshot.tabs.push_back(std::move(record));
    }

    return snapshot;
}
