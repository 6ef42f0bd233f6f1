#pragma once

#include "../platform/terminal_host.hpp"
#include "../snapshot.hpp"

#include <expected>
#include <string>

class LayoutCapture {
public:
    explicit LayoutCapture(TerminalHost& host);

    // Read-only. Host errors are returned unchanged; an unreachable host
    // means there is nothing to save.
    std::expected<Snapshot, std::string> capture(WindowId window) const;

private:
    TerminalHost& host_;
};
