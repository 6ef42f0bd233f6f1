#pragma once

#include "config.hpp"
#include "executable_resolver.hpp"
#include "layout/layout_capture.hpp"
#include "layout/layout_reconstructor.hpp"
#include "platform/filesystem.hpp"
#include "platform/notifier.hpp"
#include "platform/prompter.hpp"
#include "platform/terminal_host.hpp"
#include "storage/tabset_store.hpp"

#include <expected>
#include <functional>
#include <string>
#include <vector>

// The user-facing operations. Every call ends in exactly one notification
// (none when a prompt is cancelled) and mutates the store at most once.
class TabsetService {
public:
    TabsetService(Config config, TerminalHost& host, FileSystem& fs,
                  Prompter& prompter, Notifier& notifier, bool verbose = false);

    TabsetService(const TabsetService&) = delete;
    TabsetService& operator=(const TabsetService&) = delete;

    // Creates the store directory. A failure is logged; later operations
    // report their own errors.
    bool init();

    // Capture now, then ask for a name.
    void save(WindowId window);
    bool save(WindowId window, const std::string& name);

    void load(WindowId window);
    bool load(WindowId window, const std::string& name);

    void remove(WindowId window);
    bool remove(WindowId window, const std::string& name);

    // Select the record, then ask for the new name.
    void rename(WindowId window);
    bool rename(WindowId window, const std::string& old_name, const std::string& new_name);

    // Names in selection order. Errors are also notified.
    std::expected<std::vector<std::string>, StoreError> list_names(WindowId window);

    const Config& config() const { return config_; }

private:
    using SelectionHandler = std::function<void(const std::string&)>;

    bool save_snapshot(WindowId window, const Snapshot& snapshot, const std::string& name);

    // Lists the store and prompts for one of its names.
    void select_tabset(WindowId window, const std::string& description, SelectionHandler on_selected);

    bool check_name(WindowId window, const std::string& name);
    void notify(WindowId window, const std::string& message, Severity severity = Severity::Info);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    Prompter& prompter_;
    Notifier& notifier_;

    TabsetStore store_;
    ExecutableResolver resolver_;
    LayoutCapture capture_;
    LayoutReconstructor reconstructor_;
};
