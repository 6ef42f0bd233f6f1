#include "config.hpp"
#include "platform/linux/notify_send_notifier.hpp"
#include "platform/linux/posix_filesystem.hpp"
#include "platform/linux/terminal_prompter.hpp"
#include "platform/linux/wezterm_cli_host.hpp"
#include "tabset_service.hpp"

#include <iostream>
#include <print>
#include <string>
#include <vector>

namespace {

// Remembers whether any notification reported a failure.
class ExitStatusNotifier : public Notifier {
public:
    explicit ExitStatusNotifier(Notifier& inner) : inner_(inner) {}

    void notify(WindowId window, const std::string& message, Severity severity) override {
        if (severity == Severity::Error) failed_ = true;
        inner_.notify(window, message, severity);
    }

    bool failed() const { return failed_; }

private:
    Notifier& inner_;
    bool failed_ = false;
};

void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  save [NAME]      Save the current window's tabs and panes");
    std::println(stderr, "  load [NAME]      Recreate a saved tabset in the current window");
    std::println(stderr, "  delete [NAME]    Delete a saved tabset");
    std::println(stderr, "  rename [OLD NEW] Rename a saved tabset");
    std::println(stderr, "  list             List saved tabsets");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -h, --help          Show this help");
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (verbose) {
        std::println(stderr, "[tabsets] Using tabsets directory {}", config.tabsets_dir);
    }

    PosixFileSystem fs;
    WeztermCliHost host(config.wezterm);
    TerminalPrompter prompter(std::cin, std::cout);
    NotifySendNotifier desktop(fs);
    ExitStatusNotifier notifier(desktop);

    TabsetService service(config, host, fs, prompter, notifier, verbose);
    service.init();

    const auto& command = args[0];
    const auto argn = args.size() - 1;

    if (command == "list") {
        auto names = service.list_names(-1);
        if (!names) return 1;
        for (const auto& name : *names) std::println("{}", name);
        return 0;
    }

    // Only save and load touch the terminal; the rest works on the store alone.
    WindowId window = -1;
    if (command == "save" || command == "load") {
        auto current = host.current_window();
        if (!current) {
            std::println(stderr, "Failed to find a wezterm window: {}", current.error());
            return 1;
        }
        window = *current;
    }

    if (command == "save" && argn <= 1) {
        if (argn == 1) service.save(window, args[1]);
        else service.save(window);
    } else if (command == "load" && argn <= 1) {
        if (argn == 1) service.load(window, args[1]);
        else service.load(window);
    } else if (command == "delete" && argn <= 1) {
        if (argn == 1) service.remove(window, args[1]);
        else service.remove(window);
    } else if (command == "rename" && (argn == 0 || argn == 2)) {
        if (argn == 2) service.rename(window, args[1], args[2]);
        else service.rename(window);
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    return notifier.failed() ? 1 : 0;
}
