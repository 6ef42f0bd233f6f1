#include "tabset_service.hpp"

#include "name_validator.hpp"

#include <print>

TabsetService::TabsetService(Config config, TerminalHost& host, FileSystem& fs,
                             Prompter& prompter, Notifier& notifier, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      prompter_(prompter), notifier_(notifier),
      store_(config_.tabsets_dir, fs),
      resolver_(fs),
      capture_(host),
      reconstructor_(host, resolver_,
                     RestoreOptions{
                         .restore_colors = config_.restore_colors,
                         .restore_dimensions = config_.restore_dimensions,
                     },
                     verbose) {}

bool TabsetService::init() {
    if (!store_.ensure_directory()) {
        std::println(stderr, "Failed to create tabsets directory '{}'", store_.directory());
        return false;
    }
    log("Tabsets directory: " + store_.directory());
    return true;
}

void TabsetService::save(WindowId window) {
    auto snapshot = capture_.capture(window);
    if (!snapshot) {
        std::println(stderr, "capture: {}", snapshot.error());
        notify(window, "Unable to capture window layout.", Severity::Error);
        return;
    }

    PromptRequest request{
        .kind = PromptRequest::Kind::FreeText,
        .description = "Enter tabset name:",
        .choices = {},
        .fuzzy = false,
        .initial_value = "default",
    };

    prompter_.prompt(window, std::move(request),
                     [this, window, data = std::move(*snapshot)](std::optional<std::string> name) {
                         if (!name) return;
                         save_snapshot(window, data, *name);
                     });
}

bool TabsetService::save(WindowId window, const std::string& name) {
    // Validate before touching the window at all.
    if (!check_name(window, name)) return false;

    auto snapshot = capture_.capture(window);
    if (!snapshot) {
        std::println(stderr, "capture: {}", snapshot.error());
        notify(window, "Unable to capture window layout.", Severity::Error);
        return false;
    }
    return save_snapshot(window, *snapshot, name);
}

bool TabsetService::save_snapshot(WindowId window, const Snapshot& snapshot, const std::string& name) {
    if (!check_name(window, name)) return false;

    if (!store_.save(snapshot, name)) {
        notify(window, "Unable to save '" + store_.path_for(name) + "'.", Severity::Error);
        return false;
    }
    notify(window, "Tabset '" + name + "' saved successfully.");
    return true;
}

void TabsetService::load(WindowId window) {
    select_tabset(window, "Select tabset to load:",
                  [this, window](const std::string& name) { load(window, name); });
}

bool TabsetService::load(WindowId window, const std::string& name) {
    if (!check_name(window, name)) return false;

    auto snapshot = store_.load(name);
    if (!snapshot) {
        auto path = store_.path_for(name);
        switch (snapshot.error().kind) {
            case StoreError::Kind::NotFound:
                notify(window, "Tabset file not found '" + path + "'.", Severity::Error);
                break;
            case StoreError::Kind::ParseError:
                notify(window, "Tabset file is corrupt '" + path + "'.", Severity::Error);
                break;
            default:
                notify(window, "Tabset loading failed '" + name + "'.", Severity::Error);
                break;
        }
        return false;
    }

    if (!reconstructor_.reconstruct(window, *snapshot)) {
        notify(window, "Tabset loading failed '" + name + "'.", Severity::Error);
        return false;
    }
    notify(window, "Tabset loaded '" + name + "'.");
    return true;
}

void TabsetService::remove(WindowId window) {
    select_tabset(window, "Select tabset to delete:",
                  [this, window](const std::string& name) { remove(window, name); });
}

bool TabsetService::remove(WindowId window, const std::string& name) {
    if (!check_name(window, name)) return false;

    auto res = store_.remove(name);
    if (!res) {
        if (res.error().kind == StoreError::Kind::NotFound) {
            notify(window, "Tabset '" + name + "' not found.", Severity::Error);
        } else {
            notify(window, "Unable to delete tabsets file '" + store_.path_for(name) + "'.",
                   Severity::Error);
        }
        return false;
    }
    notify(window, "Deleted tabset '" + name + "'.");
    return true;
}

void TabsetService::rename(WindowId window) {
    select_tabset(window, "Select tabset to rename:", [this, window](const std::string& old_name) {
        PromptRequest request{
            .kind = PromptRequest::Kind::FreeText,
            .description = "Enter new tabset name:",
            .choices = {},
            .fuzzy = false,
            .initial_value = {},
        };
        prompter_.prompt(window, std::move(request),
                         [this, window, old_name](std::optional<std::string> new_name) {
                             if (!new_name) return;
                             rename(window, old_name, *new_name);
                         });
    });
}

bool TabsetService::rename(WindowId window, const std::string& old_name, const std::string& new_name) {
    if (!check_name(window, old_name) || !check_name(window, new_name)) return false;

    auto res = store_.rename(old_name, new_name);
    if (!res) {
        switch (res.error().kind) {
            case StoreError::Kind::NotFound:
                notify(window, "Tabset '" + old_name + "' not found.", Severity::Error);
                break;
            case StoreError::Kind::AlreadyExists:
                notify(window, "Tabset '" + new_name + "' already exists.", Severity::Error);
                break;
            default:
                notify(window, "Unable to rename '" + store_.path_for(old_name) + "' to '" +
                                   store_.path_for(new_name) + "'.",
                       Severity::Error);
                break;
        }
        return false;
    }
    notify(window, "Tabset '" + old_name + "' successfully renamed to '" + new_name + "'.");
    return true;
}

std::expected<std::vector<std::string>, StoreError> TabsetService::list_names(WindowId window) {
    auto names = store_.list();
    if (!names) {
        notify(window, "Could not read tabsets directory '" + store_.directory() + "'.", Severity::Error);
    }
    return names;
}

void TabsetService::select_tabset(WindowId window, const std::string& description,
                                  SelectionHandler on_selected) {
    auto names = list_names(window);
    if (!names) return;

    if (names->empty()) {
        notify(window, "No saved tabset files found.");
        return;
    }

    PromptRequest request{
        .kind = PromptRequest::Kind::Selection,
        .description = description,
        .choices = std::move(*names),
        .fuzzy = config_.fuzzy_selector,
        .initial_value = {},
    };

    prompter_.prompt(window, std::move(request),
                     [on_selected = std::move(on_selected)](std::optional<std::string> name) {
                         if (!name) return;
                         on_selected(*name);
                     });
}

bool TabsetService::check_name(WindowId window, const std::string& name) {
    if (is_valid_tabset_name(name)) return true;
    notify(window, "Invalid tabset name '" + name + "'.", Severity::Error);
    return false;
}

void TabsetService::notify(WindowId window, const std::string& message, Severity severity) {
    // The notifier is what the user sees; the log only mirrors it.
    log(severity == Severity::Error ? "error: " + message : message);
    notifier_.notify(window, message, severity);
}

void TabsetService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tabsets] {}", msg);
    }
}
