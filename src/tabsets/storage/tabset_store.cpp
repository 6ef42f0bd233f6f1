#include "tabset_store.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::unexpected<StoreError> fail(StoreError::Kind kind, std::string message) {
    std::println(stderr, "store: {}", message);
    return std::unexpected(StoreError{kind, std::move(message)});
}

} // namespace

TabsetStore::TabsetStore(std::string directory, FileSystem& fs)
    : directory_(std::move(directory)), fs_(fs) {}

std::string TabsetStore::path_for(const std::string& name) const {
    return directory_ + "/" + name + std::string(SUFFIX);
}

std::expected<void, StoreError> TabsetStore::ensure_directory() {
    if (fs_.is_directory(directory_)) return {};

    auto res = fs_.make_directories(directory_);
    if (!res) {
        return fail(StoreError::Kind::IoError, res.error());
    }
    return {};
}

std::expected<void, StoreError> TabsetStore::save(const Snapshot& snapshot, const std::string& name) {
    auto path = path_for(name);
    auto tmp_path = path + ".tmp" + std::to_string(::getpid());

    {
        std::ofstream f(tmp_path, std::ios::trunc);
        if (!f.is_open()) {
            return fail(StoreError::Kind::IoError, "could not open " + tmp_path + " for writing");
        }
        f << json(snapshot).dump(2) << '\n';
        f.flush();
        if (!f) {
            f.close();
            if (auto rm = fs_.remove_file(tmp_path); !rm) {
                std::println(stderr, "store: {}", rm.error());
            }
            return fail(StoreError::Kind::IoError, "write failed: " + tmp_path);
        }
    }

    if (auto mv = fs_.move(tmp_path, path); !mv) {
        if (auto rm = fs_.remove_file(tmp_path); !rm) {
            std::println(stderr, "store: {}", rm.error());
        }
        return fail(StoreError::Kind::IoError, mv.error());
    }
    return {};
}

std::expected<Snapshot, StoreError> TabsetStore::load(const std::string& name) const {
    auto path = path_for(name);
    if (!fs_.is_file(path)) {
        return fail(StoreError::Kind::NotFound, "no tabset file " + path);
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        return fail(StoreError::Kind::IoError, "could not open " + path);
    }

    try {
        auto j = json::parse(f);
        return j.get<Snapshot>();
    } catch (const json::exception& e) {
        return fail(StoreError::Kind::ParseError, path + ": " + e.what());
    }
}

std::expected<std::vector<std::string>, StoreError> TabsetStore::list() const {
    auto entries = fs_.read_dir(directory_);
    if (!entries) {
        return fail(StoreError::Kind::DirectoryUnavailable, entries.error());
    }

    std::vector<std::string> names;
    for (const auto& entry : *entries) {
        if (entry.size() <= SUFFIX.size() || !entry.ends_with(SUFFIX)) continue;
        names.push_back(entry.substr(0, entry.size() - SUFFIX.size()));
    }
    std::ranges::sort(names);
    return names;
}

std::expected<void, StoreError> TabsetStore::remove(const std::string& name) {
    auto path = path_for(name);
    if (!fs_.is_path(path)) {
        return fail(StoreError::Kind::NotFound, "no tabset file " + path);
    }

    if (auto res = fs_.remove_file(path); !res) {
        return fail(StoreError::Kind::IoError, res.error());
    }
    return {};
}

std::expected<void, StoreError> TabsetStore::rename(const std::string& old_name, const std::string& new_name) {
    auto old_path = path_for(old_name);
    auto new_path = path_for(new_name);

    if (!fs_.is_path(old_path)) {
        return fail(StoreError::Kind::NotFound, "no tabset file " + old_path);
    }
    if (fs_.is_path(new_path)) {
        return fail(StoreError::Kind::AlreadyExists, new_path + " already exists");
    }

    if (auto res = fs_.move(old_path, new_path); !res) {
        return fail(StoreError::Kind::IoError, res.error());
    }
    return {};
}
