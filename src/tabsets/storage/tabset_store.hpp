#pragma once

#include "../platform/filesystem.hpp"
#include "../snapshot.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

struct StoreError {
    enum class Kind { NotFound, ParseError, IoError, AlreadyExists, DirectoryUnavailable };

    Kind kind;
    std::string message;
};

// One JSON file per tabset: <directory>/<name>.tabset.json.
// Names are expected to be validated by the caller.
class TabsetStore {
public:
    static constexpr std::string_view SUFFIX = ".tabset.json";

    TabsetStore(std::string directory, FileSystem& fs);

    const std::string& directory() const { return directory_; }
    std::string path_for(const std::string& name) const;

    // Create the store directory (and parents) if it is missing.
    std::expected<void, StoreError> ensure_directory();

    // Overwrites any existing record of the same name.
    std::expected<void, StoreError> save(const Snapshot& snapshot, const std::string& name);
    std::expected<Snapshot, StoreError> load(const std::string& name) const;

    // Sorted lexicographically.
    std::expected<std::vector<std::string>, StoreError> list() const;

    std::expected<void, StoreError> remove(const std::string& name);

    // Never overwrites: fails with AlreadyExists if new_name is taken.
    std::expected<void, StoreError> rename(const std::string& old_name, const std::string& new_name);

private:
    std::string directory_;
    FileSystem& fs_;
};
