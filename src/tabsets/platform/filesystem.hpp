#pragma once

#include <expected>
#include <string>
#include <vector>

class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool is_path(const std::string& path) const = 0;
    virtual bool is_file(const std::string& path) const = 0;
    virtual bool is_directory(const std::string& path) const = 0;
    virtual bool is_executable(const std::string& path) const = 0;

    // Search $PATH for a command. Returns empty if not found.
    virtual std::string which(const std::string& command) const = 0;

    // Names (not paths) of the entries in a directory.
    virtual std::expected<std::vector<std::string>, std::string>
        read_dir(const std::string& path) const = 0;

    virtual std::expected<void, std::string> make_directories(const std::string& path) = 0;
    virtual std::expected<void, std::string> remove_file(const std::string& path) = 0;
    virtual std::expected<void, std::string> remove_directory(const std::string& path) = 0;
    virtual std::expected<void, std::string> move(const std::string& from, const std::string& to) = 0;
};
