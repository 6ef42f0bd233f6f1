#pragma once

#include "platform/filesystem.hpp"

class PosixFileSystem : public FileSystem {
public:
    bool is_path(const std::string& path) const override;
    bool is_file(const std::string& path) const override;
    bool is_directory(const std::string& path) const override;
    bool is_executable(const std::string& path) const override;

    std::string which(const std::string& command) const override;

    std::expected<std::vector<std::string>, std::string>
        read_dir(const std::string& path) const override;

    std::expected<void, std::string> make_directories(const std::string& path) override;
    std::expected<void, std::string> remove_file(const std::string& path) override;
    std::expected<void, std::string> remove_directory(const std::string& path) override;
    std::expected<void, std::string> move(const std::string& from, const std::string& to) override;
};
