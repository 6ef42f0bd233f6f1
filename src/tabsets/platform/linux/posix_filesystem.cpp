#include "platform/linux/posix_filesystem.hpp"

#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

bool PosixFileSystem::is_path(const std::string& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool PosixFileSystem::is_file(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool PosixFileSystem::is_directory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool PosixFileSystem::is_executable(const std::string& path) const {
    if (path.empty() || is_directory(path)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

std::string PosixFileSystem::which(const std::string& command) const {
    if (command.empty()) return {};
    // Like which(1): a name with a slash is never looked up in $PATH.
    if (command.find('/') != std::string::npos) {
        return is_executable(command) ? command : std::string{};
    }

    const char* env = std::getenv("PATH");
    if (!env) return {};

    std::string_view path(env);
    while (!path.empty()) {
        auto sep = path.find(':');
        auto dir = path.substr(0, sep);
        path = sep == std::string_view::npos ? std::string_view{} : path.substr(sep + 1);

        if (dir.empty()) dir = ".";
        auto candidate = (fs::path(dir) / command).string();
        if (is_executable(candidate)) return candidate;
    }
    return {};
}

std::expected<std::vector<std::string>, std::string>
PosixFileSystem::read_dir(const std::string& path) const {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return std::unexpected(path + ": " + ec.message());
    }

    std::vector<std::string> names;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) return std::unexpected(path + ": " + ec.message());
        names.push_back(it->path().filename().string());
    }
    if (ec) return std::unexpected(path + ": " + ec.message());
    return names;
}

std::expected<void, std::string> PosixFileSystem::make_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) return std::unexpected("mkdir " + path + ": " + ec.message());
    return {};
}

std::expected<void, std::string> PosixFileSystem::remove_file(const std::string& path) {
    std::error_code ec;
    if (is_directory(path)) {
        return std::unexpected("rm " + path + ": is a directory");
    }
    if (!fs::remove(path, ec) && !ec) {
        return std::unexpected("rm " + path + ": no such file");
    }
    if (ec) return std::unexpected("rm " + path + ": " + ec.message());
    return {};
}

std::expected<void, std::string> PosixFileSystem::remove_directory(const std::string& path) {
    std::error_code ec;
    if (!is_directory(path)) {
        return std::unexpected("rmdir " + path + ": not a directory");
    }
    // fs::remove only removes empty directories, like rmdir(1).
    fs::remove(path, ec);
    if (ec) return std::unexpected("rmdir " + path + ": " + ec.message());
    return {};
}

std::expected<void, std::string> PosixFileSystem::move(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) return std::unexpected("mv " + from + " " + to + ": " + ec.message());
    return {};
}
