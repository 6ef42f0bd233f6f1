#include "executable_resolver.hpp"

#include <print>

ExecutableResolver::ExecutableResolver(const FileSystem& fs)
    : fs_(fs) {}

std::optional<std::string> ExecutableResolver::resolve(const std::string& command) const {
    if (fs_.is_executable(command)) {
        return command;
    }

    auto found = fs_.which(command);
    if (!found.empty()) {
        return found;
    }

    std::println(stderr, "resolve: failed to resolve executable '{}'", command);
    return std::nullopt;
}
