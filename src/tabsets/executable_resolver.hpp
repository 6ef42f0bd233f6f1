#pragma once

#include "platform/filesystem.hpp"

#include <optional>
#include <string>

class ExecutableResolver {
public:
    explicit ExecutableResolver(const FileSystem& fs);

    // Returns the command itself when it is directly executable, otherwise
    // the $PATH lookup result. nullopt (logged) when neither works; a
    // program present at save time may be gone at load time.
    std::optional<std::string> resolve(const std::string& command) const;

private:
    const FileSystem& fs_;
};
