#include "process_name.hpp"

#include <algorithm>
#include <array>
#include <string_view>

std::string process_basename(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

bool is_shell(const std::string& exe) {
    static constexpr std::array<std::string_view, 8> shells = {
        "sh", "bash", "zsh", "fish", "nu", "dash", "csh", "ksh"};
    auto name = process_basename(exe);
    return std::ranges::any_of(shells, [&](std::string_view s) { return name == s; });
}
