#include "name_validator.hpp"

#include <algorithm>

namespace {

bool is_name_char(char c) {
    if (c >= 'a' && c <= 'z') return true;
    if (c >= 'A' && c <= 'Z') return true;
    if (c >= '0' && c <= '9') return true;
    return c == '+' || c == '.' || c == '-' || c == '_' || c == ' ';
}

} // namespace

bool is_valid_tabset_name(const std::string& name) {
    if (name.empty()) return false;
    return std::ranges::all_of(name, is_name_char);
}
