#pragma once

#include <string>

// Non-empty, and only ASCII letters, digits, '+', '.', '-', '_' and space.
// Rules out path separators so a name can never leave the store directory.
bool is_valid_tabset_name(const std::string& name);
