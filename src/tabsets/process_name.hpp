#pragma once

#include <string>

// Final path component; both '/' and '\' separate components.
std::string process_basename(const std::string& path);

// Is this foreground command an interactive shell sitting at its prompt?
bool is_shell(const std::string& exe);
