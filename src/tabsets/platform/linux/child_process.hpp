#pragma once

#include <expected>
#include <string>
#include <vector>

// Runs argv[0] (searched in $PATH) and waits for it. Returns its stdout;
// a non-zero exit status is an error.
std::expected<std::string, std::string> run_child_process(const std::vector<std::string>& argv);
