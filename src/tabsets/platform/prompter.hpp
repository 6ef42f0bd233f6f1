#pragma once

#include "platform/terminal_host.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

struct PromptRequest {
    enum class Kind { Selection, FreeText };

    Kind kind = Kind::FreeText;
    std::string description;
    std::vector<std::string> choices;  // Selection
    bool fuzzy = false;                // Selection
    std::string initial_value;         // FreeText
};

// Asks the user something on behalf of a suspended operation. The host calls
// the continuation exactly once, later or immediately, with the answer or
// nullopt when the prompt was dismissed. Dropping it is also a cancel.
class Prompter {
public:
    using Continuation = std::function<void(std::optional<std::string>)>;

    virtual ~Prompter() = default;
    virtual void prompt(WindowId window, PromptRequest request, Continuation done) = 0;
};
