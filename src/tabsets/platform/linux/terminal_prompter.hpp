#pragma once

#include "platform/prompter.hpp"

#include <istream>
#include <ostream>

// Line-based prompts on a terminal. Resumes the continuation before
// returning; end of input cancels.
class TerminalPrompter : public Prompter {
public:
    TerminalPrompter(std::istream& in, std::ostream& out);

    void prompt(WindowId window, PromptRequest request, Continuation done) override;

    // Characters of `query` appear in `candidate` in order (case-insensitive).
    static bool fuzzy_match(const std::string& candidate, const std::string& query);

private:
    std::optional<std::string> select(const PromptRequest& request);
    std::optional<std::string> input_line(const PromptRequest& request);

    std::istream& in_;
    std::ostream& out_;
};
