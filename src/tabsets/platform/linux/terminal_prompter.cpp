#include "platform/linux/terminal_prompter.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <ostream>
#include <print>
#include <string>

TerminalPrompter::TerminalPrompter(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

void TerminalPrompter::prompt(WindowId /*window*/, PromptRequest request, Continuation done) {
    std::optional<std::string> answer;
    if (request.kind == PromptRequest::Kind::Selection) {
        answer = select(request);
    } else {
        answer = input_line(request);
    }
    done(std::move(answer));
}

bool TerminalPrompter::fuzzy_match(const std::string& candidate, const std::string& query) {
    auto lower = [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); };
    size_t pos = 0;
    for (char c : query) {
        while (pos < candidate.size() && lower(candidate[pos]) != lower(c)) ++pos;
        if (pos == candidate.size()) return false;
        ++pos;
    }
    return true;
}

std::optional<std::string> TerminalPrompter::select(const PromptRequest& request) {
    std::vector<std::string> shown = request.choices;

    for (;;) {
        std::println(out_, "{}", request.description);
        for (size_t i = 0; i < shown.size(); ++i) {
            std::println(out_, "  {}) {}", i + 1, shown[i]);
        }
        std::print(out_, "> ");
        out_.flush();

        std::string line;
        if (!std::getline(in_, line) || line.empty()) return std::nullopt;

        size_t index = 0;
        auto [ptr, err] = std::from_chars(line.data(), line.data() + line.size(), index);
        if (err == std::errc{} && ptr == line.data() + line.size()) {
            if (index >= 1 && index <= shown.size()) return shown[index - 1];
            std::println(out_, "No entry {}.", index);
            continue;
        }

        if (std::ranges::find(shown, line) != shown.end()) return line;

        if (!request.fuzzy) {
            std::println(out_, "Unknown entry '{}'.", line);
            continue;
        }

        std::vector<std::string> matches;
        std::ranges::copy_if(request.choices, std::back_inserter(matches),
                             [&](const std::string& c) { return fuzzy_match(c, line); });
        if (matches.size() == 1) return matches.front();
        if (matches.empty()) {
            std::println(out_, "Nothing matches '{}'.", line);
        } else {
            shown = std::move(matches);
        }
    }
}

std::optional<std::string> TerminalPrompter::input_line(const PromptRequest& request) {
    if (request.initial_value.empty()) {
        std::print(out_, "{} ", request.description);
    } else {
        std::print(out_, "{} [{}] ", request.description, request.initial_value);
    }
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) return std::nullopt;
    if (line.empty()) {
        if (request.initial_value.empty()) return std::nullopt;
        return request.initial_value;
    }
    return line;
}
