#include "platform/linux/notify_send_notifier.hpp"

#include "platform/linux/child_process.hpp"

#include <print>

NotifySendNotifier::NotifySendNotifier(const FileSystem& fs, std::FILE* fallback)
    : notify_send_(fs.which("notify-send")), fallback_(fallback) {}

void NotifySendNotifier::notify(WindowId /*window*/, const std::string& message, Severity severity) {
    auto text = format(message, severity);

    if (!notify_send_.empty()) {
        auto res = run_child_process({notify_send_, "-a", "tabsets", "-t", "4000", "-u", "normal", text});
        if (res) return;
        std::println(stderr, "notify: {}", res.error());
    }

    std::println(fallback_, "{}", text);
}

std::string NotifySendNotifier::format(const std::string& message, Severity severity) {
    if (severity == Severity::Error) return "FAILED: " + message;
    return message;
}
