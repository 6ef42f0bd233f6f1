#pragma once

#include "platform/filesystem.hpp"
#include "platform/notifier.hpp"

#include <cstdio>

// Desktop notification through notify-send(1), printed to `fallback` when
// notify-send is not installed or fails. Errors are prefixed "FAILED: ".
class NotifySendNotifier : public Notifier {
public:
    explicit NotifySendNotifier(const FileSystem& fs, std::FILE* fallback = stderr);

    void notify(WindowId window, const std::string& message, Severity severity) override;

    static std::string format(const std::string& message, Severity severity);

private:
    std::string notify_send_;
    std::FILE* fallback_;
};
