#pragma once

#include "platform/terminal_host.hpp"

#include <string>

enum class Severity { Info, Error };

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(WindowId window, const std::string& message, Severity severity) = 0;
};
