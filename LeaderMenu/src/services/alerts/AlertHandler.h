#pragma once
#include <string>

namespace lmenu {

enum class AlertStyle { Informational, Warning, Critical };

const char* toString(AlertStyle style) noexcept;

// User-facing problem reports from the model and persistence layers.
class AlertHandler {
public:
    virtual ~AlertHandler() = default;
    virtual void showAlert(AlertStyle style, const std::string& message, const std::string& informativeText = {}) = 0;
};

// Routes alerts into the log.
class LoggingAlertHandler : public AlertHandler {
public:
    void showAlert(AlertStyle style, const std::string& message, const std::string& informativeText = {}) override;
};
}
