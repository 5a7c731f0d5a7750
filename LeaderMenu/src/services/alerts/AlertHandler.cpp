#include "AlertHandler.h"
#include "services/logger/LogManager.h"

namespace lmenu {

const char* toString(AlertStyle style) noexcept {
    switch (style) {
    case AlertStyle::Informational: return "info";
    case AlertStyle::Warning: return "warning";
    case AlertStyle::Critical: return "critical";
    }
    return "unknown";
}

void LoggingAlertHandler::showAlert(AlertStyle style, const std::string& message, const std::string& informativeText) {
    const std::string text = informativeText.empty() ? message : message + ": " + informativeText;
    switch (style) {
    case AlertStyle::Informational:
        logging::LogManager::info("{}", text);
        break;
    case AlertStyle::Warning:
        logging::LogManager::warn("{}", text);
        break;
    case AlertStyle::Critical:
        logging::LogManager::critical("{}", text);
        break;
    }
}
}
