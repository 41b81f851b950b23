#include "sendme/session/notification.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sendme::session {

const char* to_string(AlertSeverity severity) noexcept {
    switch (severity) {
        case AlertSeverity::Info: return "info";
        case AlertSeverity::Success: return "success";
        case AlertSeverity::Warning: return "warning";
        case AlertSeverity::Error: return "error";
    }
    return "unknown";
}

void NotificationSurface::show(std::string title, std::string description, AlertSeverity severity) {
    if (state_.is_open) {
        spdlog::debug("Replacing open alert '{}' with '{}'", state_.title, title);
    }
    state_.is_open = true;
    state_.title = std::move(title);
    state_.description = std::move(description);
    state_.severity = severity;
}

void NotificationSurface::close() noexcept {
    state_.is_open = false;
}

} // namespace sendme::session
