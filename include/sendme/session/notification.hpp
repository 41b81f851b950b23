#pragma once

#include <string>

namespace sendme::session {

enum class AlertSeverity {
    Info,
    Success,
    Warning,
    Error
};

const char* to_string(AlertSeverity severity) noexcept;

struct AlertState {
    bool is_open = false;
    std::string title;
    std::string description;
    AlertSeverity severity = AlertSeverity::Info;
};

/**
 * @brief Single-slot alert shared by both roles
 *
 * There is never more than one alert. show() replaces whatever is open,
 * close() hides it but keeps its content for a closing animation.
 */
class NotificationSurface {
public:
    void show(std::string title, std::string description,
              AlertSeverity severity = AlertSeverity::Info);
    void close() noexcept;

    [[nodiscard]] const AlertState& current() const noexcept { return state_; }
    [[nodiscard]] bool is_open() const noexcept { return state_.is_open; }

private:
    AlertState state_;
};

} // namespace sendme::session
