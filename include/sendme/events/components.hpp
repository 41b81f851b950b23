/**
 * @file components.hpp
 * @brief Event-driven helpers that sit beside the session controllers
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * // Every engine lifecycle event is now traced
 */

#pragma once

#include "sendme/events/event_bus.hpp"
#include "sendme/events/events.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace sendme::events {

/**
 * @brief Logs every known lifecycle event and counts them by name
 *
 * Progress ticks are logged at debug, everything else at info.
 * Subscriptions are released when the component is destroyed.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus);

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

    [[nodiscard]] std::uint64_t count(const std::string& event_name) const;
    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }

private:
    void on_event(const EngineEvent& e);

    std::unordered_map<std::string, std::uint64_t> counts_;
    std::uint64_t total_ = 0;
    SubscriptionSet subscriptions_;
};

} // namespace sendme::events
