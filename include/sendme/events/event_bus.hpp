/**
 * @file event_bus.hpp
 * @brief Named-event bus between the transfer engine and session controllers
 *
 * WHY THIS FILE EXISTS:
 * The engine emits lifecycle events by name ("transfer-progress", ...).
 * Controllers subscribe to the names they care about without knowing who
 * emits them, and must be able to tear their subscriptions down cleanly.
 *
 * WHAT IT DOES:
 * - Subscription by event name, delivery in registration order
 * - RAII subscription handles (unsubscribe on destruction, idempotent)
 * - Handler failures are isolated: logged, never propagated, handler stays
 * - Thread-safe registration and emission
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe("transfer-started", [](const EngineEvent& e) { ... });
 * bus.emit(EngineEvent{"transfer-started"});
 * sub.unsubscribe();  // or let it go out of scope
 */

#pragma once

#include "sendme/events/events.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sendme::events {

namespace detail {
struct HandlerRegistry;
}

/**
 * @brief Handle for one registered handler
 *
 * Move-only. Destroying or unsubscribing an active handle removes the
 * handler exactly once; later calls are no-ops. A handle that outlives
 * its bus is inert.
 */
class Subscription {
public:
    Subscription() = default;
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    void unsubscribe();

    [[nodiscard]] bool active() const noexcept { return id_ != 0; }
    [[nodiscard]] const std::string& event_name() const noexcept { return event_name_; }

private:
    friend class EventBus;

    Subscription(std::weak_ptr<detail::HandlerRegistry> registry,
                 std::string event_name,
                 std::size_t id);

    std::weak_ptr<detail::HandlerRegistry> registry_;
    std::string event_name_;
    std::size_t id_ = 0;
};

/**
 * @brief Group of subscriptions owned by one session view
 *
 * release() tears every member down once; a second release() does nothing.
 */
class SubscriptionSet {
public:
    SubscriptionSet() = default;
    ~SubscriptionSet() { release(); }

    SubscriptionSet(const SubscriptionSet&) = delete;
    SubscriptionSet& operator=(const SubscriptionSet&) = delete;

    void add(Subscription subscription);
    void release();

    [[nodiscard]] std::size_t size() const noexcept { return subscriptions_.size(); }
    [[nodiscard]] bool empty() const noexcept { return subscriptions_.empty(); }

private:
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Event bus keyed by event name
 *
 * THREAD SAFETY:
 * - Multiple threads can emit and subscribe concurrently
 * - Handlers are called synchronously in the emitting thread
 * - Handlers may subscribe/unsubscribe while being called
 */
class EventBus {
public:
    using Handler = std::function<void(const EngineEvent&)>;

    EventBus();
    ~EventBus() = default;

    // Non-copyable (would duplicate handlers)
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register handler for every event named event_name
     *
     * RETURNS:
     * Handle that keeps the handler registered while alive
     */
    [[nodiscard]] Subscription subscribe(std::string_view event_name, Handler handler);

    /**
     * @brief Deliver event to all handlers registered for its name
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged; remaining handlers still run and
     * the throwing handler stays registered.
     */
    void emit(const EngineEvent& event) const;

    [[nodiscard]] std::size_t subscriber_count(std::string_view event_name) const;

    /// Remove all handlers. Outstanding Subscription handles become inert.
    void clear();

private:
    std::shared_ptr<detail::HandlerRegistry> registry_;
};

} // namespace sendme::events
