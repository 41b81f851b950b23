#include "sendme/events/event_bus.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace sendme::events {

namespace detail {

struct HandlerRegistry {
    using HandlerPtr = std::shared_ptr<const EventBus::Handler>;

    // Map: event name -> list of (handler_id, handler)
    std::unordered_map<std::string, std::vector<std::pair<std::size_t, HandlerPtr>>> handlers;
    mutable std::shared_mutex mutex;
    std::size_t next_id = 1;

    void remove(const std::string& event_name, std::size_t id) {
        std::unique_lock lock(mutex);
        auto it = handlers.find(event_name);
        if (it == handlers.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
        if (list.empty()) {
            handlers.erase(it);
        }
    }
};

} // namespace detail

// ──────────────────────────────────────────────────────────
// Subscription
// ──────────────────────────────────────────────────────────

Subscription::Subscription(std::weak_ptr<detail::HandlerRegistry> registry,
                           std::string event_name,
                           std::size_t id)
    : registry_(std::move(registry)),
      event_name_(std::move(event_name)),
      id_(id) {}

Subscription::~Subscription() {
    unsubscribe();
}

Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_)),
      event_name_(std::move(other.event_name_)),
      id_(std::exchange(other.id_, 0)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        registry_ = std::move(other.registry_);
        event_name_ = std::move(other.event_name_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    if (auto registry = registry_.lock()) {
        registry->remove(event_name_, id_);
    }
    id_ = 0;
    registry_.reset();
}

// ──────────────────────────────────────────────────────────
// SubscriptionSet
// ──────────────────────────────────────────────────────────

void SubscriptionSet::add(Subscription subscription) {
    subscriptions_.push_back(std::move(subscription));
}

void SubscriptionSet::release() {
    for (auto& subscription : subscriptions_) {
        subscription.unsubscribe();
    }
    subscriptions_.clear();
}

// ──────────────────────────────────────────────────────────
// EventBus
// ──────────────────────────────────────────────────────────

EventBus::EventBus() : registry_(std::make_shared<detail::HandlerRegistry>()) {}

Subscription EventBus::subscribe(std::string_view event_name, Handler handler) {
    std::string name(event_name);
    std::size_t id = 0;
    {
        std::unique_lock lock(registry_->mutex);
        id = registry_->next_id++;
        registry_->handlers[name].emplace_back(
            id, std::make_shared<const Handler>(std::move(handler)));
    }
    return Subscription(registry_, std::move(name), id);
}

void EventBus::emit(const EngineEvent& event) const {
    // Copy handler pointers so handlers can (un)subscribe without deadlock
    std::vector<detail::HandlerRegistry::HandlerPtr> handlers_copy;
    {
        std::shared_lock lock(registry_->mutex);
        auto it = registry_->handlers.find(event.name);
        if (it == registry_->handlers.end()) {
            spdlog::trace("No subscribers for event '{}'", event.name);
            return;
        }
        handlers_copy.reserve(it->second.size());
        for (const auto& [id, handler] : it->second) {
            handlers_copy.push_back(handler);
        }
    }

    for (const auto& handler : handlers_copy) {
        try {
            (*handler)(event);
        } catch (const std::exception& e) {
            // One bad handler must not take the others down
            spdlog::error("Handler for event '{}' failed: {}", event.name, e.what());
        } catch (...) {
            spdlog::error("Handler for event '{}' failed with unknown exception", event.name);
        }
    }
}

std::size_t EventBus::subscriber_count(std::string_view event_name) const {
    std::shared_lock lock(registry_->mutex);
    auto it = registry_->handlers.find(std::string(event_name));
    return it != registry_->handlers.end() ? it->second.size() : 0;
}

void EventBus::clear() {
    std::unique_lock lock(registry_->mutex);
    registry_->handlers.clear();
}

} // namespace sendme::events
