#include "sendme/runtime/event_loop.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sendme::runtime {

EventLoop::EventLoop(events::EventBus& bus)
    : io_context_(1),
      work_(asio::make_work_guard(io_context_)),
      bus_(bus) {}

void EventLoop::post(events::EngineEvent event) {
    asio::post(io_context_, [this, event = std::move(event)]() {
        spdlog::trace("Dispatching '{}'", event.name);
        bus_.emit(event);
    });
}

core::TimePoint EventLoop::now() const {
    return core::Clock::now();
}

core::TimerId EventLoop::schedule_after(std::chrono::milliseconds delay,
                                        std::function<void()> callback) {
    const core::TimerId id = next_timer_id_++;
    auto timer = std::make_unique<asio::steady_timer>(io_context_, delay);

    timer->async_wait([this, id, callback = std::move(callback)](boost::system::error_code ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            return;  // cancelled after expiry was already queued
        }
        timers_.erase(it);
        callback();
    });

    timers_.emplace(id, std::move(timer));
    return id;
}

void EventLoop::cancel(core::TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return;
    }
    it->second->cancel();
    timers_.erase(it);
}

void EventLoop::prepare_run() {
    if (io_context_.stopped()) {
        io_context_.restart();
    }
}

std::size_t EventLoop::poll() {
    prepare_run();
    return io_context_.poll();
}

std::size_t EventLoop::run_for(std::chrono::milliseconds timeout) {
    prepare_run();
    return io_context_.run_for(timeout);
}

bool EventLoop::run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    prepare_run();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        io_context_.run_one_until(deadline);
        if (io_context_.stopped()) {
            return done();
        }
    }
    return true;
}

void EventLoop::run() {
    prepare_run();
    io_context_.run();
}

void EventLoop::stop() {
    io_context_.stop();
}

} // namespace sendme::runtime
