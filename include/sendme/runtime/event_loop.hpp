/**
 * @file event_loop.hpp
 * @brief Single-threaded orchestration loop on Boost.Asio
 *
 * WHY THIS FILE EXISTS:
 * The transfer engine runs on its own threads and reports progress by
 * posting events. The session layer is not thread-safe and expects every
 * handler and timer to run on one thread, in emission order. EventLoop
 * is that thread: engine events are posted into an io_context and
 * delivered through the EventBus; session timers are steady_timers on
 * the same io_context.
 *
 * THREAD SAFETY:
 * - post() may be called from any thread
 * - schedule_after()/cancel() and all run methods belong to the loop thread
 *
 * EXAMPLE:
 * EventBus bus;
 * EventLoop loop(bus);
 * SenderController sender(services_using(loop));
 * sender.attach(bus);
 * engine.set_sink([&loop](EngineEvent e) { loop.post(std::move(e)); });
 * loop.run_until([&] { return sender.phase() == SenderPhase::Completed; },
 *                std::chrono::minutes(10));
 */

#pragma once

#include "sendme/core/scheduler.hpp"
#include "sendme/events/event_bus.hpp"

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>

namespace sendme::runtime {

namespace asio = boost::asio;

class EventLoop : public core::Scheduler {
public:
    explicit EventLoop(events::EventBus& bus);
    ~EventLoop() override = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Queue an engine event for delivery on the loop thread
     *
     * Events posted from one thread are delivered in posting order.
     */
    void post(events::EngineEvent event);

    core::TimePoint now() const override;
    core::TimerId schedule_after(std::chrono::milliseconds delay,
                                 std::function<void()> callback) override;
    void cancel(core::TimerId id) override;

    /// Run ready handlers without blocking. Returns handlers executed.
    std::size_t poll();

    /// Run handlers for at most timeout.
    std::size_t run_for(std::chrono::milliseconds timeout);

    /**
     * @brief Run handlers until done() holds or timeout elapses
     *
     * RETURNS:
     * true if done() became true
     */
    bool run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout);

    /// Block running handlers until stop().
    void run();
    void stop();

    [[nodiscard]] std::size_t pending_timers() const noexcept { return timers_.size(); }

private:
    void prepare_run();

    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    events::EventBus& bus_;

    // Declared after io_context_ so pending timers die first
    std::unordered_map<core::TimerId, std::unique_ptr<asio::steady_timer>> timers_;
    core::TimerId next_timer_id_ = 1;
};

} // namespace sendme::runtime
