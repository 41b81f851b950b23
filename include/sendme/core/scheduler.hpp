/**
 * @file scheduler.hpp
 * @brief Clock and one-shot timer abstraction used by the session layer
 *
 * WHY THIS FILE EXISTS:
 * Sessions need wall-clock timestamps (transfer start/end) and short
 * display windows (resume notice, copy feedback). Both go through a
 * Scheduler so the runtime can drive them from its event loop and tests
 * can drive them by hand.
 *
 * THREAD SAFETY:
 * Timers are scheduled, cancelled and fired on the orchestration thread.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace sendme::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using TimerId = std::uint64_t;

class Scheduler {
public:
    virtual ~Scheduler() = default;

    /// Current wall-clock time.
    virtual TimePoint now() const = 0;

    /**
     * @brief Run callback once after delay
     *
     * RETURNS:
     * Non-zero id usable with cancel()
     */
    virtual TimerId schedule_after(std::chrono::milliseconds delay,
                                   std::function<void()> callback) = 0;

    /// Cancel a pending timer. Unknown or already fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

/**
 * @brief Restartable, self-cancelling one-shot timer
 *
 * Owns at most one pending timer on a Scheduler. restart() replaces the
 * pending timer, cancel() drops it, destruction cancels it.
 *
 * EXAMPLE:
 * DeadlineTimer resume_timer(scheduler);
 * resume_timer.restart(std::chrono::seconds(5), [this] { clear_resume(); });
 */
class DeadlineTimer {
public:
    explicit DeadlineTimer(Scheduler& scheduler) : scheduler_(scheduler) {}
    ~DeadlineTimer() { cancel(); }

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    void restart(std::chrono::milliseconds delay, std::function<void()> on_expiry);
    void cancel();

    [[nodiscard]] bool pending() const noexcept { return id_ != 0; }

private:
    Scheduler& scheduler_;
    TimerId id_ = 0;
};

} // namespace sendme::core
