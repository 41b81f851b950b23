#include "sendme/core/scheduler.hpp"

#include <utility>

namespace sendme::core {

void DeadlineTimer::restart(std::chrono::milliseconds delay, std::function<void()> on_expiry) {
    cancel();
    id_ = scheduler_.schedule_after(delay, [this, callback = std::move(on_expiry)]() {
        id_ = 0;
        callback();
    });
}

void DeadlineTimer::cancel() {
    if (id_ != 0) {
        scheduler_.cancel(id_);
        id_ = 0;
    }
}

} // namespace sendme::core
