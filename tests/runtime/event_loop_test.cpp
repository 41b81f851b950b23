#include <gtest/gtest.h>
#include "sendme/runtime/event_loop.hpp"
#include "sendme/session/receiver_controller.hpp"
#include "support/fakes.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace sendme;
using namespace sendme::events;
using namespace sendme::runtime;
using namespace std::chrono_literals;

TEST(EventLoop, PostedEventsAreDeliveredOnPoll) {
    EventBus bus;
    EventLoop loop(bus);

    std::vector<std::string> payloads;
    auto sub = bus.subscribe("transfer-progress", [&](const EngineEvent& e) {
        payloads.push_back(e.payload);
    });

    loop.post(EngineEvent{"transfer-progress", "1:4:0"});
    loop.post(EngineEvent{"transfer-progress", "2:4:0"});
    EXPECT_TRUE(payloads.empty());

    loop.poll();

    EXPECT_EQ(payloads, (std::vector<std::string>{"1:4:0", "2:4:0"}));
}

TEST(EventLoop, EventsFromWorkerThreadKeepOrder) {
    EventBus bus;
    EventLoop loop(bus);

    std::vector<int> seen;
    auto sub = bus.subscribe("import-progress", [&](const EngineEvent& e) {
        seen.push_back(std::stoi(e.payload));
    });

    std::thread worker([&loop] {
        for (int i = 0; i < 100; i++) {
            loop.post(EngineEvent{"import-progress", std::to_string(i)});
        }
        loop.post(EngineEvent{"import-completed"});
    });

    bool completed = false;
    auto done = bus.subscribe("import-completed", [&](const EngineEvent&) { completed = true; });

    EXPECT_TRUE(loop.run_until([&] { return completed; }, 5s));
    worker.join();

    ASSERT_EQ(seen.size(), 100u);
    for (int i = 0; i < 100; i++) {
        EXPECT_EQ(seen[i], i);
    }
}

TEST(EventLoop, TimerFiresAfterDelay) {
    EventBus bus;
    EventLoop loop(bus);

    bool fired = false;
    loop.schedule_after(20ms, [&] { fired = true; });
    EXPECT_EQ(loop.pending_timers(), 1u);

    EXPECT_TRUE(loop.run_until([&] { return fired; }, 2s));
    EXPECT_EQ(loop.pending_timers(), 0u);
}

TEST(EventLoop, CancelledTimerDoesNotFire) {
    EventBus bus;
    EventLoop loop(bus);

    bool fired = false;
    const auto id = loop.schedule_after(10ms, [&] { fired = true; });
    loop.cancel(id);
    loop.cancel(id);

    loop.run_for(50ms);
    EXPECT_FALSE(fired);
    EXPECT_EQ(loop.pending_timers(), 0u);
}

TEST(EventLoop, RunUntilTimesOut) {
    EventBus bus;
    EventLoop loop(bus);

    EXPECT_FALSE(loop.run_until([] { return false; }, 30ms));
}

TEST(EventLoop, StopEndsRun) {
    EventBus bus;
    EventLoop loop(bus);

    loop.schedule_after(10ms, [&] { loop.stop(); });
    loop.run();

    // Loop can be driven again after stop()
    bool delivered = false;
    auto sub = bus.subscribe("receive-started", [&](const EngineEvent&) { delivered = true; });
    loop.post(EngineEvent{"receive-started"});
    loop.poll();
    EXPECT_TRUE(delivered);
}

TEST(EventLoop, DrivesResumeWindowForReceiver) {
    EventBus bus;
    EventLoop loop(bus);
    fakes::FakeEngine engine;
    session::NotificationSurface alerts;
    fakes::RecordingAnalytics analytics;
    fakes::FakeDialogs dialogs;
    fakes::FakeClipboard clipboard;

    session::ReceiverController receiver(
        session::SessionServices{engine, loop, alerts, analytics, dialogs, clipboard}, "/tmp");
    receiver.attach(bus);
    ASSERT_TRUE(receiver.receive("ticket", "/tmp").is_ok());

    loop.post(EngineEvent{"receive-started"});
    loop.post(EngineEvent{"receive-resumed", "4096"});
    loop.poll();

    EXPECT_EQ(receiver.state().resumed_from(), 4096);
    EXPECT_EQ(loop.pending_timers(), 1u);
}
