#pragma once

#include "sendme/core/result.hpp"
#include "sendme/core/scheduler.hpp"
#include "sendme/events/event_bus.hpp"
#include "sendme/session/sender_state.hpp"
#include "sendme/session/services.hpp"

#include <chrono>
#include <string>

namespace sendme::session {

/**
 * @brief Drives the sending role
 *
 * Issues engine commands (start/stop sharing, file size), owns reset
 * semantics and feeds engine events into a SenderStateMachine.
 *
 * USAGE:
 * SenderController sender(services);
 * sender.attach(bus);
 * sender.select_path("/tmp/video.mp4");
 * auto ticket = sender.start_sharing();
 * ...
 * sender.stop_sharing();
 *
 * Handlers read state through this object at delivery time, so attach()
 * happens once per view regardless of how often state changes.
 */
class SenderController {
public:
    static constexpr std::chrono::milliseconds kCopyFeedbackWindow{2000};

    explicit SenderController(const SessionServices& services);
    ~SenderController();

    SenderController(const SenderController&) = delete;
    SenderController& operator=(const SenderController&) = delete;

    /// Subscribe to sender events. No-op when already attached.
    void attach(events::EventBus& bus);
    /// Drop every subscription made by attach(). Idempotent.
    void detach();
    [[nodiscard]] bool attached() const noexcept { return !subscriptions_.empty(); }

    /// Record path for sharing. Only valid while Idle or Selecting.
    sendme::Result<void> select_path(std::string path);

    /// Pick a file with the native dialog; cancel keeps the current path.
    sendme::Result<void> browse_for_file();

    /// Offer the selected path. Returns the ticket.
    sendme::Result<std::string> start_sharing();

    /// Withdraw the offer. Local state is reset whatever the engine says.
    sendme::Result<void> stop_sharing();

    sendme::Result<void> reset_for_new_transfer() { return stop_sharing(); }

    sendme::Result<void> copy_ticket();

    [[nodiscard]] SenderPhase phase() const noexcept { return machine_.phase(); }
    [[nodiscard]] const SenderStateMachine& state() const noexcept { return machine_; }
    [[nodiscard]] bool copy_success() const noexcept { return copy_success_; }

private:
    void subscribe(events::EventBus& bus, std::string_view name,
                   void (SenderController::*handler)(const events::EngineEvent&));

    void handle_import_started(const events::EngineEvent& event);
    void handle_import_file_count(const events::EngineEvent& event);
    void handle_import_progress(const events::EngineEvent& event);
    void handle_import_completed(const events::EngineEvent& event);
    void handle_transfer_started(const events::EngineEvent& event);
    void handle_transfer_progress(const events::EngineEvent& event);
    void handle_transfer_completed(const events::EngineEvent& event);

    SessionServices services_;
    SenderStateMachine machine_;
    core::DeadlineTimer copy_feedback_timer_;
    bool copy_success_ = false;
    events::SubscriptionSet subscriptions_;
};

} // namespace sendme::session
