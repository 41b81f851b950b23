#pragma once

#include "sendme/core/result.hpp"
#include "sendme/core/scheduler.hpp"
#include "sendme/events/event_bus.hpp"
#include "sendme/session/receiver_state.hpp"
#include "sendme/session/services.hpp"

#include <chrono>
#include <string>

namespace sendme::session {

/**
 * @brief Drives the receiving role
 *
 * Sends the receive command, owns reset semantics, and turns engine
 * events into ReceiverStateMachine updates. The resume indicator is
 * shown for kResumeDisplayWindow after the latest receive-resumed event.
 */
class ReceiverController {
public:
    static constexpr std::chrono::milliseconds kResumeDisplayWindow{5000};

    ReceiverController(const SessionServices& services, std::string default_save_path);
    ~ReceiverController();

    ReceiverController(const ReceiverController&) = delete;
    ReceiverController& operator=(const ReceiverController&) = delete;

    void attach(events::EventBus& bus);
    void detach();
    [[nodiscard]] bool attached() const noexcept { return !subscriptions_.empty(); }

    void set_ticket(std::string ticket);
    void set_save_path(std::string path);

    /// Pick a destination folder; cancel or failure keeps the current one.
    sendme::Result<void> browse_for_folder();

    /// Fetch the current ticket into the current save path.
    sendme::Result<void> receive();
    sendme::Result<void> receive(std::string ticket, std::string output_path);

    /// Unconditionally back to Idle.
    void reset_for_new_transfer();

    [[nodiscard]] ReceiverPhase phase() const noexcept { return machine_.phase(); }
    [[nodiscard]] const ReceiverStateMachine& state() const noexcept { return machine_; }
    [[nodiscard]] const std::string& save_path() const noexcept { return save_path_; }

private:
    void subscribe(events::EventBus& bus, std::string_view name,
                   void (ReceiverController::*handler)(const events::EngineEvent&));

    void handle_receive_started(const events::EngineEvent& event);
    void handle_receive_resumed(const events::EngineEvent& event);
    void handle_receive_progress(const events::EngineEvent& event);
    void handle_file_names(const events::EngineEvent& event);
    void handle_export_started(const events::EngineEvent& event);
    void handle_export_progress(const events::EngineEvent& event);
    void handle_export_completed(const events::EngineEvent& event);
    void handle_receive_completed(const events::EngineEvent& event);

    SessionServices services_;
    ReceiverStateMachine machine_;
    std::string save_path_;
    core::DeadlineTimer resume_timer_;
    events::SubscriptionSet subscriptions_;
};

} // namespace sendme::session
