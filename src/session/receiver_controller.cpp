#include "sendme/session/receiver_controller.hpp"

#include "sendme/events/events.hpp"
#include "sendme/progress/calculator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string_view>

namespace sendme::session {
namespace names = events::names;

namespace {

std::string trimmed(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return std::string(text.substr(first, last - first + 1));
}

std::string ticket_preview(const std::string& ticket) {
    return ticket.substr(0, std::min<std::size_t>(50, ticket.size())) + "...";
}

} // namespace

ReceiverController::ReceiverController(const SessionServices& services, std::string default_save_path)
    : services_(services),
      save_path_(std::move(default_save_path)),
      resume_timer_(services.scheduler) {
    spdlog::debug("Default save path: {}", save_path_.empty() ? "<unset>" : save_path_);
}

ReceiverController::~ReceiverController() {
    detach();
}

void ReceiverController::subscribe(events::EventBus& bus, std::string_view name,
                                   void (ReceiverController::*handler)(const events::EngineEvent&)) {
    subscriptions_.add(bus.subscribe(name, [this, handler](const events::EngineEvent& event) {
        (this->*handler)(event);
    }));
}

void ReceiverController::attach(events::EventBus& bus) {
    if (attached()) {
        return;
    }
    subscribe(bus, names::kReceiveStarted, &ReceiverController::handle_receive_started);
    subscribe(bus, names::kReceiveResumed, &ReceiverController::handle_receive_resumed);
    subscribe(bus, names::kReceiveProgress, &ReceiverController::handle_receive_progress);
    subscribe(bus, names::kReceiveFileNames, &ReceiverController::handle_file_names);
    subscribe(bus, names::kExportStarted, &ReceiverController::handle_export_started);
    subscribe(bus, names::kExportProgress, &ReceiverController::handle_export_progress);
    subscribe(bus, names::kExportCompleted, &ReceiverController::handle_export_completed);
    subscribe(bus, names::kReceiveCompleted, &ReceiverController::handle_receive_completed);
    spdlog::debug("Receiver attached with {} subscriptions", subscriptions_.size());
}

void ReceiverController::detach() {
    subscriptions_.release();
}

// ──────────────────────────────────────────────────────────
// Commands
// ──────────────────────────────────────────────────────────

void ReceiverController::set_ticket(std::string ticket) {
    spdlog::debug("Ticket changed: {}", ticket_preview(ticket));
    machine_.set_ticket(std::move(ticket));
}

void ReceiverController::set_save_path(std::string path) {
    spdlog::info("Save path set to {}", path);
    save_path_ = std::move(path);
}

sendme::Result<void> ReceiverController::browse_for_folder() {
    auto picked = services_.dialogs.browse_for_folder();
    if (picked.is_error()) {
        spdlog::error("Failed to open folder dialog: {}", picked.error().message);
        services_.alerts.show("Folder Dialog Failed",
                              "Failed to open folder dialog: " + picked.error().message,
                              AlertSeverity::Error);
        return sendme::Err<void>(ErrorKind::ResourceFailure, picked.error().message);
    }
    if (!picked.value()) {
        spdlog::info("No folder selected");
        return sendme::Ok();
    }
    set_save_path(std::move(*picked.value()));
    return sendme::Ok();
}

sendme::Result<void> ReceiverController::receive(std::string ticket, std::string output_path) {
    set_ticket(std::move(ticket));
    set_save_path(std::move(output_path));
    return receive();
}

sendme::Result<void> ReceiverController::receive() {
    const std::string ticket = trimmed(machine_.ticket());
    if (ticket.empty()) {
        spdlog::warn("No ticket provided for receive");
        return sendme::Err<void>(ErrorKind::InvalidInput, "No ticket provided");
    }

    const auto current = machine_.phase();
    if (current == ReceiverPhase::Connecting || current == ReceiverPhase::Transporting ||
        current == ReceiverPhase::Exporting) {
        spdlog::warn("Receive ignored while {}", to_string(current));
        return sendme::Err<void>(ErrorKind::Busy, std::string("Already ") + to_string(current));
    }

    spdlog::info("Starting file receive, ticket {} into {}", ticket_preview(ticket), save_path_);
    resume_timer_.cancel();
    machine_.begin_receive();

    auto result = services_.engine.receive(ticket, save_path_);
    if (result.is_error()) {
        const auto& message = result.error().message;
        spdlog::error("Failed to receive file: {}", message);
        services_.alerts.show("Receive Failed", "Failed to receive file: " + message,
                              AlertSeverity::Error);
        machine_.abort_receive();
        return sendme::Err<void>(ErrorKind::CommandFailure, message);
    }

    spdlog::info("Receive command acknowledged");
    return sendme::Ok();
}

void ReceiverController::reset_for_new_transfer() {
    spdlog::info("Resetting receiver");
    resume_timer_.cancel();
    machine_.reset();
}

// ──────────────────────────────────────────────────────────
// Engine events
// ──────────────────────────────────────────────────────────

void ReceiverController::handle_receive_started(const events::EngineEvent&) {
    spdlog::info("Receive started");
    machine_.on_receive_started(services_.scheduler.now());
}

void ReceiverController::handle_receive_resumed(const events::EngineEvent& event) {
    const auto local_size = progress::parse_count(event.payload);
    if (!local_size) {
        spdlog::warn("Dropping malformed {} payload: '{}'", event.name, event.payload);
        return;
    }
    spdlog::info("Resuming from {} bytes", *local_size);
    machine_.on_resumed(*local_size);
    resume_timer_.restart(kResumeDisplayWindow, [this] { machine_.clear_resume(); });
}

void ReceiverController::handle_receive_progress(const events::EngineEvent& event) {
    const auto triple = progress::parse_triple(event.payload);
    if (!triple) {
        spdlog::warn("Dropping malformed {} payload: '{}'", event.name, event.payload);
        return;
    }
    const auto update = progress::transfer_progress_from(*triple);
    spdlog::debug("Receive progress: {}/{} bytes ({:.1f}%) @ {:.1f}KB/s",
                  update.bytes_transferred, update.total_bytes,
                  update.percentage, update.speed_bps / 1024.0);
    machine_.on_receive_progress(update);
}

void ReceiverController::handle_file_names(const events::EngineEvent& event) {
    auto names_list = progress::parse_file_names(event.payload);
    if (!names_list) {
        spdlog::warn("Dropping malformed {} payload: '{}'", event.name, event.payload);
        return;
    }
    spdlog::info("Received {} file name(s)", names_list->size());
    machine_.on_file_names(std::move(*names_list));
}

void ReceiverController::handle_export_started(const events::EngineEvent& event) {
    const auto total = progress::parse_count(event.payload);
    if (!total) {
        spdlog::warn("Dropping malformed {} payload: '{}'", event.name, event.payload);
        return;
    }
    spdlog::info("Export started, total files: {}", *total);
    machine_.on_export_started(*total);
}

void ReceiverController::handle_export_progress(const events::EngineEvent& event) {
    const auto triple = progress::parse_triple(event.payload);
    if (!triple) {
        spdlog::warn("Dropping malformed {} payload: '{}'", event.name, event.payload);
        return;
    }
    const auto update = progress::export_progress_from(*triple);
    spdlog::debug("Export progress: {}/{} ({}%)", update.current, update.total, update.percentage);
    machine_.on_export_progress(update);
}

void ReceiverController::handle_export_completed(const events::EngineEvent&) {
    spdlog::info("Export completed");
    machine_.on_export_completed();
}

void ReceiverController::handle_receive_completed(const events::EngineEvent&) {
    machine_.on_receive_completed(services_.scheduler.now(), save_path_);

    const auto& metadata = *machine_.metadata();
    spdlog::info("Receive completed: {} ({}) in {}ms into {}", metadata.file_name,
                 progress::format_bytes(metadata.file_size), metadata.duration.count(), save_path_);
    platform::report_data_transfer(services_.analytics, metadata.file_size);
}

} // namespace sendme::session
