#include "sendme/session/sender_controller.hpp"

#include "sendme/events/events.hpp"
#include "sendme/progress/calculator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sendme::session {
namespace names = events::names;

SenderController::SenderController(const SessionServices& services)
    : services_(services),
      copy_feedback_timer_(services.scheduler) {}

SenderController::~SenderController() {
    detach();
}

// ──────────────────────────────────────────────────────────
// Subscriptions
// ──────────────────────────────────────────────────────────

void SenderController::subscribe(events::EventBus& bus, std::string_view name,
                                 void (SenderController::*handler)(const events::EngineEvent&)) {
    subscriptions_.add(bus.subscribe(name, [this, handler](const events::EngineEvent& event) {
        (this->*handler)(event);
    }));
}

void SenderController::attach(events::EventBus& bus) {
    if (attached()) {
        return;
    }
    subscribe(bus, names::kImportStarted, &SenderController::handle_import_started);
    subscribe(bus, names::kImportFileCount, &SenderController::handle_import_file_count);
    subscribe(bus, names::kImportProgress, &SenderController::handle_import_progress);
    subscribe(bus, names::kImportCompleted, &SenderController::handle_import_completed);
    subscribe(bus, names::kTransferStarted, &SenderController::handle_transfer_started);
    subscribe(bus, names::kTransferProgress, &SenderController::handle_transfer_progress);
    subscribe(bus, names::kTransferCompleted, &SenderController::handle_transfer_completed);
    spdlog::debug("Sender attached with {} subscriptions", subscriptions_.size());
}

void SenderController::detach() {
    subscriptions_.release();
}

// ──────────────────────────────────────────────────────────
// Commands
// ──────────────────────────────────────────────────────────

sendme::Result<void> SenderController::select_path(std::string path) {
    const auto current = machine_.phase();
    if (current != SenderPhase::Idle && current != SenderPhase::Selecting) {
        spdlog::warn("Ignoring path selection while {}", to_string(current));
        return sendme::Err<void>(ErrorKind::Busy,
                                 std::string("Cannot change selection while ") + to_string(current));
    }
    spdlog::info("File selected: {}", path);
    machine_.select_path(std::move(path));
    return sendme::Ok();
}

sendme::Result<void> SenderController::browse_for_file() {
    auto picked = services_.dialogs.browse_for_file();
    if (picked.is_error()) {
        spdlog::error("Failed to open file dialog: {}", picked.error().message);
        services_.alerts.show("File Dialog Failed",
                              "Failed to open file dialog: " + picked.error().message,
                              AlertSeverity::Error);
        return sendme::Err<void>(ErrorKind::ResourceFailure, picked.error().message);
    }
    if (!picked.value()) {
        spdlog::info("No file selected");
        return sendme::Ok();
    }
    return select_path(std::move(*picked.value()));
}

sendme::Result<std::string> SenderController::start_sharing() {
    const auto& path = machine_.selected_path();
    if (!path) {
        spdlog::warn("No file selected for sharing");
        return sendme::Err<std::string>(ErrorKind::InvalidInput, "No file selected");
    }
    if (machine_.is_loading() || machine_.is_sharing()) {
        spdlog::warn("Start sharing ignored, a share is already {}",
                     machine_.is_loading() ? "starting" : "active");
        return sendme::Err<std::string>(ErrorKind::Busy, "Already sharing");
    }

    spdlog::info("Starting file sharing for: {}", *path);
    machine_.set_loading(true);
    auto result = services_.engine.start_sharing(*path);
    machine_.set_loading(false);

    if (result.is_error()) {
        const auto& message = result.error().message;
        spdlog::error("Failed to start sharing: {}", message);
        services_.alerts.show("Sharing Failed", "Failed to start sharing: " + message,
                              AlertSeverity::Error);
        return sendme::Err<std::string>(ErrorKind::CommandFailure, message);
    }

    const std::string& ticket = result.value();
    spdlog::info("Share started, ticket {}...", ticket.substr(0, std::min<std::size_t>(50, ticket.size())));
    machine_.on_sharing_started(ticket);
    return result;
}

sendme::Result<void> SenderController::stop_sharing() {
    spdlog::info("Stopping file sharing");
    auto result = services_.engine.stop_sharing();
    if (result.is_error()) {
        spdlog::error("Failed to stop sharing: {}", result.error().message);
        services_.alerts.show("Stop Sharing Failed",
                              "Failed to stop sharing: " + result.error().message,
                              AlertSeverity::Error);
    }

    machine_.reset();
    copy_feedback_timer_.cancel();
    copy_success_ = false;

    if (result.is_error()) {
        return sendme::Err<void>(ErrorKind::CommandFailure, result.error().message);
    }
    return sendme::Ok();
}

sendme::Result<void> SenderController::copy_ticket() {
    const auto& ticket = machine_.ticket();
    if (!ticket) {
        spdlog::warn("No ticket available to copy");
        return sendme::Err<void>(ErrorKind::InvalidInput, "No ticket available");
    }

    auto result = services_.clipboard.write_text(*ticket);
    if (result.is_error()) {
        spdlog::error("Failed to copy ticket: {}", result.error().message);
        services_.alerts.show("Copy Failed", "Failed to copy ticket: " + result.error().message,
                              AlertSeverity::Error);
        return sendme::Err<void>(ErrorKind::ResourceFailure, result.error().message);
    }

    spdlog::info("Ticket copied to clipboard");
    copy_success_ = true;
    copy_feedback_timer_.restart(kCopyFeedbackWindow, [this] { copy_success_ = false; });
    return sendme::Ok();
}

// ──────────────────────────────────────────────────────────
// Engine events
// ──────────────────────────────────────────────────────────

void SenderController::handle_import_started(const events::EngineEvent&) {
    spdlog::info("Import started");
    machine_.on_import_started();
}

void SenderController::handle_import_file_count(const events::EngineEvent& event) {
    const auto total = progress::parse_count(event.payload);
    if (!total) {
        spdlog::warn("Dropping malformed {} payload: '{}'", event.name, event.payload);
        return;
    }
    spdlog::info("Import file count: {}", *total);
    machine_.on_import_file_count(*total);
}

void SenderController::handle_import_progress(const events::EngineEvent& event) {
    const auto triple = progress::parse_triple(event.payload);
    if (!triple) {
        spdlog::warn("Dropping malformed {} payload: '{}'", event.name, event.payload);
        return;
    }
    const auto update = progress::import_progress_from(*triple);
    spdlog::debug("Import progress: {}/{} ({}%)", update.processed, update.total, update.percentage);
    machine_.on_import_progress(update);
}

void SenderController::handle_import_completed(const events::EngineEvent&) {
    spdlog::info("Import completed");
    machine_.on_import_completed();
}

void SenderController::handle_transfer_started(const events::EngineEvent&) {
    spdlog::info("Transfer started");
    machine_.on_transfer_started(services_.scheduler.now());
}

void SenderController::handle_transfer_progress(const events::EngineEvent& event) {
    const auto triple = progress::parse_triple(event.payload);
    if (!triple) {
        spdlog::warn("Dropping malformed {} payload: '{}'", event.name, event.payload);
        return;
    }
    const auto update = progress::transfer_progress_from(*triple);
    spdlog::debug("Transfer progress: {}/{} ({:.1f}%) @ {:.1f}KB/s",
                  progress::format_bytes(static_cast<std::uint64_t>(std::max<std::int64_t>(0, update.bytes_transferred))),
                  progress::format_bytes(static_cast<std::uint64_t>(std::max<std::int64_t>(0, update.total_bytes))),
                  update.percentage, update.speed_bps / 1024.0);
    machine_.on_transfer_progress(update);
}

void SenderController::handle_transfer_completed(const events::EngineEvent&) {
    const auto now = services_.scheduler.now();

    std::optional<std::uint64_t> file_size;
    if (const auto& path = machine_.selected_path()) {
        auto size = services_.engine.get_file_size(*path);
        if (size.is_ok()) {
            file_size = size.value();
        } else {
            spdlog::warn("Failed to get file size for {} ({}), recording 0",
                         *path, size.error().message);
        }
    }

    machine_.on_transfer_completed(now, file_size);

    std::uint64_t final_bytes = static_cast<std::uint64_t>(std::max<std::int64_t>(0, machine_.last_total_bytes()));
    if (const auto& metadata = machine_.metadata()) {
        final_bytes = metadata->file_size;
        spdlog::info("Transfer completed: {} ({}) in {}ms", metadata->file_name,
                     progress::format_bytes(metadata->file_size), metadata->duration.count());
    } else {
        spdlog::info("Transfer completed");
    }
    platform::report_data_transfer(services_.analytics, final_bytes);
}

} // namespace sendme::session
