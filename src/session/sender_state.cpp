#include "sendme/session/sender_state.hpp"

#include "sendme/progress/calculator.hpp"

#include <spdlog/spdlog.h>

namespace sendme::session {

SenderPhase SenderStateMachine::phase() const noexcept {
    if (completed_) {
        return SenderPhase::Completed;
    }
    if (transporting_) {
        return SenderPhase::Transporting;
    }
    if (importing_) {
        return SenderPhase::Importing;
    }
    if (sharing_) {
        return SenderPhase::Sharing;
    }
    if (selected_path_) {
        return SenderPhase::Selecting;
    }
    return SenderPhase::Idle;
}

void SenderStateMachine::select_path(std::string path) {
    selected_path_ = std::move(path);
}

void SenderStateMachine::on_sharing_started(std::string ticket) {
    ticket_ = std::move(ticket);
    sharing_ = true;
    completed_ = false;
    metadata_.reset();
}

void SenderStateMachine::on_import_started() {
    importing_ = true;
    import_progress_.reset();
}

void SenderStateMachine::on_import_file_count(std::int64_t total) {
    import_progress_ = ImportProgress{0, total, 0.0};
}

void SenderStateMachine::on_import_progress(const ImportProgress& progress) {
    import_progress_ = progress;
}

void SenderStateMachine::on_import_completed() {
    // Counters stay visible next to the transport progress
    importing_ = false;
}

void SenderStateMachine::on_transfer_started(TimePoint now) {
    transporting_ = true;
    completed_ = false;
    started_at_ = now;
    ended_at_.reset();
    transfer_progress_.reset();
}

void SenderStateMachine::on_transfer_progress(const TransferProgress& progress) {
    transfer_progress_ = progress;
    last_total_bytes_ = progress.total_bytes;
}

void SenderStateMachine::on_transfer_completed(TimePoint now, std::optional<std::uint64_t> file_size) {
    transporting_ = false;
    completed_ = true;
    transfer_progress_.reset();
    ended_at_ = now;

    if (!selected_path_) {
        spdlog::warn("Transfer completed without a selected path, no metadata recorded");
        return;
    }

    TransferMetadata metadata;
    metadata.file_name = progress::leaf_name(*selected_path_);
    metadata.file_size = file_size.value_or(0);
    metadata.duration = progress::elapsed(started_at_, now);
    metadata.start_time = started_at_.value_or(now);
    metadata.end_time = now;
    metadata_ = std::move(metadata);
}

void SenderStateMachine::reset() {
    *this = SenderStateMachine{};
}

} // namespace sendme::session
