#include "sendme/session/receiver_state.hpp"

#include "sendme/progress/calculator.hpp"

namespace sendme::session {

ReceiverPhase ReceiverStateMachine::phase() const noexcept {
    if (completed_) {
        return ReceiverPhase::Completed;
    }
    if (exporting_) {
        return ReceiverPhase::Exporting;
    }
    if (transporting_) {
        return ReceiverPhase::Transporting;
    }
    if (receiving_) {
        return ReceiverPhase::Connecting;
    }
    return ReceiverPhase::Idle;
}

void ReceiverStateMachine::clear_outcome() {
    transporting_ = false;
    exporting_ = false;
    completed_ = false;
    transfer_progress_.reset();
    export_progress_.reset();
    metadata_.reset();
    resumed_from_.reset();
    started_at_.reset();
    ended_at_.reset();
    last_total_bytes_ = 0;
}

void ReceiverStateMachine::begin_receive() {
    clear_outcome();
    file_names_.clear();
    receiving_ = true;
}

void ReceiverStateMachine::abort_receive() {
    clear_outcome();
    receiving_ = false;
}

void ReceiverStateMachine::on_receive_started(TimePoint now) {
    transporting_ = true;
    completed_ = false;
    started_at_ = now;
    ended_at_.reset();
    transfer_progress_.reset();
}

void ReceiverStateMachine::on_resumed(std::int64_t local_size_bytes) {
    resumed_from_ = local_size_bytes;
}

void ReceiverStateMachine::on_receive_progress(const TransferProgress& progress) {
    transfer_progress_ = progress;
    last_total_bytes_ = progress.total_bytes;
}

void ReceiverStateMachine::on_file_names(std::vector<std::string> names) {
    file_names_ = std::move(names);
}

void ReceiverStateMachine::on_export_started(std::int64_t total_files) {
    exporting_ = true;
    export_progress_ = ExportProgress{0, total_files, 0.0};
    // Transport is over once the engine starts writing files out
    transfer_progress_.reset();
}

void ReceiverStateMachine::on_export_progress(const ExportProgress& progress) {
    export_progress_ = progress;
}

void ReceiverStateMachine::on_export_completed() {
    exporting_ = false;
    export_progress_.reset();
}

void ReceiverStateMachine::on_receive_completed(TimePoint now, const std::string& download_path) {
    receiving_ = false;
    transporting_ = false;
    completed_ = true;
    transfer_progress_.reset();
    ended_at_ = now;

    TransferMetadata metadata;
    metadata.file_name = progress::display_name(file_names_);
    metadata.file_size = last_total_bytes_ > 0 ? static_cast<std::uint64_t>(last_total_bytes_) : 0;
    metadata.duration = progress::elapsed(started_at_, now);
    metadata.start_time = started_at_.value_or(now);
    metadata.end_time = now;
    metadata.download_path = download_path;
    metadata_ = std::move(metadata);
}

void ReceiverStateMachine::reset() {
    *this = ReceiverStateMachine{};
}

} // namespace sendme::session
