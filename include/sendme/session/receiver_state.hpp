#pragma once

#include "sendme/session/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sendme::session {

/**
 * @brief Receiving-role session state
 *
 * phase() precedence: Completed > Exporting > Transporting > Connecting > Idle.
 *
 * file_names() and last_total_bytes() are the values the completion step
 * reads after the progress snapshot they came with has been cleared.
 * Both survive until the next begin_receive() or reset().
 */
class ReceiverStateMachine {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    [[nodiscard]] ReceiverPhase phase() const noexcept;

    void set_ticket(std::string ticket) { ticket_ = std::move(ticket); }

    /// Receive requested: clear the previous outcome and file names, enter Connecting.
    void begin_receive();

    /// Receive command rejected: back to Idle, ticket kept.
    void abort_receive();

    void on_receive_started(TimePoint now);
    void on_resumed(std::int64_t local_size_bytes);
    void clear_resume() noexcept { resumed_from_.reset(); }
    void on_receive_progress(const TransferProgress& progress);
    void on_file_names(std::vector<std::string> names);

    void on_export_started(std::int64_t total_files);
    void on_export_progress(const ExportProgress& progress);
    void on_export_completed();

    void on_receive_completed(TimePoint now, const std::string& download_path);

    /// Back to Idle, dropping ticket, metadata, progress, resume and names.
    void reset();

    [[nodiscard]] bool is_receiving() const noexcept { return receiving_; }
    [[nodiscard]] bool is_transporting() const noexcept { return transporting_; }
    [[nodiscard]] bool is_exporting() const noexcept { return exporting_; }
    [[nodiscard]] bool is_completed() const noexcept { return completed_; }

    [[nodiscard]] const std::string& ticket() const noexcept { return ticket_; }
    [[nodiscard]] const std::optional<TransferProgress>& transfer_progress() const noexcept { return transfer_progress_; }
    [[nodiscard]] const std::optional<ExportProgress>& export_progress() const noexcept { return export_progress_; }
    [[nodiscard]] const std::optional<TransferMetadata>& metadata() const noexcept { return metadata_; }
    [[nodiscard]] const std::optional<std::int64_t>& resumed_from() const noexcept { return resumed_from_; }
    [[nodiscard]] const std::vector<std::string>& file_names() const noexcept { return file_names_; }
    [[nodiscard]] std::optional<TimePoint> started_at() const noexcept { return started_at_; }
    [[nodiscard]] std::optional<TimePoint> ended_at() const noexcept { return ended_at_; }
    [[nodiscard]] std::int64_t last_total_bytes() const noexcept { return last_total_bytes_; }

private:
    void clear_outcome();

    bool receiving_ = false;
    bool transporting_ = false;
    bool exporting_ = false;
    bool completed_ = false;

    std::string ticket_;
    std::optional<TransferProgress> transfer_progress_;
    std::optional<ExportProgress> export_progress_;
    std::optional<TransferMetadata> metadata_;
    std::optional<std::int64_t> resumed_from_;
    std::vector<std::string> file_names_;
    std::optional<TimePoint> started_at_;
    std::optional<TimePoint> ended_at_;
    std::int64_t last_total_bytes_ = 0;
};

} // namespace sendme::session
