#pragma once

#include "sendme/session/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sendme::session {

/**
 * @brief Sending-role session state
 *
 * Import, sharing and transport are tracked independently because the
 * engine pipelines them; phase() folds them into one observable phase
 * with precedence Completed > Transporting > Importing > Sharing >
 * Selecting > Idle.
 *
 * Event methods apply unconditionally so a stale event arriving after a
 * reset only touches already-cleared state.
 */
class SenderStateMachine {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    [[nodiscard]] SenderPhase phase() const noexcept;

    void select_path(std::string path);
    void set_loading(bool loading) noexcept { loading_ = loading; }
    void on_sharing_started(std::string ticket);

    void on_import_started();
    void on_import_file_count(std::int64_t total);
    void on_import_progress(const ImportProgress& progress);
    void on_import_completed();

    void on_transfer_started(TimePoint now);
    void on_transfer_progress(const TransferProgress& progress);

    /**
     * @brief Finish the session and build metadata for the selected path
     *
     * file_size is the engine's authoritative size; nullopt (query failed)
     * records 0. Without a selected path no metadata is produced.
     */
    void on_transfer_completed(TimePoint now, std::optional<std::uint64_t> file_size);

    /// Back to Idle with every counter and identifier cleared.
    void reset();

    [[nodiscard]] bool is_sharing() const noexcept { return sharing_; }
    [[nodiscard]] bool is_importing() const noexcept { return importing_; }
    [[nodiscard]] bool is_transporting() const noexcept { return transporting_; }
    [[nodiscard]] bool is_completed() const noexcept { return completed_; }
    [[nodiscard]] bool is_loading() const noexcept { return loading_; }

    [[nodiscard]] const std::optional<std::string>& selected_path() const noexcept { return selected_path_; }
    [[nodiscard]] const std::optional<std::string>& ticket() const noexcept { return ticket_; }
    [[nodiscard]] const std::optional<TransferProgress>& transfer_progress() const noexcept { return transfer_progress_; }
    [[nodiscard]] const std::optional<ImportProgress>& import_progress() const noexcept { return import_progress_; }
    [[nodiscard]] const std::optional<TransferMetadata>& metadata() const noexcept { return metadata_; }
    [[nodiscard]] std::optional<TimePoint> started_at() const noexcept { return started_at_; }
    [[nodiscard]] std::optional<TimePoint> ended_at() const noexcept { return ended_at_; }

    /// Total from the latest transfer-progress tick; survives progress clearing.
    [[nodiscard]] std::int64_t last_total_bytes() const noexcept { return last_total_bytes_; }

private:
    bool sharing_ = false;
    bool importing_ = false;
    bool transporting_ = false;
    bool completed_ = false;
    bool loading_ = false;

    std::optional<std::string> selected_path_;
    std::optional<std::string> ticket_;
    std::optional<TransferProgress> transfer_progress_;
    std::optional<ImportProgress> import_progress_;
    std::optional<TransferMetadata> metadata_;
    std::optional<TimePoint> started_at_;
    std::optional<TimePoint> ended_at_;
    std::int64_t last_total_bytes_ = 0;
};

} // namespace sendme::session
