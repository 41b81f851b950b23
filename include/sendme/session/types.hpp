#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sendme::session {

enum class Role {
    Sender,
    Receiver
};

enum class SenderPhase {
    Idle,
    Selecting,
    Importing,
    Sharing,
    Transporting,
    Completed
};

enum class ReceiverPhase {
    Idle,
    Connecting,
    Transporting,
    Exporting,
    Completed
};

const char* to_string(Role role) noexcept;
const char* to_string(SenderPhase phase) noexcept;
const char* to_string(ReceiverPhase phase) noexcept;

/**
 * @brief Byte-level transport snapshot
 *
 * Exists only while transporting. percentage is 0 when total_bytes <= 0
 * and is not clamped to 100.
 */
struct TransferProgress {
    std::int64_t bytes_transferred = 0;
    std::int64_t total_bytes = 0;
    double speed_bps = 0.0;
    double percentage = 0.0;
};

/// Sender-side preparation counters.
struct ImportProgress {
    std::int64_t processed = 0;
    std::int64_t total = 0;
    double percentage = 0.0;
};

/// Receiver-side materialization counters.
struct ExportProgress {
    std::int64_t current = 0;
    std::int64_t total = 0;
    double percentage = 0.0;
};

/**
 * @brief Summary of a finished session, produced once at completion
 */
struct TransferMetadata {
    std::string file_name;
    std::uint64_t file_size = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point end_time{};
    std::optional<std::string> download_path; ///< Receiver only
};

} // namespace sendme::session
