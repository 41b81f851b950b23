/**
 * @file events.hpp
 * @brief Lifecycle events emitted by the transfer engine
 *
 * WHY THIS FILE EXISTS:
 * The engine talks to the orchestration layer only through named events
 * carrying a plain-text payload. This file defines the event record and
 * every name the session layer understands.
 *
 * NAMING CONVENTION:
 * - Names are kebab-case and past tense where they report a fact
 *   ("import-started", "receive-completed")
 * - Payload formats are documented next to each name
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

namespace sendme::events {

/**
 * @brief One engine notification
 *
 * payload is empty for events that carry none.
 */
struct EngineEvent {
    std::string name;
    std::string payload;
    std::chrono::system_clock::time_point timestamp;

    explicit EngineEvent(std::string n, std::string p = {})
        : name(std::move(n)),
          payload(std::move(p)),
          timestamp(std::chrono::system_clock::now())
    {}
};

namespace names {

// ════════════════════════════════════════════════════════
// Sender Events
// ════════════════════════════════════════════════════════

inline constexpr std::string_view kImportStarted = "import-started";       // none
inline constexpr std::string_view kImportFileCount = "import-file-count";  // "<total>"
inline constexpr std::string_view kImportProgress = "import-progress";     // "processed:total:percentage"
inline constexpr std::string_view kImportCompleted = "import-completed";   // none
inline constexpr std::string_view kTransferStarted = "transfer-started";   // none
inline constexpr std::string_view kTransferProgress = "transfer-progress"; // "bytes:total:raw_speed"
inline constexpr std::string_view kTransferCompleted = "transfer-completed"; // none

// ════════════════════════════════════════════════════════
// Receiver Events
// ════════════════════════════════════════════════════════

inline constexpr std::string_view kReceiveStarted = "receive-started";       // none
inline constexpr std::string_view kReceiveResumed = "receive-resumed";       // "<local size bytes>"
inline constexpr std::string_view kReceiveProgress = "receive-progress";     // "bytes:total:raw_speed"
inline constexpr std::string_view kReceiveFileNames = "receive-file-names";  // JSON array of strings
inline constexpr std::string_view kExportStarted = "export-started";         // "<total files>"
inline constexpr std::string_view kExportProgress = "export-progress";       // "current:total:percentage"
inline constexpr std::string_view kExportCompleted = "export-completed";     // none
inline constexpr std::string_view kReceiveCompleted = "receive-completed";   // none

} // namespace names

} // namespace sendme::events
