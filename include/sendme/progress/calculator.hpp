/**
 * @file calculator.hpp
 * @brief Stateless conversions from raw engine counters to display values
 *
 * WHY THIS FILE EXISTS:
 * Both roles receive the same kinds of payloads (colon-delimited counter
 * triples, integer strings, JSON name lists) and derive the same values
 * from them. Parsing and arithmetic live here once; the state machines
 * only decide what a value means for their phase.
 *
 * GUARANTEES:
 * - Never divides by zero: a non-positive total yields 0%
 * - Never clamps: transferred > total reports > 100% as the engine does
 * - Parse functions return nullopt for anything malformed and never throw
 */

#pragma once

#include "sendme/session/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sendme::progress {

/// Label used when a receive completes without any file names.
inline constexpr std::string_view kFallbackDisplayName = "Downloaded File";

/// Label used when a sender path has no final segment.
inline constexpr std::string_view kUnknownLeafName = "Unknown";

/// The engine reports speed in thousandths of a byte per second.
inline constexpr double kSpeedUnitsPerByte = 1000.0;

/**
 * @brief Three colon-delimited integers, e.g. "1000000:2000000:500000"
 */
struct CounterTriple {
    std::int64_t first = 0;
    std::int64_t second = 0;
    std::int64_t third = 0;
};

// ════════════════════════════════════════════════════════
// Arithmetic
// ════════════════════════════════════════════════════════

double bytes_progress(std::int64_t transferred, std::int64_t total) noexcept;

double speed_bps(std::int64_t raw_units) noexcept;

/// Engine already computed the percentage; passed through unchanged.
double file_count_progress(std::int64_t processed, std::int64_t total,
                           std::int64_t reported_percentage) noexcept;

/// end - start, or zero when start is unknown.
std::chrono::milliseconds elapsed(std::optional<std::chrono::system_clock::time_point> start,
                                  std::chrono::system_clock::time_point end) noexcept;

// ════════════════════════════════════════════════════════
// Naming
// ════════════════════════════════════════════════════════

/**
 * @brief One display identity for a set of transferred paths
 *
 * - []                              -> "Downloaded File"
 * - ["a/b/file.txt"]                -> "file.txt"
 * - ["shared/x.txt","shared/y.txt"] -> "shared"
 * - ["x.txt","y.txt"]               -> "2 files"
 */
std::string display_name(const std::vector<std::string>& paths);

/// Last '/' segment of path, "Unknown" when that segment is empty.
std::string leaf_name(std::string_view path);

/// 1024-based size with up to two decimals: "0 Bytes", "1.5 KB", "488.28 KB".
std::string format_bytes(std::uint64_t bytes);

// ════════════════════════════════════════════════════════
// Payload parsing
// ════════════════════════════════════════════════════════

/// Whole-string base-10 integer, surrounding whitespace allowed.
std::optional<std::int64_t> parse_count(std::string_view payload);

/// Exactly three ':'-separated integers.
std::optional<CounterTriple> parse_triple(std::string_view payload);

/// JSON array whose elements are all strings.
std::optional<std::vector<std::string>> parse_file_names(std::string_view payload);

/// (bytes_transferred, total_bytes, raw_speed_units)
session::TransferProgress transfer_progress_from(const CounterTriple& triple) noexcept;

/// (processed, total, percentage)
session::ImportProgress import_progress_from(const CounterTriple& triple) noexcept;

/// (current, total, percentage)
session::ExportProgress export_progress_from(const CounterTriple& triple) noexcept;

} // namespace sendme::progress
