#include "sendme/progress/calculator.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <array>
#include <charconv>
#include <system_error>

namespace sendme::progress {
namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string_view first_segment(std::string_view path) {
    return path.substr(0, path.find('/'));
}

} // namespace

double bytes_progress(std::int64_t transferred, std::int64_t total) noexcept {
    if (total <= 0) {
        return 0.0;
    }
    return static_cast<double>(transferred) / static_cast<double>(total) * 100.0;
}

double speed_bps(std::int64_t raw_units) noexcept {
    return static_cast<double>(raw_units) / kSpeedUnitsPerByte;
}

double file_count_progress(std::int64_t /*processed*/, std::int64_t /*total*/,
                           std::int64_t reported_percentage) noexcept {
    return static_cast<double>(reported_percentage);
}

std::chrono::milliseconds elapsed(std::optional<std::chrono::system_clock::time_point> start,
                                  std::chrono::system_clock::time_point end) noexcept {
    if (!start) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - *start);
}

std::string display_name(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return std::string(kFallbackDisplayName);
    }

    if (paths.size() == 1) {
        const std::string& only = paths.front();
        const auto slash = only.rfind('/');
        if (slash == std::string::npos) {
            return only;
        }
        const std::string leaf = only.substr(slash + 1);
        return leaf.empty() ? only : leaf;
    }

    // Collapse to the shared top-level directory when every path lives under it
    const std::string_view root = first_segment(paths.front());
    bool shared_root = !root.empty();
    for (const auto& path : paths) {
        if (!shared_root) {
            break;
        }
        shared_root = path.find('/') != std::string::npos && first_segment(path) == root;
    }
    if (shared_root) {
        return std::string(root);
    }
    return fmt::format("{} files", paths.size());
}

std::string leaf_name(std::string_view path) {
    const auto slash = path.rfind('/');
    const std::string_view leaf = slash == std::string_view::npos ? path : path.substr(slash + 1);
    return leaf.empty() ? std::string(kUnknownLeafName) : std::string(leaf);
}

std::string format_bytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 5> units{"Bytes", "KB", "MB", "GB", "TB"};
    if (bytes == 0) {
        return "0 Bytes";
    }

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    std::string number = fmt::format("{:.2f}", value);
    // "1.50" -> "1.5", "2.00" -> "2"
    number.erase(number.find_last_not_of('0') + 1);
    if (!number.empty() && number.back() == '.') {
        number.pop_back();
    }
    return fmt::format("{} {}", number, units[unit]);
}

std::optional<std::int64_t> parse_count(std::string_view payload) {
    const std::string_view text = trim(payload);
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<CounterTriple> parse_triple(std::string_view payload) {
    std::array<std::int64_t, 3> fields{};
    std::size_t index = 0;
    std::size_t start = 0;

    while (true) {
        const auto colon = payload.find(':', start);
        const auto field = payload.substr(start, colon == std::string_view::npos
                                                     ? std::string_view::npos
                                                     : colon - start);
        if (index >= fields.size()) {
            return std::nullopt;  // more than three fields
        }
        const auto value = parse_count(field);
        if (!value) {
            return std::nullopt;
        }
        fields[index++] = *value;

        if (colon == std::string_view::npos) {
            break;
        }
        start = colon + 1;
    }

    if (index != fields.size()) {
        return std::nullopt;
    }
    return CounterTriple{fields[0], fields[1], fields[2]};
}

std::optional<std::vector<std::string>> parse_file_names(std::string_view payload) {
    const auto doc = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        return std::nullopt;
    }

    std::vector<std::string> names;
    names.reserve(doc.size());
    for (const auto& entry : doc) {
        if (!entry.is_string()) {
            return std::nullopt;
        }
        names.push_back(entry.get<std::string>());
    }
    return names;
}

session::TransferProgress transfer_progress_from(const CounterTriple& triple) noexcept {
    session::TransferProgress progress;
    progress.bytes_transferred = triple.first;
    progress.total_bytes = triple.second;
    progress.speed_bps = speed_bps(triple.third);
    progress.percentage = bytes_progress(triple.first, triple.second);
    return progress;
}

session::ImportProgress import_progress_from(const CounterTriple& triple) noexcept {
    session::ImportProgress progress;
    progress.processed = triple.first;
    progress.total = triple.second;
    progress.percentage = file_count_progress(triple.first, triple.second, triple.third);
    return progress;
}

session::ExportProgress export_progress_from(const CounterTriple& triple) noexcept {
    session::ExportProgress progress;
    progress.current = triple.first;
    progress.total = triple.second;
    progress.percentage = file_count_progress(triple.first, triple.second, triple.third);
    return progress;
}

} // namespace sendme::progress
