#include "sendme/platform/services.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <exception>

namespace sendme::platform {

nlohmann::json make_transfer_observation(std::uint64_t size_bytes) {
    const double size_mb = static_cast<double>(size_bytes) / (1024.0 * 1024.0);
    return nlohmann::json{
        {"event", "data-transferred"},
        {"data", {
            {"size_bytes", size_bytes},
            {"size_mb", std::round(size_mb * 100.0) / 100.0},
        }},
    };
}

void report_data_transfer(Analytics& analytics, std::uint64_t size_bytes) {
    try {
        analytics.track_data_transfer(size_bytes);
    } catch (const std::exception& e) {
        // Analytics must never break a finished transfer
        spdlog::warn("Failed to track data transfer: {}", e.what());
    } catch (...) {
        spdlog::warn("Failed to track data transfer: unknown exception");
    }
}

void LogAnalytics::track_data_transfer(std::uint64_t size_bytes) {
    if (!enabled_) {
        return;
    }
    ++observations_;
    spdlog::info("[Analytics] {}", make_transfer_observation(size_bytes).dump());
}

} // namespace sendme::platform
