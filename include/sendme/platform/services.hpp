#pragma once

#include "sendme/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace sendme::platform {

/**
 * @brief Native file/folder pickers
 *
 * nullopt means the user cancelled; an error means the dialog could not
 * be shown.
 */
class DialogService {
public:
    virtual ~DialogService() = default;

    virtual sendme::Result<std::optional<std::string>> browse_for_folder() = 0;
    virtual sendme::Result<std::optional<std::string>> browse_for_file() = 0;
};

class Clipboard {
public:
    virtual ~Clipboard() = default;

    virtual sendme::Result<void> write_text(const std::string& text) = 0;
};

/**
 * @brief Fire-and-forget usage beacon
 *
 * Implementations may throw anything; callers swallow and log.
 */
class Analytics {
public:
    virtual ~Analytics() = default;

    virtual void track_data_transfer(std::uint64_t size_bytes) = 0;
};

/// Forward one observation, logging and swallowing any failure.
void report_data_transfer(Analytics& analytics, std::uint64_t size_bytes);

/// {"event":"data-transferred","data":{"size_bytes":N,"size_mb":M}}
nlohmann::json make_transfer_observation(std::uint64_t size_bytes);

/**
 * @brief Analytics sink that writes observations to the log
 *
 * Used when no beacon endpoint is configured, and as the disabled sink
 * when analytics_enabled is false (records nothing).
 */
class LogAnalytics : public Analytics {
public:
    explicit LogAnalytics(bool enabled = true) : enabled_(enabled) {}

    void track_data_transfer(std::uint64_t size_bytes) override;

    [[nodiscard]] std::uint64_t observations() const noexcept { return observations_; }

private:
    bool enabled_;
    std::uint64_t observations_ = 0;
};

} // namespace sendme::platform
