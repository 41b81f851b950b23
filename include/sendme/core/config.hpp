#pragma once

#include "sendme/core/result.hpp"

#include <filesystem>
#include <string>

namespace sendme::core {

/**
 * @brief Client-wide settings
 *
 * Loaded from an optional JSON file; every key is optional:
 * {
 *   "default_save_path": "/home/user/Downloads",
 *   "log_level": "info",
 *   "log_pattern": "[%H:%M:%S] [%^%l%$] %v",
 *   "analytics_enabled": true
 * }
 */
struct ClientConfig {
    std::string default_save_path;
    std::string log_level = "info";
    std::string log_pattern = "[%H:%M:%S] [%^%l%$] %v";
    bool analytics_enabled = true;
};

/// Downloads directory: $XDG_DOWNLOAD_DIR, else $HOME/Downloads, else empty.
std::string default_download_dir();

/// Defaults with default_save_path resolved from the environment.
ClientConfig default_config();

sendme::Result<ClientConfig> parse_config(const std::string& json_text);

sendme::Result<ClientConfig> load_config(const std::filesystem::path& path);

/// Apply log level and pattern to the global spdlog logger.
sendme::Result<void> apply_logging(const ClientConfig& config);

} // namespace sendme::core
