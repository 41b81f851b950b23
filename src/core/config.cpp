#include "sendme/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sendme::core {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

template<typename T>
sendme::Result<void> read_optional(const json& doc, const char* key, T& out) {
    const auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return sendme::Ok();
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        return sendme::Err<void>(ErrorKind::ConfigError,
                                 std::string("Invalid value for '") + key + "': " + e.what());
    }
    return sendme::Ok();
}

} // namespace

std::string default_download_dir() {
    if (auto xdg = env_or_empty("XDG_DOWNLOAD_DIR"); !xdg.empty()) {
        return xdg;
    }
    if (auto home = env_or_empty("HOME"); !home.empty()) {
        return (fs::path(home) / "Downloads").string();
    }
    return {};
}

ClientConfig default_config() {
    ClientConfig config;
    config.default_save_path = default_download_dir();
    return config;
}

sendme::Result<ClientConfig> parse_config(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return sendme::Err<ClientConfig>(ErrorKind::ConfigError,
                                         std::string("Malformed config: ") + e.what());
    }
    if (!doc.is_object()) {
        return sendme::Err<ClientConfig>(ErrorKind::ConfigError, "Config root must be an object");
    }

    ClientConfig config = default_config();
    for (auto res : {read_optional(doc, "default_save_path", config.default_save_path),
                     read_optional(doc, "log_level", config.log_level),
                     read_optional(doc, "log_pattern", config.log_pattern),
                     read_optional(doc, "analytics_enabled", config.analytics_enabled)}) {
        if (res.is_error()) {
            return sendme::Err<ClientConfig>(res.error());
        }
    }
    return sendme::Ok(std::move(config));
}

sendme::Result<ClientConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return sendme::Err<ClientConfig>(ErrorKind::ConfigError,
                                         "Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto parsed = parse_config(buffer.str());
    if (parsed.is_ok()) {
        spdlog::info("Loaded config from {}", path.string());
    }
    return parsed;
}

sendme::Result<void> apply_logging(const ClientConfig& config) {
    const auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && config.log_level != "off") {
        return sendme::Err<void>(ErrorKind::ConfigError, "Unknown log level: " + config.log_level);
    }
    spdlog::set_level(level);
    spdlog::set_pattern(config.log_pattern);
    return sendme::Ok();
}

} // namespace sendme::core
