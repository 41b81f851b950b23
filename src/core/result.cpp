#include "sendme/core/result.hpp"

namespace sendme {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::CommandFailure: return "command failure";
        case ErrorKind::EventParseFailure: return "event parse failure";
        case ErrorKind::ResourceFailure: return "resource failure";
        case ErrorKind::MetadataFallback: return "metadata fallback";
        case ErrorKind::Busy: return "busy";
        case ErrorKind::InvalidInput: return "invalid input";
        case ErrorKind::ConfigError: return "config error";
    }
    return "unknown";
}

} // namespace sendme
