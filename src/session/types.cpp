#include "sendme/session/types.hpp"

namespace sendme::session {

const char* to_string(Role role) noexcept {
    switch (role) {
        case Role::Sender: return "sender";
        case Role::Receiver: return "receiver";
    }
    return "unknown";
}

const char* to_string(SenderPhase phase) noexcept {
    switch (phase) {
        case SenderPhase::Idle: return "idle";
        case SenderPhase::Selecting: return "selecting";
        case SenderPhase::Importing: return "importing";
        case SenderPhase::Sharing: return "sharing";
        case SenderPhase::Transporting: return "transporting";
        case SenderPhase::Completed: return "completed";
    }
    return "unknown";
}

const char* to_string(ReceiverPhase phase) noexcept {
    switch (phase) {
        case ReceiverPhase::Idle: return "idle";
        case ReceiverPhase::Connecting: return "connecting";
        case ReceiverPhase::Transporting: return "transporting";
        case ReceiverPhase::Exporting: return "exporting";
        case ReceiverPhase::Completed: return "completed";
    }
    return "unknown";
}

} // namespace sendme::session
