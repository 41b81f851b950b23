#include "sendme/session/status.hpp"

#include "sendme/progress/calculator.hpp"

namespace sendme::session {

std::string sender_status_text(const SenderStateMachine& state) {
    if (state.is_loading()) {
        return "Preparing for transport...";
    }
    switch (state.phase()) {
        case SenderPhase::Completed: return "Transfer completed";
        case SenderPhase::Transporting: return "Sending in progress";
        case SenderPhase::Importing: return "Importing files...";
        case SenderPhase::Sharing: return "Waiting for receiver";
        case SenderPhase::Selecting: return "Item selected";
        case SenderPhase::Idle: break;
    }
    return "Drag & drop";
}

std::string receiver_status_text(const ReceiverStateMachine& state) {
    switch (state.phase()) {
        case ReceiverPhase::Completed: return "Download completed";
        case ReceiverPhase::Exporting: return "Saving files...";
        case ReceiverPhase::Transporting: return "Downloading in progress";
        case ReceiverPhase::Connecting:
        case ReceiverPhase::Idle: break;
    }
    return "Connecting to sender";
}

std::string resume_notice(std::int64_t resumed_from_bytes) {
    const auto bytes = resumed_from_bytes > 0 ? static_cast<std::uint64_t>(resumed_from_bytes) : 0;
    return "Resuming download from " + progress::format_bytes(bytes);
}

} // namespace sendme::session
