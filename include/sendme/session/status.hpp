#pragma once

#include "sendme/session/receiver_state.hpp"
#include "sendme/session/sender_state.hpp"

#include <cstdint>
#include <string>

namespace sendme::session {

/// One-line status for the sending view ("Sending in progress", ...).
std::string sender_status_text(const SenderStateMachine& state);

/// One-line status for the receiving view ("Saving files...", ...).
std::string receiver_status_text(const ReceiverStateMachine& state);

/// "Resuming download from 488.28 KB"
std::string resume_notice(std::int64_t resumed_from_bytes);

} // namespace sendme::session
