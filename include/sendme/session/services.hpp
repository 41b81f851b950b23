#pragma once

#include "sendme/core/scheduler.hpp"
#include "sendme/engine/transfer_engine.hpp"
#include "sendme/platform/services.hpp"
#include "sendme/session/notification.hpp"

namespace sendme::session {

/**
 * @brief Collaborators a session controller talks to
 *
 * All references must outlive the controllers built from them.
 */
struct SessionServices {
    engine::TransferEngine& engine;
    core::Scheduler& scheduler;
    NotificationSurface& alerts;
    platform::Analytics& analytics;
    platform::DialogService& dialogs;
    platform::Clipboard& clipboard;
};

} // namespace sendme::session
