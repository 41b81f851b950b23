#include "sendme/events/components.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <string_view>

namespace sendme::events {
namespace {

constexpr std::array<std::string_view, 15> kLifecycleEvents{
    names::kImportStarted, names::kImportFileCount, names::kImportProgress,
    names::kImportCompleted, names::kTransferStarted, names::kTransferProgress,
    names::kTransferCompleted, names::kReceiveStarted, names::kReceiveResumed,
    names::kReceiveProgress, names::kReceiveFileNames, names::kExportStarted,
    names::kExportProgress, names::kExportCompleted, names::kReceiveCompleted,
};

bool is_tick(const std::string& name) {
    return name == names::kImportProgress || name == names::kTransferProgress ||
           name == names::kReceiveProgress || name == names::kExportProgress;
}

} // namespace

LoggerComponent::LoggerComponent(EventBus& bus) {
    for (const auto name : kLifecycleEvents) {
        subscriptions_.add(bus.subscribe(name, [this](const EngineEvent& e) { on_event(e); }));
    }
}

std::uint64_t LoggerComponent::count(const std::string& event_name) const {
    auto it = counts_.find(event_name);
    return it != counts_.end() ? it->second : 0;
}

void LoggerComponent::on_event(const EngineEvent& e) {
    ++counts_[e.name];
    ++total_;

    const std::string_view payload(e.payload);
    const auto preview = payload.substr(0, std::min<std::size_t>(50, payload.size()));
    if (is_tick(e.name)) {
        spdlog::debug("[{}] {}", e.name, preview);
    } else if (e.payload.empty()) {
        spdlog::info("[{}]", e.name);
    } else {
        spdlog::info("[{}] {}", e.name, preview);
    }
}

} // namespace sendme::events
