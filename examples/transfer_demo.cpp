/**
 * @file transfer_demo.cpp
 * @brief Sender and receiver sessions driven by a simulated engine
 *
 * WHAT IT SHOWS:
 * - Engine events produced on a worker thread, delivered on the loop thread
 * - SenderController and ReceiverController sharing one bus and one alert slot
 * - Status text and progress as a view would render them
 *
 * USAGE:
 * ./transfer_demo [config.json]
 */

#include "sendme/core/config.hpp"
#include "sendme/engine/transfer_engine.hpp"
#include "sendme/events/components.hpp"
#include "sendme/events/event_bus.hpp"
#include "sendme/events/events.hpp"
#include "sendme/platform/services.hpp"
#include "sendme/progress/calculator.hpp"
#include "sendme/runtime/event_loop.hpp"
#include "sendme/session/notification.hpp"
#include "sendme/session/receiver_controller.hpp"
#include "sendme/session/sender_controller.hpp"
#include "sendme/session/status.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace sendme;
using namespace sendme::events;
using namespace std::chrono_literals;

// ════════════════════════════════════════════════════════════
// Simulated Engine
// ════════════════════════════════════════════════════════════

/**
 * Plays back the event sequence a real engine produces for one sender
 * and one receiver on the same machine.
 */
class SimulatedEngine : public engine::TransferEngine {
public:
    explicit SimulatedEngine(runtime::EventLoop& loop) : loop_(loop) {}

    ~SimulatedEngine() override {
        for (auto& worker : workers_) {
            worker.join();
        }
    }

    Result<std::string> start_sharing(const std::string& path) override {
        if (path.empty()) {
            return Err<std::string>(ErrorKind::CommandFailure, "empty path");
        }
        shared_path_ = path;
        workers_.emplace_back([this] {
            emit(names::kImportStarted);
            emit(names::kImportFileCount, "3");
            for (int i = 1; i <= 3; i++) {
                emit(names::kImportProgress, std::to_string(i) + ":3:" + std::to_string(i * 100 / 3));
            }
            emit(names::kImportCompleted);
        });
        return Ok(std::string("blobticket-demo-") + std::to_string(path.size()));
    }

    Result<void> stop_sharing() override {
        shared_path_.clear();
        return Ok();
    }

    Result<void> receive(const std::string& ticket, const std::string& output_path) override {
        if (ticket.rfind("blobticket-", 0) != 0) {
            return Err<void>(ErrorKind::CommandFailure, "invalid ticket");
        }
        spdlog::debug("Simulated receive into {}", output_path);

        workers_.emplace_back([this] {
            constexpr std::int64_t total = 3 * 1024 * 1024;
            constexpr std::int64_t chunk = 512 * 1024;

            emit(names::kTransferStarted);
            emit(names::kReceiveStarted);
            emit(names::kReceiveResumed, std::to_string(chunk));
            emit(names::kReceiveFileNames, nlohmann::json{"photos/a.jpg", "photos/b.jpg", "photos/c.jpg"}.dump());

            for (std::int64_t done = chunk; done <= total; done += chunk) {
                const auto triple = std::to_string(done) + ":" + std::to_string(total) + ":" +
                                    std::to_string(chunk * 1000 * 10);
                emit(names::kTransferProgress, triple);
                emit(names::kReceiveProgress, triple);
                std::this_thread::sleep_for(100ms);
            }

            emit(names::kExportStarted, "3");
            for (int i = 1; i <= 3; i++) {
                emit(names::kExportProgress, std::to_string(i) + ":3:" + std::to_string(i * 100 / 3));
            }
            emit(names::kExportCompleted);
            emit(names::kTransferCompleted);
            emit(names::kReceiveCompleted);
        });
        return Ok();
    }

    Result<std::uint64_t> get_file_size(const std::string& path) override {
        if (path != shared_path_) {
            return Err<std::uint64_t>(ErrorKind::MetadataFallback, "not shared: " + path);
        }
        return Ok(std::uint64_t{3 * 1024 * 1024});
    }

private:
    void emit(std::string_view name, std::string payload = {}) {
        loop_.post(EngineEvent(std::string(name), std::move(payload)));
    }

    runtime::EventLoop& loop_;
    std::string shared_path_;
    std::vector<std::thread> workers_;
};

// ════════════════════════════════════════════════════════════
// Headless platform services
// ════════════════════════════════════════════════════════════

// No display: every picker behaves as if the user cancelled
class HeadlessDialogs : public platform::DialogService {
public:
    Result<std::optional<std::string>> browse_for_folder() override {
        return Ok(std::optional<std::string>{});
    }
    Result<std::optional<std::string>> browse_for_file() override {
        return Ok(std::optional<std::string>{});
    }
};

class LogClipboard : public platform::Clipboard {
public:
    Result<void> write_text(const std::string& text) override {
        spdlog::info("[Clipboard] {}", text);
        return Ok();
    }
};

int main(int argc, char* argv[]) {
    core::ClientConfig config = core::default_config();
    if (argc > 1) {
        auto loaded = core::load_config(argv[1]);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().message);
            return 1;
        }
        config = std::move(loaded.value());
    }
    if (auto applied = core::apply_logging(config); applied.is_error()) {
        spdlog::error("{}", applied.error().message);
        return 1;
    }

    EventBus bus;
    runtime::EventLoop loop(bus);
    LoggerComponent event_logger(bus);

    SimulatedEngine engine(loop);
    session::NotificationSurface alerts;
    platform::LogAnalytics analytics(config.analytics_enabled);
    HeadlessDialogs dialogs;
    LogClipboard clipboard;
    const session::SessionServices services{engine, loop, alerts, analytics, dialogs, clipboard};

    session::SenderController sender(services);
    session::ReceiverController receiver(services, config.default_save_path);
    sender.attach(bus);
    receiver.attach(bus);

    // ════════════════════════════════════════════════════════════
    // Sender side
    // ════════════════════════════════════════════════════════════

    if (auto selected = sender.select_path("/home/demo/photos"); selected.is_error()) {
        spdlog::error("{}", selected.error().message);
        return 1;
    }
    auto ticket = sender.start_sharing();
    if (ticket.is_error()) {
        spdlog::error("{}", ticket.error().message);
        return 1;
    }
    if (auto copied = sender.copy_ticket(); copied.is_error()) {
        spdlog::warn("Ticket not copied: {}", copied.error().message);
    }
    loop.run_for(50ms);
    spdlog::info("Sender: {}", session::sender_status_text(sender.state()));

    // ════════════════════════════════════════════════════════════
    // Receiver side
    // ════════════════════════════════════════════════════════════

    if (auto browsed = receiver.browse_for_folder(); browsed.is_error()) {
        spdlog::warn("{}", browsed.error().message);
    }
    if (auto started = receiver.receive(ticket.value(), receiver.save_path()); started.is_error()) {
        spdlog::error("{}", started.error().message);
        return 1;
    }

    double shown = -1.0;
    const bool finished = loop.run_until([&] {
        const auto& progress = receiver.state().transfer_progress();
        if (progress && progress->percentage != shown) {
            shown = progress->percentage;
            spdlog::info("Receiver: {} {:.0f}%", session::receiver_status_text(receiver.state()), shown);
        }
        return receiver.phase() == session::ReceiverPhase::Completed &&
               sender.phase() == session::SenderPhase::Completed;
    }, 30s);

    if (!finished) {
        spdlog::error("Transfer did not complete in time");
        return 1;
    }

    const auto& received = *receiver.state().metadata();
    spdlog::info("Receiver: {} -> {} ({}) in {}ms", session::receiver_status_text(receiver.state()),
                 received.file_name, progress::format_bytes(received.file_size),
                 received.duration.count());
    spdlog::info("Sender: {}", session::sender_status_text(sender.state()));
    spdlog::info("{} engine events observed, {} analytics observations",
                 event_logger.total(), analytics.observations());

    if (auto stopped = sender.stop_sharing(); stopped.is_error()) {
        spdlog::warn("{}", stopped.error().message);
    }
    receiver.reset_for_new_transfer();
    return 0;
}
