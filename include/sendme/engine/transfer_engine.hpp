/**
 * @file transfer_engine.hpp
 * @brief Command boundary to the native transfer engine
 *
 * The engine runs on its own thread(s) and reports progress only through
 * lifecycle events (see events/events.hpp). Commands are request/response:
 * each returns once the engine has acknowledged or rejected it.
 */

#pragma once

#include "sendme/core/result.hpp"

#include <cstdint>
#include <string>

namespace sendme::engine {

class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    /// Offer path (file or directory); returns the ticket for receivers.
    virtual sendme::Result<std::string> start_sharing(const std::string& path) = 0;

    /// Withdraw the current offer.
    virtual sendme::Result<void> stop_sharing() = 0;

    /// Begin fetching ticket into output_path. Completion arrives as events.
    virtual sendme::Result<void> receive(const std::string& ticket,
                                         const std::string& output_path) = 0;

    /// Size of a file, or the summed size of a directory tree.
    virtual sendme::Result<std::uint64_t> get_file_size(const std::string& path) = 0;
};

} // namespace sendme::engine
