#pragma once
#include "network/config.hpp"
#include "network/connection_manager.hpp"
#include "network/socket.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <unordered_map>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob {
//---------------------------------------------------------------------------
namespace utils {
class Logger;
}
//---------------------------------------------------------------------------
namespace network {
class HttpConnection;
class Router;
//---------------------------------------------------------------------------
/// The event loop that accepts connections and drives them on one thread
class DeliveryServer {
    /// The config
    Config _config;
    /// The router
    const Router& _router;
    /// The logger
    utils::Logger& _logger;
    /// The tcp settings
    ConnectionManager::TCPSettings _tcpSettings;
    /// The connection manager
    ConnectionManager _connectionManager;
    /// The outstanding accept
    Socket::Request _acceptRequest;
    /// The connections by fd
    std::unordered_map<int32_t, std::unique_ptr<HttpConnection>> _connections;
    /// The stop flag
    std::atomic<bool> _stopped;

    /// Handle a completed accept
    void accepted(int64_t result);
    /// Progress a connection after a completion
    void progress(HttpConnection& connection);
    /// Close a connection
    void close(int32_t fd);

    public:
    /// The constructor binds the listen address
    DeliveryServer(Config config, const Router& router, utils::Logger& logger);
    /// The destructor
    ~DeliveryServer();

    /// Run the loop until stop is called
    void run();
    /// Stop the loop, callable from other threads
    void stop() { _stopped = true; }

    /// Get the bound port
    [[nodiscard]] uint16_t getPort() const { return _connectionManager.getPort(); }
    /// Get the open connections
    [[nodiscard]] uint64_t getConnections() const { return _connections.size(); }
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace repoblob
