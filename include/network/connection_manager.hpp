#pragma once
#include <cassert>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob {
namespace network {
//---------------------------------------------------------------------------
class Socket;
//---------------------------------------------------------------------------
// This class owns the listening socket, the accepted connections
// and the socket backend that drives them.
class ConnectionManager {
    public:
    /// The tcp settings
    struct TCPSettings {
        /// flag for nonBlocking
        int nonBlocking = 1;
        /// flag for noDelay
        int noDelay = 1;
        /// flag for keepAlive
        int keepAlive = 1;
        /// time for tcp keepIdle
        int keepIdle = 60;
        /// time for tcp keepIntvl
        int keepIntvl = 10;
        /// probe count
        int keepCnt = 3;
        /// send buffer for tcp
        int sendBuffer = 0;
        /// Reuse address
        int reuse = 1;
        /// Reuse port
        int reusePorts = 0;
        /// The listen backlog
        int backlog = 512;
        /// The timeout of a single socket operation
        std::chrono::milliseconds timeout = std::chrono::seconds(30);
    };

    private:
    /// The socket wrapper
    std::unique_ptr<Socket> _socketWrapper;
    /// The accepted sockets
    std::unordered_set<int32_t> _fdSockets;
    /// The listening socket
    int32_t _listenFd = -1;
    /// The bound port
    uint16_t _port = 0;

    public:
    /// The constructor, prefers io_uring and falls back to poll
    explicit ConnectionManager(unsigned uringEntries);
    /// The destructor closes all sockets
    ~ConnectionManager();
    /// Delete copy
    ConnectionManager(const ConnectionManager&) = delete;
    /// Delete copy assignment
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// Creates the listening socket
    int32_t listen(const std::string& hostname, uint16_t port, const TCPSettings& tcpSettings);
    /// Registers and configures an accepted socket
    void accepted(int32_t fd, const TCPSettings& tcpSettings);
    /// Disconnects the socket
    void disconnect(int32_t fd);

    /// Get the listening socket
    [[nodiscard]] int32_t getListenFd() const { return _listenFd; }
    /// Get the bound port
    [[nodiscard]] uint16_t getPort() const { return _port; }
    /// Get the number of accepted connections
    [[nodiscard]] uint64_t getConnections() const { return _fdSockets.size(); }

    /// Get the socket
    Socket& getSocketConnection() {
        assert(_socketWrapper);
        return *_socketWrapper.get();
    }
};
//---------------------------------------------------------------------------
}; // namespace network
}; // namespace repoblob
