#include "network/connection_manager.hpp"
#ifdef REPOBLOB_HAS_IO_URING
#include "network/io_uring_socket.hpp"
#endif
#include "network/poll_socket.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Set an int socket option if enabled
void setOption(int fd, int level, int name, int value, const char* what)
{
    if (value <= 0)
        return;
    if (setsockopt(fd, level, name, &value, sizeof(value)))
        throw runtime_error(string("Socket creation error! - ") + what + " error: " + strerror(errno));
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
ConnectionManager::ConnectionManager([[maybe_unused]] unsigned uringEntries)
// The constructor
{
#ifdef REPOBLOB_HAS_IO_URING
    // Init can fail on runtime instances with kernel < 5.6 as we do not have the uring syscall or specific feature is not available
    try {
        _socketWrapper = make_unique<IOUringSocket>(uringEntries);
    } catch (std::runtime_error& /*error*/) {
        // Fall back to poll socket
        _socketWrapper = make_unique<PollSocket>();
    }
#else
    _socketWrapper = make_unique<PollSocket>();
#endif
}
//---------------------------------------------------------------------------
int32_t ConnectionManager::listen(const string& hostname, uint16_t port, const TCPSettings& tcpSettings)
// Creates the listening socket
{
    if (_listenFd >= 0)
        throw runtime_error("Socket creation error! Already listening.");

    addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
    addrinfo* temp = nullptr;
    auto portString = to_string(port);
    if (auto res = getaddrinfo(hostname.c_str(), portString.c_str(), &hints, &temp); res != 0)
        throw runtime_error("Hostname resolution error! " + hostname + ": " + gai_strerror(res));
    unique_ptr<addrinfo, decltype(&freeaddrinfo)> addr(temp, &freeaddrinfo);

    auto fd = socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
    if (fd == -1)
        throw runtime_error("Socket creation error! " + string(strerror(errno)));

    try {
        setOption(fd, SOL_SOCKET, SO_REUSEADDR, tcpSettings.reuse, "reuse address");
        setOption(fd, SOL_SOCKET, SO_REUSEPORT, tcpSettings.reusePorts, "reuse port");
        // No blocking mode
        if (tcpSettings.nonBlocking > 0) {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
                throw runtime_error("Socket creation error! - non blocking error");
        }
        if (::bind(fd, addr->ai_addr, addr->ai_addrlen) < 0)
            throw runtime_error("Socket bind error! " + hostname + ":" + portString + ": " + strerror(errno));
        if (::listen(fd, tcpSettings.backlog) < 0)
            throw runtime_error("Socket listen error! " + string(strerror(errno)));

        sockaddr_storage bound = {};
        socklen_t length = sizeof(bound);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &length) < 0)
            throw runtime_error("Socket name error! " + string(strerror(errno)));
        if (bound.ss_family == AF_INET6)
            _port = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        else
            _port = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
    } catch (...) {
        close(fd);
        throw;
    }
    _listenFd = fd;
    return fd;
}
//---------------------------------------------------------------------------
void ConnectionManager::accepted(int32_t fd, const TCPSettings& tcpSettings)
// Registers and configures an accepted socket
{
    _fdSockets.insert(fd);
    setOption(fd, SOL_TCP, TCP_NODELAY, tcpSettings.noDelay, "nodelay");
    setOption(fd, SOL_SOCKET, SO_KEEPALIVE, tcpSettings.keepAlive, "keep alive");
    if (tcpSettings.keepAlive > 0) {
        setOption(fd, SOL_TCP, TCP_KEEPIDLE, tcpSettings.keepIdle, "keep idle");
        setOption(fd, SOL_TCP, TCP_KEEPINTVL, tcpSettings.keepIntvl, "keep intvl");
        setOption(fd, SOL_TCP, TCP_KEEPCNT, tcpSettings.keepCnt, "keep cnt");
    }
    setOption(fd, SOL_SOCKET, SO_SNDBUF, tcpSettings.sendBuffer, "sendbuf");
}
//---------------------------------------------------------------------------
void ConnectionManager::disconnect(int32_t fd)
// Disconnects the socket
{
    if (!_fdSockets.erase(fd))
        return;
    _socketWrapper->cancel(fd);
    shutdown(fd, SHUT_WR);
    close(fd);
}
//---------------------------------------------------------------------------
ConnectionManager::~ConnectionManager()
// The destructor
{
    for (auto fd : _fdSockets)
        close(fd);
    if (_listenFd >= 0)
        close(_listenFd);
}
//---------------------------------------------------------------------------
} // namespace repoblob::network
