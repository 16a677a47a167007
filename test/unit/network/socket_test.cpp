#include "network/connection_manager.hpp"
#include "network/poll_socket.hpp"
#include <catch2/catch.hpp>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::network::test {
//---------------------------------------------------------------------------
using namespace std;
using namespace std::chrono_literals;
//---------------------------------------------------------------------------
static int connectLocal(uint16_t port)
// Connect a blocking client to the loopback port
{
    auto fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        throw runtime_error("Socket creation error!");
    sockaddr_in address = {};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        ::close(fd);
        throw runtime_error("Socket connect error!");
    }
    return fd;
}
//---------------------------------------------------------------------------
TEST_CASE("poll_socket") {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds) == 0);
    PollSocket socket;

    SECTION("send and receive") {
        string message = "HTTP/1.1 204 No Content\r\n\r\n";
        Socket::Request send{};
        send.data.cdata = reinterpret_cast<const uint8_t*>(message.data());
        send.length = static_cast<int64_t>(message.size());
        send.fd = fds[0];
        send.event = Socket::EventType::write;
        REQUIRE(socket.send(send));

        uint8_t buffer[64];
        Socket::Request recv{};
        recv.data.data = buffer;
        recv.length = sizeof(buffer);
        recv.fd = fds[1];
        recv.event = Socket::EventType::read;
        recv.timeout = 1s;
        REQUIRE(socket.recv(recv));
        REQUIRE(socket.submit() == 2);

        auto received = 0;
        for (auto i = 0; i < 2; i++) {
            auto completed = socket.complete(1s);
            REQUIRE(completed);
            REQUIRE(completed->length == static_cast<int64_t>(message.size()));
            if (completed == &recv)
                received++;
        }
        REQUIRE(received == 1);
        REQUIRE(string(reinterpret_cast<char*>(buffer), message.size()) == message);
    }
    SECTION("timeout") {
        uint8_t buffer[8];
        Socket::Request recv{};
        recv.data.data = buffer;
        recv.length = sizeof(buffer);
        recv.fd = fds[1];
        recv.event = Socket::EventType::read;
        recv.timeout = 20ms;
        REQUIRE(socket.recv(recv));
        REQUIRE_THROWS_AS(socket.recv(recv), runtime_error);
        Socket::Request* completed = nullptr;
        for (auto i = 0; i < 100 && !completed; i++)
            completed = socket.complete(10ms);
        REQUIRE(completed == &recv);
        REQUIRE(recv.length == -ETIMEDOUT);
    }
    SECTION("cancel") {
        uint8_t buffer[8];
        Socket::Request recv{};
        recv.data.data = buffer;
        recv.length = sizeof(buffer);
        recv.fd = fds[1];
        recv.event = Socket::EventType::read;
        REQUIRE(socket.recv(recv));
        socket.cancel(fds[1]);
        REQUIRE(::write(fds[0], "x", 1) == 1);
        REQUIRE(!socket.complete(20ms));
    }
    SECTION("wrong event") {
        Socket::Request request{};
        request.fd = fds[0];
        request.event = Socket::EventType::read;
        REQUIRE(!socket.send(request));
        REQUIRE(!socket.accept(request));
    }
    ::close(fds[0]);
    ::close(fds[1]);
}
//---------------------------------------------------------------------------
TEST_CASE("connection_manager_listen") {
    ConnectionManager manager(8);
    ConnectionManager::TCPSettings settings;
    auto listenFd = manager.listen("127.0.0.1", 0, settings);
    REQUIRE(listenFd >= 0);
    REQUIRE(manager.getListenFd() == listenFd);
    REQUIRE(manager.getPort() > 0);
    REQUIRE_THROWS_AS(manager.listen("127.0.0.1", 0, settings), runtime_error);

    auto client = connectLocal(manager.getPort());
    auto& socket = manager.getSocketConnection();
    Socket::Request accept{};
    accept.fd = listenFd;
    accept.event = Socket::EventType::accept;
    accept.timeout = 1s;
    REQUIRE(socket.accept(accept));
    socket.submit();
    auto completed = socket.complete(1s);
    REQUIRE(completed == &accept);
    REQUIRE(accept.length >= 0);

    auto fd = static_cast<int32_t>(accept.length);
    manager.accepted(fd, settings);
    REQUIRE(manager.getConnections() == 1);
    manager.disconnect(fd);
    REQUIRE(manager.getConnections() == 0);

    // the peer sees the end of the stream
    char byte;
    REQUIRE(::recv(client, &byte, 1, 0) == 0);
    ::close(client);
}
//---------------------------------------------------------------------------
} // namespace repoblob::network::test
