#include "network/server.hpp"
#include "network/http_connection.hpp"
#include "network/router.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
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
DeliveryServer::DeliveryServer(Config config, const Router& router, utils::Logger& logger)
    : _config(move(config)), _router(router), _logger(logger), _tcpSettings(), _connectionManager(_config.uringEntries), _acceptRequest(), _connections(), _stopped(false)
// The constructor
{
    _tcpSettings.timeout = _config.timeout;
    auto fd = _connectionManager.listen(_config.listen.host, _config.listen.port, _tcpSettings);
    _acceptRequest.fd = fd;
    _acceptRequest.event = Socket::EventType::accept;
    _acceptRequest.connection = nullptr;
    _logger.info("Listening on http://" + _config.listen.host + ":" + to_string(getPort()));
}
//---------------------------------------------------------------------------
DeliveryServer::~DeliveryServer()
// The destructor
{
    while (!_connections.empty())
        close(_connections.begin()->first);
}
//---------------------------------------------------------------------------
void DeliveryServer::close(int32_t fd)
// Close a connection, releases its resource
{
    _connectionManager.disconnect(fd);
    _connections.erase(fd);
}
//---------------------------------------------------------------------------
void DeliveryServer::progress(HttpConnection& connection)
// Progress a connection
{
    auto state = connection.execute(_connectionManager);
    if (state == HttpConnection::State::Finished || state == HttpConnection::State::Aborted)
        close(connection.getFd());
}
//---------------------------------------------------------------------------
void DeliveryServer::accepted(int64_t result)
// Handle a completed accept
{
    if (result < 0) {
        if (result != -EAGAIN && result != -EINTR && result != -ECONNABORTED)
            _logger.warning("Accept error: " + string(strerror(static_cast<int>(-result))));
        return;
    }

    auto fd = static_cast<int32_t>(result);
    try {
        _connectionManager.accepted(fd, _tcpSettings);
    } catch (const runtime_error& e) {
        _logger.warning(e.what());
        _connectionManager.disconnect(fd);
        return;
    }

    HttpConnection::Limits limits{.chunkSize = _config.chunkSize, .receiveLimit = _config.receiveLimit, .timeout = _config.timeout};
    auto connection = make_unique<HttpConnection>(fd, _router, _logger, limits);
    if (_connections.size() >= _config.maxConnections) {
        _logger.warning("Rejecting connection, " + to_string(_connections.size()) + " connections open");
        connection->reject(Reply::text(HttpResponse::Code::SERVICE_UNAVAILABLE_503, "Too many connections\n"));
    }
    auto& ref = *connection;
    _connections.emplace(fd, move(connection));
    progress(ref);
}
//---------------------------------------------------------------------------
void DeliveryServer::run()
// Run the loop until stop is called
{
    auto& socket = _connectionManager.getSocketConnection();
    if (!socket.accept(_acceptRequest))
        throw runtime_error("Could not post accept!");

    while (!_stopped) {
        socket.submit();
        auto request = socket.complete(chrono::milliseconds(100));
        if (!request)
            continue;

        if (request->event == Socket::EventType::accept) {
            accepted(request->length);
            if (!socket.accept(_acceptRequest))
                throw runtime_error("Could not post accept!");
            continue;
        }
        progress(*request->connection);
    }

    socket.cancel(_acceptRequest.fd);
    while (!_connections.empty())
        close(_connections.begin()->first);
    _logger.info("Stopped serving on port " + to_string(getPort()));
}
//---------------------------------------------------------------------------
} // namespace repoblob::network
