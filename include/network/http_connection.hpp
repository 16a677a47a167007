#pragma once
#include "network/http_helper.hpp"
#include "network/router.hpp"
#include "network/socket.hpp"
#include "utils/data_vector.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
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
class ConnectionManager;
//---------------------------------------------------------------------------
/// Implements one request response roundtrip on an accepted socket.
/// After each execute invocation a new request was added to the socket queue
/// unless the connection is Finished or Aborted.
class HttpConnection {
    public:
    /// The connection state
    enum class State : uint8_t {
        Init,
        Receiving,
        Sending,
        Streaming,
        Finished,
        Aborted
    };
    /// The connection limits
    struct Limits {
        /// The body chunk size
        uint32_t chunkSize;
        /// The maximum request size
        uint32_t receiveLimit;
        /// The timeout of a single socket operation
        std::chrono::milliseconds timeout;
    };

    private:
    /// The socket
    int32_t _fd;
    /// The router
    const Router& _router;
    /// The logger
    utils::Logger& _logger;
    /// The limits
    Limits _limits;
    /// The outstanding socket request
    Socket::Request _request;
    /// The receive buffer
    utils::DataVector<uint8_t> _receive;
    /// The detected request
    std::unique_ptr<HttpHelper::Info> _info;
    /// The reply
    Reply _reply;
    /// The serialized head, followed by a text body
    std::unique_ptr<utils::DataVector<uint8_t>> _head;
    /// The current body chunk
    utils::DataVector<uint8_t> _chunk;
    /// The offset in the buffer that is sent
    uint64_t _sendOffset;
    /// The body bytes sent
    uint64_t _bodySent;
    /// The state
    State _state;

    /// Serialize the reply and start sending it
    State respond(Reply reply, bool headOnly);
    /// Post the send of the rest of a buffer
    State postSend(const utils::DataVector<uint8_t>& buffer, State state);
    /// Post the receive of more request bytes
    State postReceive();
    /// Read the next chunk of the resource and send it
    State nextChunk();
    /// Release the body and abort
    State abort(std::string_view reason);
    /// Handle a received request
    State dispatch();

    public:
    /// The constructor
    HttpConnection(int32_t fd, const Router& router, utils::Logger& logger, Limits limits);

    /// Answer without reading the request, used when overloaded
    void reject(Reply reply);
    /// Progress after the completion of the outstanding request
    State execute(ConnectionManager& connectionManager);

    /// Get the socket
    [[nodiscard]] int32_t getFd() const { return _fd; }
    /// Get the state
    [[nodiscard]] State getState() const { return _state; }
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace repoblob
