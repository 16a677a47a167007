#include "network/http_connection.hpp"
#include "network/connection_manager.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <stdexcept>
#include <string>
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
HttpConnection::HttpConnection(int32_t fd, const Router& router, utils::Logger& logger, Limits limits)
    : _fd(fd), _router(router), _logger(logger), _limits(limits), _request(), _receive(), _info(), _reply(), _head(), _chunk(), _sendOffset(0), _bodySent(0), _state(State::Init)
// The constructor
{
    _request.fd = fd;
    _request.connection = this;
    _request.timeout = _limits.timeout;
}
//---------------------------------------------------------------------------
void HttpConnection::reject(Reply reply)
// Prepare an answer without reading the request
{
    _reply = move(reply);
    _reply.response.type = HttpResponse::Type::HTTP_1_1;
    _reply.response.headers["Connection"] = "close";
    _head = HttpResponse::serialize(_reply.response);
    _head->append(reinterpret_cast<const uint8_t*>(_reply.body.data()), _reply.body.size());
    _reply.resource.reset();
}
//---------------------------------------------------------------------------
HttpConnection::State HttpConnection::postReceive()
// Post the receive of more request bytes
{
    // the buffer was reserved up to the receive limit
    auto used = _receive.size();
    _request.data.data = _receive.data() + used;
    _request.length = static_cast<int64_t>(_limits.receiveLimit - used);
    _request.event = Socket::EventType::read;
    return State::Receiving;
}
//---------------------------------------------------------------------------
HttpConnection::State HttpConnection::postSend(const utils::DataVector<uint8_t>& buffer, State state)
// Post the send of the rest of a buffer
{
    _request.data.cdata = buffer.cdata() + _sendOffset;
    _request.length = static_cast<int64_t>(buffer.size() - _sendOffset);
    _request.event = Socket::EventType::write;
    return state;
}
//---------------------------------------------------------------------------
HttpConnection::State HttpConnection::abort(string_view reason)
// Release the body and abort
{
    if (_reply.resource)
        _reply.resource->release();
    _logger.debug("Connection " + to_string(_fd) + " aborted: " + string(reason));
    return State::Aborted;
}
//---------------------------------------------------------------------------
HttpConnection::State HttpConnection::respond(Reply reply, bool headOnly)
// Serialize the reply and start sending it
{
    _reply = move(reply);
    _reply.response.type = HttpResponse::Type::HTTP_1_1;
    _reply.response.headers["Connection"] = "close";
    _head = HttpResponse::serialize(_reply.response);
    if (headOnly) {
        if (_reply.resource)
            _reply.resource->release();
        _reply.resource.reset();
    } else if (!_reply.resource) {
        _head->append(reinterpret_cast<const uint8_t*>(_reply.body.data()), _reply.body.size());
    }
    _sendOffset = 0;
    return postSend(*_head, State::Sending);
}
//---------------------------------------------------------------------------
HttpConnection::State HttpConnection::dispatch()
// Route the request
{
    auto& request = _info->request;
    auto reply = _router.dispatch(request);
    _logger.debug(string(HttpRequest::getRequestMethod(request.method)) + " " + request.path + " " + HttpResponse::getResponseCode(reply.response.code));
    return respond(move(reply), request.method == HttpRequest::Method::HEAD);
}
//---------------------------------------------------------------------------
HttpConnection::State HttpConnection::nextChunk()
// Read the next chunk of the resource
{
    auto& resource = *_reply.resource;
    _chunk.resize(_limits.chunkSize);
    uint64_t read;
    try {
        read = resource.read(_chunk.data(), _chunk.size());
    } catch (const exception& e) {
        _logger.error("Reading " + resource.getFilename() + " failed: " + e.what());
        return abort("read error");
    }
    if (!read) {
        if (_bodySent != resource.contentLength()) {
            _logger.error("Reading " + resource.getFilename() + " ended early after " + to_string(_bodySent) + " bytes");
            return abort("short read");
        }
        resource.release();
        return State::Finished;
    }
    _chunk.resize(read);
    _sendOffset = 0;
    return postSend(_chunk, State::Streaming);
}
//---------------------------------------------------------------------------
HttpConnection::State HttpConnection::execute(ConnectionManager& connectionManager)
// Progress the state machine
{
    auto& socket = connectionManager.getSocketConnection();
    switch (_state) {
        case State::Init: {
            if (_head) {
                _sendOffset = 0;
                _state = postSend(*_head, State::Sending);
            } else {
                _receive.reserve(_limits.receiveLimit);
                _state = postReceive();
            }
            break;
        }
        case State::Receiving: {
            if (_request.length == 0) {
                _state = abort("peer closed");
                return _state;
            }
            if (_request.length < 0) {
                if (_request.length == -EAGAIN || _request.length == -EINTR) {
                    _state = postReceive();
                    break;
                }
                _state = abort(_request.length == -ETIMEDOUT || _request.length == -ECANCELED ? "receive timeout" : "receive error");
                return _state;
            }
            _receive.resize(_receive.size() + static_cast<uint64_t>(_request.length));

            try {
                if (HttpHelper::finished(_receive.data(), _receive.size(), _info)) {
                    _state = dispatch();
                } else if (_receive.size() >= _limits.receiveLimit) {
                    _state = respond(Reply::text(HttpResponse::Code::PAYLOAD_TOO_LARGE_413, "Request exceeds " + to_string(_limits.receiveLimit) + " bytes\n"), false);
                } else {
                    _state = postReceive();
                }
            } catch (const runtime_error& e) {
                _state = respond(Reply::text(HttpResponse::Code::BAD_REQUEST_400, string(e.what()) + "\n"), false);
            }
            break;
        }
        case State::Sending:
        case State::Streaming: {
            if (_request.length < 0) {
                if (_request.length == -EAGAIN || _request.length == -EINTR) {
                    _state = postSend(_state == State::Sending ? *_head : _chunk, _state);
                    break;
                }
                _state = abort(_request.length == -ETIMEDOUT || _request.length == -ECANCELED ? "send timeout" : "send error");
                return _state;
            }
            _sendOffset += static_cast<uint64_t>(_request.length);
            if (_state == State::Streaming)
                _bodySent += static_cast<uint64_t>(_request.length);

            auto& buffer = _state == State::Sending ? *_head : _chunk;
            if (_sendOffset < buffer.size()) {
                _state = postSend(buffer, _state);
                break;
            }
            if (!_reply.resource) {
                _state = State::Finished;
                return _state;
            }
            _state = nextChunk();
            if (_state != State::Streaming)
                return _state;
            break;
        }
        default:
            return _state;
    }

    auto posted = _request.event == Socket::EventType::read ? socket.recv(_request) : socket.send(_request);
    if (!posted)
        _state = abort("could not post socket request");
    return _state;
}
//---------------------------------------------------------------------------
} // namespace repoblob::network
