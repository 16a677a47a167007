#include "network/poll_socket.hpp"
#include <algorithm>
#include <cerrno>
#include <stdexcept>
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
namespace repoblob::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// The deadline of a request
chrono::time_point<chrono::steady_clock> deadline(const Socket::Request& req)
{
    return req.timeout.has_value() ? chrono::steady_clock::now() + *req.timeout : chrono::time_point<chrono::steady_clock>::max();
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
bool PollSocket::send(Request& req, int32_t msg_flags)
// Prepare a submission send
{
    if (req.event != EventType::write) return false;
    enqueue(req.fd, POLLOUT, RequestInfo{.request = &req, .timeout = deadline(req), .flags = msg_flags});
    return true;
}
//---------------------------------------------------------------------------
bool PollSocket::recv(Request& req, int32_t msg_flags)
// Prepare a submission recv
{
    if (req.event != EventType::read) return false;
    enqueue(req.fd, POLLIN, RequestInfo{.request = &req, .timeout = deadline(req), .flags = msg_flags});
    return true;
}
//---------------------------------------------------------------------------
bool PollSocket::accept(Request& req)
// Prepare a submission accept
{
    if (req.event != EventType::accept) return false;
    enqueue(req.fd, POLLIN, RequestInfo{.request = &req, .timeout = deadline(req), .flags = 0});
    return true;
}
//---------------------------------------------------------------------------
bool PollSocket::perform(RequestInfo& info)
// Run the operation of a ready request, false if it would still block
{
    auto& req = *info.request;
    auto requested = req.length;
    switch (req.event) {
        case EventType::read:
            req.length = ::recv(req.fd, req.data.data, static_cast<size_t>(req.length), info.flags | MSG_DONTWAIT);
            break;
        case EventType::write:
            req.length = ::send(req.fd, req.data.cdata, static_cast<size_t>(req.length), info.flags | MSG_DONTWAIT | MSG_NOSIGNAL);
            break;
        case EventType::accept:
            req.length = ::accept4(req.fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            break;
    }
    // Simulate io uring by returning -errno
    if (req.length == -1)
        req.length = -errno;
    if (req.length == -EAGAIN || req.length == -EWOULDBLOCK) {
        req.length = requested;
        return false;
    }
    return true;
}
//---------------------------------------------------------------------------
PollSocket::Request* PollSocket::complete(chrono::milliseconds wait)
// Get a completion event and mark it as seen; return the Request
{
    auto end = chrono::steady_clock::now() + wait;
    while (_ready.empty()) {
        auto now = chrono::steady_clock::now();
        if (_pollfds.empty()) {
            if (now >= end)
                return nullptr;
            // Nothing outstanding, wait for the caller's budget
            ::poll(nullptr, 0, static_cast<int>(chrono::duration_cast<chrono::milliseconds>(end - now).count()));
            return nullptr;
        }

        auto budget = now >= end ? 0 : chrono::duration_cast<chrono::milliseconds>(end - now).count();
        auto readyFds = ::poll(_pollfds.data(), _pollfds.size(), static_cast<int>(min<int64_t>(budget, 10)));
        if (readyFds < 0 && errno != EINTR)
            throw runtime_error("Poll error!");

        // Check for completed events
        auto currentTime = chrono::steady_clock::now();
        for (auto pit = _pollfds.begin(); pit != _pollfds.end();) {
            auto it = _fdToRequest.find(pit->fd);
            if (it == _fdToRequest.end())
                throw runtime_error("couldn't find request");
            auto& req = it->second;
            if (readyFds > 0 && (pit->revents & (POLLIN | POLLOUT))) {
                // A spurious wakeup keeps waiting
                if (!perform(req)) {
                    ++pit;
                    continue;
                }
            } else if (readyFds > 0 && (pit->revents & (POLLERR | POLLHUP | POLLNVAL))) {
                // Simulate io uring by returning -error
                int err = 0;
                socklen_t len = sizeof(err);
                if (::getsockopt(it->first, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err) {
                    req.request->length = -err;
                } else if (pit->revents & POLLHUP && req.request->event == EventType::read) {
                    req.request->length = 0;
                } else {
                    req.request->length = -EPIPE;
                }
            } else if (req.timeout < currentTime) {
                // Implement timeout
                req.request->length = -ETIMEDOUT;
            } else {
                ++pit;
                continue;
            }
            _ready.push_back(req.request);
            _fdToRequest.erase(it);
            pit = _pollfds.erase(pit);
        }
        if (_ready.empty() && chrono::steady_clock::now() >= end)
            return nullptr;
    }
    auto req = _ready.back();
    _ready.pop_back();
    return req;
}
//---------------------------------------------------------------------------
void PollSocket::enqueue(int fd, short events, RequestInfo req)
// Implement the fd into our submission queue
{
    if (!_fdToRequest.emplace(fd, req).second)
        throw runtime_error("Poll error! fd " + to_string(fd) + " has an outstanding request.");
    _pollfds.push_back(pollfd{.fd = fd, .events = events, .revents = 0});
    ++_submitted;
}
//---------------------------------------------------------------------------
int32_t PollSocket::submit()
// Submit requests
{
    auto sub = _submitted;
    _submitted = 0;
    return sub;
}
//---------------------------------------------------------------------------
void PollSocket::cancel(int32_t fd)
// Drop the outstanding request of the fd
{
    if (_fdToRequest.erase(fd))
        erase_if(_pollfds, [fd](const pollfd& p) { return p.fd == fd; });
    erase_if(_ready, [fd](const Request* r) { return r->fd == fd; });
}
//---------------------------------------------------------------------------
} // namespace repoblob::network
