#ifdef REPOBLOB_HAS_IO_URING
#include "network/io_uring_socket.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
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
IOUringSocket::IOUringSocket(uint32_t entries)
// Constructor that inits uring queue
{
    struct io_uring_params params;
    memset(&params, 0, sizeof(params));

    if (io_uring_queue_init_params(entries, &_uring, &params) < 0)
        throw runtime_error("Uring init error!");

    if (!(params.features & IORING_FEAT_FAST_POLL)) {
        io_uring_queue_exit(&_uring);
        throw runtime_error("Uring init error - IORING_FEAT_FAST_POLL not available in the kernel!");
    }
}
//---------------------------------------------------------------------------
io_uring_sqe* IOUringSocket::sqe()
// Get a submission entry
{
    auto entry = io_uring_get_sqe(&_uring);
    if (!entry) {
        io_uring_submit(&_uring);
        entry = io_uring_get_sqe(&_uring);
        if (!entry)
            throw runtime_error("Uring submission queue full!");
    }
    return entry;
}
//---------------------------------------------------------------------------
void IOUringSocket::linkTimeout(io_uring_sqe* entry, Request& req)
// Attach a linked timeout
{
    _outstanding[req.fd] = &req;
    if (!req.timeout)
        return;
    auto ms = req.timeout->count();
    req.kernelTimeout.tv_sec = ms / 1000;
    req.kernelTimeout.tv_nsec = (ms % 1000) * 1000 * 1000;
    entry->flags |= IOSQE_IO_LINK;
    auto timeoutEntry = sqe();
    io_uring_prep_link_timeout(timeoutEntry, &req.kernelTimeout, 0);
    io_uring_sqe_set_data(timeoutEntry, nullptr);
}
//---------------------------------------------------------------------------
bool IOUringSocket::send(Request& req, int32_t msg_flags)
// Prepare a submission (sqe) send
{
    if (req.event != EventType::write || req.length <= 0) return false;
    auto entry = sqe();
    io_uring_prep_send(entry, req.fd, req.data.cdata, static_cast<size_t>(req.length), msg_flags | MSG_NOSIGNAL);
    io_uring_sqe_set_data(entry, &req);
    linkTimeout(entry, req);
    return true;
}
//---------------------------------------------------------------------------
bool IOUringSocket::recv(Request& req, int32_t msg_flags)
// Prepare a submission (sqe) recv
{
    if (req.event != EventType::read || req.length <= 0) return false;
    auto entry = sqe();
    io_uring_prep_recv(entry, req.fd, req.data.data, static_cast<size_t>(req.length), msg_flags);
    io_uring_sqe_set_data(entry, &req);
    linkTimeout(entry, req);
    return true;
}
//---------------------------------------------------------------------------
bool IOUringSocket::accept(Request& req)
// Prepare a submission (sqe) accept
{
    if (req.event != EventType::accept) return false;
    auto entry = sqe();
    io_uring_prep_accept(entry, req.fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    io_uring_sqe_set_data(entry, &req);
    linkTimeout(entry, req);
    return true;
}
//---------------------------------------------------------------------------
IOUringSocket::Request* IOUringSocket::complete(chrono::milliseconds wait)
// Wait for a completion (cqe) event and mark it as seen; return the SQE attached Request
{
    auto ms = wait.count();
    __kernel_timespec timeout = {.tv_sec = ms / 1000, .tv_nsec = (ms % 1000) * 1000 * 1000};
    while (true) {
        io_uring_cqe* cqe;
        auto res = io_uring_wait_cqe_timeout(&_uring, &cqe, &timeout);
        if (res == -ETIME || res == -EINTR)
            return nullptr;
        if (res < 0)
            throw runtime_error("io_uring_wait_cqe error! " + string(strerror(-res)));

        auto req = static_cast<Request*>(io_uring_cqe_get_data(cqe));
        auto result = cqe->res;
        io_uring_cqe_seen(&_uring, cqe);
        // Linked timeouts and canceled requests complete without a consumer
        if (!req || _canceled.erase(req))
            continue;
        if (auto it = _outstanding.find(req->fd); it != _outstanding.end() && it->second == req)
            _outstanding.erase(it);
        req->length = result;
        return req;
    }
}
//---------------------------------------------------------------------------
int32_t IOUringSocket::submit()
// Submit uring to the kernel and return the number of submitted entries
{
    return io_uring_submit(&_uring);
}
//---------------------------------------------------------------------------
void IOUringSocket::cancel(int32_t fd)
// Cancel the outstanding request, its completion is dropped
{
    auto it = _outstanding.find(fd);
    if (it == _outstanding.end())
        return;
    auto entry = sqe();
    io_uring_prep_cancel(entry, it->second, 0);
    io_uring_sqe_set_data(entry, nullptr);
    _canceled.insert(it->second);
    _outstanding.erase(it);
    io_uring_submit(&_uring);
}
//---------------------------------------------------------------------------
IOUringSocket::~IOUringSocket() noexcept
// The destructor
{
    io_uring_queue_exit(&_uring);
}
//---------------------------------------------------------------------------
} // namespace repoblob::network
#endif
