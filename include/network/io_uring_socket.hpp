#pragma once
#ifndef REPOBLOB_HAS_IO_URING
#error "You must not include io_uring_socket.hpp when building without uring support"
#endif
#include "network/socket.hpp"
#include <unordered_map>
#include <unordered_set>
#include <liburing.h>
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
/// Exchanges messages with the io_uring library for minimizing
/// syscalls and unnecessary kernel overhead
class IOUringSocket : public Socket {
    private:
    /// The uring buffer
    struct io_uring _uring;
    /// The requests canceled before their completion arrived
    std::unordered_set<Request*> _canceled;
    /// The outstanding requests by fd
    std::unordered_map<int32_t, Request*> _outstanding;

    /// Get a submission entry, submits a full queue first
    io_uring_sqe* sqe();
    /// Attach a linked timeout if the request has one
    void linkTimeout(io_uring_sqe* sqe, Request& req);

    public:
    /// The IO Uring Socket Constructor
    explicit IOUringSocket(uint32_t entries);
    /// The destructor
    ~IOUringSocket() noexcept override;

    /// Prepare a submission send
    bool send(Request& req, int32_t msg_flags = 0) override;
    /// Prepare a submission recv
    bool recv(Request& req, int32_t msg_flags = 0) override;
    /// Prepare a submission accept
    bool accept(Request& req) override;

    /// Wait for a completion (cqe) event and mark it as seen; return the SQE attached Request
    [[nodiscard]] Request* complete(std::chrono::milliseconds wait) override;
    /// Submit uring to the kernel and return the number of submitted entries
    int32_t submit() override;
    /// Cancel the outstanding request of the fd
    void cancel(int32_t fd) override;
};
//---------------------------------------------------------------------------
} // namespace repoblob::network
