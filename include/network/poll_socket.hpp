#pragma once
#include "network/socket.hpp"
#include <chrono>
#include <unordered_map>
#include <vector>
#include <sys/poll.h>
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
/// Exchanges messages with the old poll interface acting as a fallback.
/// It matches the IOUringSocket behavior, one outstanding request per fd.
class PollSocket : public Socket {
    private:
    /// The request infos with timeout and message flags
    struct RequestInfo {
        /// The real request
        Request* request;
        /// The deadline
        std::chrono::time_point<std::chrono::steady_clock> timeout;
        /// The flags
        int32_t flags;
    };
    /// The ready request vector
    std::vector<Request*> _ready;
    /// The fd to request mapping
    std::unordered_map<int, RequestInfo> _fdToRequest;
    /// The pollfd vector
    std::vector<pollfd> _pollfds;
    /// The submitted requests since last invocation
    int32_t _submitted = 0;

    /// Enqueue the fd into our submission queue
    void enqueue(int fd, short events, RequestInfo req);
    /// Run the operation of a ready request, false if it would still block
    static bool perform(RequestInfo& info);

    public:
    /// The destructor
    ~PollSocket() noexcept override = default;

    /// Prepare a submission send
    bool send(Request& req, int32_t msg_flags = 0) override;
    /// Prepare a submission recv
    bool recv(Request& req, int32_t msg_flags = 0) override;
    /// Prepare a submission accept
    bool accept(Request& req) override;

    /// Wait for a completion event
    [[nodiscard]] Request* complete(std::chrono::milliseconds wait) override;
    /// Submit the requests
    int32_t submit() override;
    /// Drop the outstanding request of the fd
    void cancel(int32_t fd) override;
};
//---------------------------------------------------------------------------
} // namespace repoblob::network
