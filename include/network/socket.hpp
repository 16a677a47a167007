#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#ifdef REPOBLOB_HAS_IO_URING
#include <liburing.h>
#endif
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
class HttpConnection;
//---------------------------------------------------------------------------
/// This is the interface for the completion based socket backends.
/// A request stays owned by its submitter until it is returned by complete;
/// the result is stored in length, negative values are -errno.
class Socket {
    public:
    /// Request message event type
    enum class EventType : uint8_t {
        read = 0,
        write = 1,
        accept = 2
    };

    /// The request message
    struct Request {
        union Data {
            /// The recv data
            uint8_t* data;
            /// The send data
            const uint8_t* cdata;
        };
        /// The data
        Data data;
        /// The length, the result after completion
        int64_t length;
        /// The file descriptor
        int32_t fd;
        /// Specifies the event
        EventType event;
        /// The associated connection, nullptr for the listener
        HttpConnection* connection;
        /// The timeout of the operation
        std::optional<std::chrono::milliseconds> timeout;
#ifdef REPOBLOB_HAS_IO_URING
        /// The kernel async interface timeout
        __kernel_timespec kernelTimeout = {.tv_sec = 0, .tv_nsec = 0};
#endif
    };

    public:
    /// The destructor
    virtual ~Socket() noexcept = default;
    /// Prepare a submission send
    virtual bool send(Request& req, int32_t msg_flags = 0) = 0;
    /// Prepare a submission recv
    virtual bool recv(Request& req, int32_t msg_flags = 0) = 0;
    /// Prepare a submission accept, the result is the accepted fd
    virtual bool accept(Request& req) = 0;

    /// Wait up to wait for a completion event and mark it as seen; nullptr if none arrived
    [[nodiscard]] virtual Request* complete(std::chrono::milliseconds wait) = 0;
    /// Submit the requests to the kernel
    virtual int32_t submit() = 0;
    /// Drop the outstanding request of a file descriptor before it is closed
    virtual void cancel(int32_t fd) = 0;
};
//---------------------------------------------------------------------------
} // namespace repoblob::network
