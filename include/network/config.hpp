#pragma once
#include "utils/logger.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
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
/// Config of the delivery server
struct Config {
    /// The listen address
    struct Listen {
        /// The host or ip address
        std::string host;
        /// The port, 0 picks an ephemeral port
        uint16_t port;
    };
    /// Looks up environment variables, nullptr if unset
    using Lookup = std::function<const char*(const char*)>;

    /// Default body chunk size, bounds the memory per connection
    static constexpr uint32_t defaultChunkSize = 64u << 10;
    /// Default maximum request head size
    static constexpr uint32_t defaultReceiveLimit = 16u << 10;
    /// Default concurrent connections
    static constexpr unsigned defaultMaxConnections = 1024;

    /// The listen address
    Listen listen = {.host = "0.0.0.0", .port = 8080};
    /// The store uri
    std::string store = "memory://";
    /// The body chunk size
    uint32_t chunkSize = defaultChunkSize;
    /// The maximum request size
    uint32_t receiveLimit = defaultReceiveLimit;
    /// The maximum concurrent connections, further connections get 503
    unsigned maxConnections = defaultMaxConnections;
    /// The per operation socket timeout
    std::chrono::milliseconds timeout = std::chrono::seconds(30);
    /// The io_uring queue entries
    unsigned uringEntries = 256;
    /// The log level
    utils::Logger::Level logLevel = utils::Logger::Level::Info;

    /// Parse a listen uri http://host:port
    [[nodiscard]] static Listen parseListen(std::string_view uri);
    /// Read the REPOBLOB_* variables, throws std::runtime_error on invalid values
    [[nodiscard]] static Config fromEnvironment(const Lookup& lookup = nullptr);
};
//---------------------------------------------------------------------------
} // namespace repoblob::network
