#pragma once
#include "network/http_request.hpp"
#include <cstdint>
#include <memory>
#include <string_view>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob {
namespace network {
//---------------------------------------------------------------------------
/// Implements an helper to detect complete http requests in a receive buffer
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        Unknown,
        ContentLength,
        ChunkedEncoding
    };

    struct Info {
        /// The request header
        HttpRequest request;
        /// The body length
        uint64_t length = 0;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::Unknown;
    };

    private:
    /// Detect the protocol of a complete header
    [[nodiscard]] static Info detect(std::string_view header);

    public:
    /// Retrieve the body of a finished request
    [[nodiscard]] static std::string_view retrieveContent(const uint8_t* data, uint64_t length, const Info& info);
    /// Detect the end of the request, throws on invalid requests
    [[nodiscard]] static bool finished(const uint8_t* data, uint64_t length, std::unique_ptr<Info>& info);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace repoblob
