#include "network/http_helper.hpp"
#include <charconv>
#include <stdexcept>
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
namespace repoblob {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header)
// Detect the protocol
{
    static constexpr string_view transferEncoding = "Transfer-Encoding";
    static constexpr string_view contentLength = "Content-Length";
    static constexpr string_view headerEnd = "\r\n\r\n";

    Info info;
    info.request = HttpRequest::deserialize(header);
    info.headerLength = static_cast<uint32_t>(header.find(headerEnd) + headerEnd.size());

    if (info.request.getHeader(transferEncoding)) {
        info.encoding = Encoding::ChunkedEncoding;
        throw runtime_error("Unsupported HTTP transfer protocol");
    }
    info.encoding = Encoding::ContentLength;
    if (auto value = info.request.getHeader(contentLength)) {
        auto [ptr, ec] = from_chars(value->data(), value->data() + value->size(), info.length);
        if (ec != errc() || ptr != value->data() + value->size())
            throw runtime_error("Invalid HttpRequest: Content-Length " + *value + "!");
    }
    return info;
}
//---------------------------------------------------------------------------
string_view HttpHelper::retrieveContent(const uint8_t* data, uint64_t length, const Info& info)
// Retrieve the body
{
    if (length < info.headerLength + info.length)
        throw runtime_error("Incomplete HTTP request body");
    return string_view(reinterpret_cast<const char*>(data) + info.headerLength, info.length);
}
//---------------------------------------------------------------------------
bool HttpHelper::finished(const uint8_t* data, uint64_t length, unique_ptr<Info>& info)
// Detect end / content
{
    if (!info) {
        string_view sv(reinterpret_cast<const char*>(data), length);
        if (sv.find("\r\n\r\n"sv) == sv.npos)
            return false;
        info = make_unique<Info>(detect(sv));
    }
    return length >= info->headerLength + info->length;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace repoblob
