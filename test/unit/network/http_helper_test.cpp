#include "network/http_helper.hpp"
#include <catch2/catch.hpp>
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
namespace repoblob::network::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static const uint8_t* bytes(const string& s)
// Reinterpret the characters
{
    return reinterpret_cast<const uint8_t*>(s.data());
}
//---------------------------------------------------------------------------
TEST_CASE("http_helper") {
    unique_ptr<HttpHelper::Info> info;

    SECTION("incremental head") {
        string request = "GET /repo/updates/x86_64/foo-1.0.rpm HTTP/1.1\r\nRange: bytes=0-99\r\n";
        REQUIRE(!HttpHelper::finished(bytes(request), request.size(), info));
        REQUIRE(!info);
        request += "\r\n";
        REQUIRE(HttpHelper::finished(bytes(request), request.size(), info));
        REQUIRE(info);
        REQUIRE(info->headerLength == request.size());
        REQUIRE(info->length == 0);
        REQUIRE(info->encoding == HttpHelper::Encoding::ContentLength);
        REQUIRE(*info->request.getHeader("Range") == "bytes=0-99");
    }
    SECTION("body") {
        string request = "PUT /repo/a/b/c.rpm HTTP/1.1\r\nContent-Length: 5\r\n\r\nab";
        REQUIRE(!HttpHelper::finished(bytes(request), request.size(), info));
        REQUIRE(info->length == 5);
        request += "cde";
        REQUIRE(HttpHelper::finished(bytes(request), request.size(), info));
        REQUIRE(HttpHelper::retrieveContent(bytes(request), request.size(), *info) == "abcde");
    }
    SECTION("chunked") {
        string request = "POST /repo HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n";
        REQUIRE_THROWS_AS(HttpHelper::finished(bytes(request), request.size(), info), runtime_error);
    }
    SECTION("invalid length") {
        string request = "PUT /repo HTTP/1.1\r\nContent-Length: ten\r\n\r\n";
        REQUIRE_THROWS_AS(HttpHelper::finished(bytes(request), request.size(), info), runtime_error);
    }
}
//---------------------------------------------------------------------------
} // namespace repoblob::network::test
