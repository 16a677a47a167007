#include "network/http_response.hpp"
#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
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
TEST_CASE("http_response") {
    HttpResponse response;
    response.code = HttpResponse::Code::PARTIAL_CONTENT_206;
    response.headers.emplace("Content-Range", "bytes 0-99/1000");
    response.headers.emplace("Content-Length", "100");

    auto head = HttpResponse::serialize(response);
    REQUIRE(head->view() == "HTTP/1.1 206 Partial Content\r\nContent-Length: 100\r\nContent-Range: bytes 0-99/1000\r\n\r\n");

    auto parsed = HttpResponse::deserialize(head->view());
    REQUIRE(parsed.code == HttpResponse::Code::PARTIAL_CONTENT_206);
    REQUIRE(*parsed.getHeader("content-range") == "bytes 0-99/1000");
    REQUIRE(HttpResponse::checkSuccess(parsed.code));
}
//---------------------------------------------------------------------------
TEST_CASE("http_response_header_injection") {
    HttpResponse response;
    response.headers.emplace("Content-Disposition", "attachment; filename=a\r\nSet-Cookie: x=1.rpm");
    REQUIRE_THROWS_AS(HttpResponse::serialize(response), std::runtime_error);

    response.headers.clear();
    response.headers.emplace("X-Split\nSet-Cookie", "x=1");
    REQUIRE_THROWS_AS(HttpResponse::serialize(response), std::runtime_error);
}
//---------------------------------------------------------------------------
TEST_CASE("http_response_codes") {
    REQUIRE(HttpResponse::deserialize("HTTP/1.1 416 Range Not Satisfiable\r\n\r\n").code == HttpResponse::Code::RANGE_NOT_SATISFIABLE_416);
    REQUIRE(HttpResponse::deserialize("HTTP/1.0 503 Service Unavailable\r\n\r\n").type == HttpResponse::Type::HTTP_1_0);
    REQUIRE(HttpResponse::deserialize("HTTP/1.1 418 I'm a teapot\r\n\r\n").code == HttpResponse::Code::UNKNOWN);
    REQUIRE(HttpResponse::withoutContent(HttpResponse::Code::NO_CONTENT_204));
    REQUIRE(!HttpResponse::checkSuccess(HttpResponse::Code::NOT_FOUND_404));
    REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 200 OK\r\n"), std::runtime_error);
    REQUIRE_THROWS_AS(HttpResponse::deserialize("SPDY 200 OK\r\n\r\n"), std::runtime_error);
}
//---------------------------------------------------------------------------
} // namespace repoblob::network::test
