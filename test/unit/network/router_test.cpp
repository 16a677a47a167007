#include "network/router.hpp"
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
using namespace std;
//---------------------------------------------------------------------------
static HttpRequest makeRequest(HttpRequest::Method method, string path)
// Build a request
{
    HttpRequest request;
    request.method = method;
    request.path = move(path);
    return request;
}
//---------------------------------------------------------------------------
TEST_CASE("router") {
    Router router;
    Router::Parameters captured;
    string handled;
    router.add(HttpRequest::Method::GET, "/repo/{repo}/{arch}/{filename}", [&](const HttpRequest&, const Router::Parameters& parameters) {
        handled = "get";
        captured = parameters;
        return Reply::text(HttpResponse::Code::OK_200, "get\n");
    });
    router.add(HttpRequest::Method::DELETE, "/repo/{repoName}/{arch}/{filename}.rpm", [&](const HttpRequest&, const Router::Parameters& parameters) {
        handled = "delete";
        captured = parameters;
        return Reply::text(HttpResponse::Code::NO_CONTENT_204, "");
    });

    SECTION("parameters") {
        auto reply = router.dispatch(makeRequest(HttpRequest::Method::GET, "/repo/updates/x86_64/foo-1.0.rpm"));
        REQUIRE(reply.response.code == HttpResponse::Code::OK_200);
        REQUIRE(handled == "get");
        REQUIRE(captured.at("repo") == "updates");
        REQUIRE(captured.at("arch") == "x86_64");
        REQUIRE(captured.at("filename") == "foo-1.0.rpm");
    }
    SECTION("decoded segments") {
        (void) router.dispatch(makeRequest(HttpRequest::Method::GET, "/repo/updates/x86_64/foo%2B1.0.rpm"));
        REQUIRE(captured.at("filename") == "foo+1.0.rpm");
    }
    SECTION("suffix") {
        auto reply = router.dispatch(makeRequest(HttpRequest::Method::DELETE, "/repo/updates/x86_64/foo-1.0.rpm"));
        REQUIRE(reply.response.code == HttpResponse::Code::NO_CONTENT_204);
        REQUIRE(captured.at("repoName") == "updates");
        REQUIRE(captured.at("filename") == "foo-1.0");
    }
    SECTION("method not allowed") {
        auto reply = router.dispatch(makeRequest(HttpRequest::Method::DELETE, "/repo/updates/x86_64/repomd.xml"));
        REQUIRE(reply.response.code == HttpResponse::Code::METHOD_NOT_ALLOWED_405);
        REQUIRE(*reply.response.getHeader("Allow") == "GET");
        REQUIRE(handled.empty());

        reply = router.dispatch(makeRequest(HttpRequest::Method::PUT, "/repo/updates/x86_64/foo-1.0.rpm"));
        REQUIRE(reply.response.code == HttpResponse::Code::METHOD_NOT_ALLOWED_405);
        REQUIRE(*reply.response.getHeader("Allow") == "GET, DELETE");
    }
    SECTION("head falls back to get") {
        auto reply = router.dispatch(makeRequest(HttpRequest::Method::HEAD, "/repo/updates/x86_64/foo-1.0.rpm"));
        REQUIRE(reply.response.code == HttpResponse::Code::OK_200);
        REQUIRE(handled == "get");
    }
    SECTION("not found") {
        REQUIRE(router.dispatch(makeRequest(HttpRequest::Method::GET, "/repo/updates/foo-1.0.rpm")).response.code == HttpResponse::Code::NOT_FOUND_404);
        REQUIRE(router.dispatch(makeRequest(HttpRequest::Method::GET, "/other/updates/x86_64/foo-1.0.rpm")).response.code == HttpResponse::Code::NOT_FOUND_404);
        REQUIRE(router.dispatch(makeRequest(HttpRequest::Method::DELETE, "/repo/updates/x86_64/.rpm")).response.code == HttpResponse::Code::METHOD_NOT_ALLOWED_405);
    }
    SECTION("bad escape") {
        auto reply = router.dispatch(makeRequest(HttpRequest::Method::GET, "/repo/updates/x86_64/foo%zz"));
        REQUIRE(reply.response.code == HttpResponse::Code::BAD_REQUEST_400);
        REQUIRE(reply.bodyLength() == reply.body.size());
        REQUIRE(*reply.response.getHeader("Content-Length") == to_string(reply.body.size()));
    }
}
//---------------------------------------------------------------------------
TEST_CASE("router_patterns") {
    Router router;
    auto handler = [](const HttpRequest&, const Router::Parameters&) { return Reply(); };
    REQUIRE_THROWS_AS(router.add(HttpRequest::Method::GET, "repo/{repo}", handler), invalid_argument);
    REQUIRE_THROWS_AS(router.add(HttpRequest::Method::GET, "/repo//{repo}", handler), invalid_argument);
    REQUIRE_THROWS_AS(router.add(HttpRequest::Method::GET, "/repo/{repo", handler), invalid_argument);
    REQUIRE_THROWS_AS(router.add(HttpRequest::Method::GET, "/repo/{}", handler), invalid_argument);
    REQUIRE_THROWS_AS(router.add(HttpRequest::Method::GET, "/repo/{repo}.d/{file}", handler), invalid_argument);
    REQUIRE_NOTHROW(router.add(HttpRequest::Method::GET, "/repo/{repo}/{file}.rpm", handler));

    auto segments = Router::splitPath("/repo/a%20b/c");
    REQUIRE(segments.size() == 3);
    REQUIRE(segments[1] == "a b");
}
//---------------------------------------------------------------------------
} // namespace repoblob::network::test
