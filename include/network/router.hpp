#pragma once
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include "storage/bounded_resource.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
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
/// The answer of a handler, the body is either text or a streamed resource
struct Reply {
    /// The response head
    HttpResponse response;
    /// A small in-memory body
    std::string body;
    /// A streamed body, takes precedence over body
    std::unique_ptr<storage::BoundedResource> resource;

    /// Build a text reply
    [[nodiscard]] static Reply text(HttpResponse::Code code, std::string body);
    /// The body length
    [[nodiscard]] uint64_t bodyLength() const { return resource ? resource->contentLength() : body.size(); }
};
//---------------------------------------------------------------------------
/// Maps request paths to handlers.
/// Patterns are '/' separated segments, a segment is a literal or a {name}
/// parameter, the last parameter may carry a literal suffix like {filename}.rpm
class Router {
    public:
    /// The decoded path parameters
    using Parameters = std::map<std::string, std::string>;
    /// The handler
    using Handler = std::function<Reply(const HttpRequest&, const Parameters&)>;

    private:
    /// A pattern segment
    struct Segment {
        /// The literal text or the parameter name
        std::string value;
        /// The literal suffix of a parameter
        std::string suffix;
        /// Is this a parameter
        bool parameter;
    };
    /// A route
    struct Route {
        /// The method
        HttpRequest::Method method;
        /// The pattern
        std::string pattern;
        /// The segments
        std::vector<Segment> segments;
        /// The handler
        Handler handler;
    };
    /// The routes in registration order
    std::vector<Route> _routes;

    /// Split a pattern, throws std::invalid_argument
    [[nodiscard]] static std::vector<Segment> parsePattern(std::string_view pattern);
    /// Match the decoded path segments
    [[nodiscard]] static bool match(const Route& route, const std::vector<std::string>& path, Parameters& parameters);

    public:
    /// Register a route
    void add(HttpRequest::Method method, std::string_view pattern, Handler handler);
    /// Split a raw path into decoded segments, throws std::runtime_error on malformed escapes
    [[nodiscard]] static std::vector<std::string> splitPath(std::string_view path);
    /// Dispatch the request, unknown paths are 404, known paths with other methods 405.
    /// HEAD falls back to the GET route.
    [[nodiscard]] Reply dispatch(const HttpRequest& request) const;
};
//---------------------------------------------------------------------------
} // namespace repoblob::network
