#include "network/router.hpp"
#include "utils/utils.hpp"
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
Reply Reply::text(HttpResponse::Code code, string body)
// Build a text reply
{
    Reply reply;
    reply.response.code = code;
    reply.response.headers.emplace("Content-Type", "text/plain");
    reply.response.headers.emplace("Content-Length", to_string(body.size()));
    reply.body = move(body);
    return reply;
}
//---------------------------------------------------------------------------
vector<Router::Segment> Router::parsePattern(string_view pattern)
// Split a pattern
{
    if (!pattern.starts_with('/'))
        throw invalid_argument("Invalid route pattern: " + string(pattern) + " needs to start with '/'!");

    vector<Segment> segments;
    pattern.remove_prefix(1);
    while (true) {
        auto pos = pattern.find('/');
        auto segment = pattern.substr(0, pos);
        if (segment.empty())
            throw invalid_argument("Invalid route pattern: empty segment!");

        if (segment.starts_with('{')) {
            auto close = segment.find('}');
            if (close == segment.npos || close == 1)
                throw invalid_argument("Invalid route pattern: unterminated parameter " + string(segment) + "!");
            auto suffix = segment.substr(close + 1);
            if (suffix.find_first_of("{}") != suffix.npos)
                throw invalid_argument("Invalid route pattern: " + string(segment) + "!");
            segments.push_back(Segment{.value = string(segment.substr(1, close - 1)), .suffix = string(suffix), .parameter = true});
        } else {
            if (segment.find_first_of("{}") != segment.npos)
                throw invalid_argument("Invalid route pattern: " + string(segment) + "!");
            segments.push_back(Segment{.value = string(segment), .suffix = {}, .parameter = false});
        }

        if (pos == pattern.npos)
            break;
        pattern.remove_prefix(pos + 1);
    }
    for (auto i = 0u; i + 1 < segments.size(); i++)
        if (!segments[i].suffix.empty())
            throw invalid_argument("Invalid route pattern: only the last parameter may carry a suffix!");
    return segments;
}
//---------------------------------------------------------------------------
void Router::add(HttpRequest::Method method, string_view pattern, Handler handler)
// Register a route
{
    _routes.push_back(Route{.method = method, .pattern = string(pattern), .segments = parsePattern(pattern), .handler = move(handler)});
}
//---------------------------------------------------------------------------
vector<string> Router::splitPath(string_view path)
// Split and decode
{
    vector<string> segments;
    if (!path.starts_with('/'))
        return segments;
    path.remove_prefix(1);
    while (true) {
        auto pos = path.find('/');
        segments.push_back(utils::decodeUrlParameters(path.substr(0, pos)));
        if (pos == path.npos)
            break;
        path.remove_prefix(pos + 1);
    }
    return segments;
}
//---------------------------------------------------------------------------
bool Router::match(const Route& route, const vector<string>& path, Parameters& parameters)
// Match the decoded segments
{
    if (route.segments.size() != path.size())
        return false;
    parameters.clear();
    for (auto i = 0u; i < path.size(); i++) {
        auto& segment = route.segments[i];
        string_view value = path[i];
        if (!segment.parameter) {
            if (value != segment.value)
                return false;
            continue;
        }
        if (value.size() <= segment.suffix.size() || !value.ends_with(segment.suffix))
            return false;
        value.remove_suffix(segment.suffix.size());
        parameters[segment.value] = value;
    }
    return true;
}
//---------------------------------------------------------------------------
Reply Router::dispatch(const HttpRequest& request) const
// Dispatch the request
{
    vector<string> path;
    try {
        path = splitPath(request.path);
    } catch (const runtime_error& e) {
        return Reply::text(HttpResponse::Code::BAD_REQUEST_400, string(e.what()) + "\n");
    }

    auto wanted = request.method;
    const Route* fallback = nullptr;
    Parameters fallbackParameters;
    string allowed;
    Parameters parameters;
    for (auto& route : _routes) {
        if (!match(route, path, parameters))
            continue;
        if (route.method == wanted)
            return route.handler(request, parameters);
        if (wanted == HttpRequest::Method::HEAD && route.method == HttpRequest::Method::GET && !fallback) {
            fallback = &route;
            fallbackParameters = parameters;
        }
        if (!allowed.empty())
            allowed += ", ";
        allowed += HttpRequest::getRequestMethod(route.method);
    }
    if (fallback)
        return fallback->handler(request, fallbackParameters);
    if (allowed.empty())
        return Reply::text(HttpResponse::Code::NOT_FOUND_404, "No route for " + request.path + "\n");

    auto reply = Reply::text(HttpResponse::Code::METHOD_NOT_ALLOWED_405, string(HttpRequest::getRequestMethod(wanted)) + " not allowed for " + request.path + "\n");
    reply.response.headers.emplace("Allow", allowed);
    return reply;
}
//---------------------------------------------------------------------------
} // namespace repoblob::network
