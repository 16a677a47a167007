#include "network/http_request.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <array>
#include <map>
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
namespace repoblob {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
const string* HttpRequest::getHeader(string_view name) const
// Get a header value by case-insensitive name
{
    for (auto& [key, value] : headers)
        if (utils::equalsIgnoreCase(key, name))
            return &value;
    return nullptr;
}
//---------------------------------------------------------------------------
HttpRequest HttpRequest::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ":";
    static constexpr string_view strQuerySeperator = "=";
    static constexpr string_view strQueryStart = "?";
    static constexpr string_view strQueryAnd = "&";
    static constexpr array<Method, 5> methods = {Method::GET, Method::HEAD, Method::PUT, Method::POST, Method::DELETE};

    HttpRequest request;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpRequest: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpRequest: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // parse method, followed by exactly one space
            auto methodFound = false;
            for (auto method : methods) {
                string_view name = getRequestMethod(method);
                if (line.starts_with(name) && line.size() > name.size() && line[name.size()] == ' ') {
                    request.method = method;
                    line = line.substr(name.size());
                    methodFound = true;
                    break;
                }
            }
            if (!methodFound)
                throw runtime_error("Invalid HttpRequest: Needs to start with request method!");

            // parse path, requires HTTP type, otherwise invalid
            pos = line.find(" ", 1);
            if (pos == line.npos)
                throw runtime_error("Invalid HttpRequest: Could not find path, or missing HTTP type!");
            auto pathQuery = line.substr(1, pos - 1);
            if (!pathQuery.starts_with('/'))
                throw runtime_error("Invalid HttpRequest: Path needs to be absolute!");
            // the http type
            line = line.substr(pos + 1);

            // split path and query
            auto queriesPos = pathQuery.find(strQueryStart);
            if (queriesPos != pathQuery.npos) {
                // with query
                request.path = pathQuery.substr(0, queriesPos);
                auto queries = pathQuery.substr(queriesPos + 1);
                while (true) {
                    auto queryPos = queries.find(strQueryAnd);
                    string_view query;
                    if (queryPos == queries.npos)
                        query = queries;
                    else
                        query = queries.substr(0, queryPos);

                    // split between key and value (value might be unnecassary)
                    auto keyPos = query.find(strQuerySeperator);
                    string_view key, value = "";
                    if (keyPos == query.npos) {
                        key = query;
                    } else {
                        key = query.substr(0, keyPos);
                        value = query.substr(keyPos + 1);
                    }
                    if (key.size() > 0)
                        request.queries.emplace(utils::decodeUrlParameters(key), utils::decodeUrlParameters(value));
                    if (queryPos == queries.npos)
                        break;
                    queries = queries.substr(queryPos + 1);
                }
            } else {
                request.path = pathQuery;
            }

            // the http type
            if (line == strHttp1_0) {
                request.type = Type::HTTP_1_0;
            } else if (line == strHttp1_1) {
                request.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpRequest: Needs to be a HTTP type 1.0 or 1.1!");
            }
        } else {
            // headers, optional whitespace around the value
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos || keyPos == 0)
                throw runtime_error("Invalid HttpRequest: Headers need key and value!");
            auto key = line.substr(0, keyPos);
            auto value = line.substr(keyPos + strHeaderSeperator.size());
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
                value.remove_prefix(1);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
                value.remove_suffix(1);
            request.headers.emplace(key, value);
        }
    }

    return request;
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> HttpRequest::serialize(const HttpRequest& request)
// Serialize an http header
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + request.path;
    if (request.queries.size())
        httpHeader += "?";
    auto it = request.queries.begin();
    while (it != request.queries.end()) {
        httpHeader += utils::encodeUrlParameters(it->first) + "=" + utils::encodeUrlParameters(it->second);
        if (++it != request.queries.end())
            httpHeader += "&";
    }
    httpHeader += " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    return make_unique<utils::DataVector<uint8_t>>(reinterpret_cast<uint8_t*>(httpHeader.data()), reinterpret_cast<uint8_t*>(httpHeader.data() + httpHeader.size()));
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace repoblob
