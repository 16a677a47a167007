#include "network/config.hpp"
#include <charconv>
#include <cstdlib>
#include <limits>
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
namespace {
//---------------------------------------------------------------------------
/// Parse a positive number of a variable
template <typename T>
T parseNumber(string_view name, string_view value, T min, T max)
{
    T result{};
    auto [ptr, ec] = from_chars(value.data(), value.data() + value.size(), result);
    if (ec != errc() || ptr != value.data() + value.size() || result < min || result > max)
        throw runtime_error("Invalid " + string(name) + ": " + string(value) + "!");
    return result;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
Config::Listen Config::parseListen(string_view uri)
// Parse http://host:port
{
    static constexpr string_view strHttp = "http://";

    if (!uri.starts_with(strHttp))
        throw runtime_error("Invalid listen uri: " + string(uri) + " needs to start with http://!");
    auto authority = uri.substr(strHttp.size());
    if (authority.ends_with('/'))
        authority.remove_suffix(1);

    auto pos = authority.rfind(':');
    if (pos == authority.npos || pos == 0)
        throw runtime_error("Invalid listen uri: " + string(uri) + " needs host and port!");
    auto host = authority.substr(0, pos);
    if (host.find('/') != host.npos)
        throw runtime_error("Invalid listen uri: " + string(uri) + "!");
    auto port = parseNumber<uint16_t>("listen port", authority.substr(pos + 1), 0, numeric_limits<uint16_t>::max());
    return Listen{.host = string(host), .port = port};
}
//---------------------------------------------------------------------------
Config Config::fromEnvironment(const Lookup& lookup)
// Read the environment
{
    auto get = [&](const char* name) -> const char* {
        return lookup ? lookup(name) : getenv(name);
    };

    Config config;
    if (auto value = get("REPOBLOB_LISTEN"))
        config.listen = parseListen(value);
    if (auto value = get("REPOBLOB_STORE"))
        config.store = value;
    if (auto value = get("REPOBLOB_CHUNK_SIZE"))
        config.chunkSize = parseNumber<uint32_t>("REPOBLOB_CHUNK_SIZE", value, 1, 64u << 20);
    if (auto value = get("REPOBLOB_MAX_CONNECTIONS"))
        config.maxConnections = parseNumber<unsigned>("REPOBLOB_MAX_CONNECTIONS", value, 1, 1u << 20);
    if (auto value = get("REPOBLOB_LOG_LEVEL"))
        config.logLevel = utils::Logger::parseLevel(value);
    return config;
}
//---------------------------------------------------------------------------
} // namespace repoblob::network
