#include "storage/range_spec.hpp"
#include "storage/delivery_error.hpp"
#include <charconv>
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
namespace repoblob::storage {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Consumes "0" or a decimal number without leading zero, returns the digits
string_view scanNumber(string_view& s)
{
    auto length = 0ull;
    while (length < s.size() && s[length] >= '0' && s[length] <= '9')
        length++;
    auto digits = s.substr(0, length);
    if (digits.size() > 1 && digits.front() == '0')
        return {};
    s.remove_prefix(length);
    return digits;
}
//---------------------------------------------------------------------------
/// Parses the digits, values have to fit a signed 64 bit offset
uint64_t parseRangeLong(string_view value, string_view header, string_view path)
{
    int64_t result = 0;
    auto [ptr, ec] = from_chars(value.data(), value.data() + value.size(), result);
    if (ec != errc() || ptr != value.data() + value.size() || result < 0)
        throw MalformedRange("Could not parse range element '" + string(value) + "' to long.", string(header), string(path));
    return static_cast<uint64_t>(result);
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
RangeSpec::RangeSpec(uint64_t start, optional<uint64_t> end) : _start(start), _end(end)
// The constructor
{
    if (_end && *_end < _start)
        throw invalid_argument("Range end is before range start");
}
//---------------------------------------------------------------------------
RangeSpec RangeSpec::parse(string_view header, string_view path)
// Parse a Range header value
{
    static constexpr string_view strBytes = "bytes=";
    static constexpr string_view strSeparator = "-";

    auto malformed = [&]() {
        return MalformedRange("Byte range header does not match " + string(grammar), string(header), string(path));
    };

    auto rest = header;
    if (!rest.starts_with(strBytes))
        throw malformed();
    rest.remove_prefix(strBytes.size());

    auto startString = scanNumber(rest);
    if (startString.empty() || !rest.starts_with(strSeparator))
        throw malformed();
    rest.remove_prefix(strSeparator.size());

    auto endString = scanNumber(rest);
    // a rejected leading zero leaves the digits in place
    if (!rest.empty())
        throw malformed();

    auto start = parseRangeLong(startString, header, path);
    if (endString.empty())
        return RangeSpec(start);

    auto end = parseRangeLong(endString, header, path);
    if (end < start)
        throw InvalidRangeOrder("Range end is before range start for path [" + string(path) + "]", string(header), string(path));
    return RangeSpec(start, end);
}
//---------------------------------------------------------------------------
optional<uint64_t> RangeSpec::length() const
// The requested length
{
    if (!_end)
        return nullopt;
    return *_end - _start + 1;
}
//---------------------------------------------------------------------------
string RangeSpec::toString() const
// Format as header value
{
    string result = "bytes=" + to_string(_start) + "-";
    if (_end)
        result += to_string(*_end);
    return result;
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
