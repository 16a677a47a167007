#pragma once
#include <cstdint>
#include <optional>
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
namespace repoblob::storage {
//---------------------------------------------------------------------------
/// A validated single byte range. Start and end are inclusive, 0-indexed offsets;
/// a missing end means "to the end of the object".
class RangeSpec {
    /// The first byte
    uint64_t _start;
    /// The last byte
    std::optional<uint64_t> _end;

    public:
    /// The accepted grammar
    static constexpr std::string_view grammar = "^bytes=(0|[1-9]\\d*)-((0|[1-9]\\d*)?)$";

    /// The constructor, throws std::invalid_argument if end < start
    explicit RangeSpec(uint64_t start, std::optional<uint64_t> end = std::nullopt);

    /// Parse a Range header value, the path is only used for diagnostics.
    /// Throws MalformedRange or InvalidRangeOrder.
    [[nodiscard]] static RangeSpec parse(std::string_view header, std::string_view path = "");

    /// Get the start
    [[nodiscard]] uint64_t getStart() const { return _start; }
    /// Get the end
    [[nodiscard]] std::optional<uint64_t> getEnd() const { return _end; }
    /// Is the range open-ended
    [[nodiscard]] bool isOpenEnded() const { return !_end.has_value(); }
    /// The requested length, absent if open-ended
    [[nodiscard]] std::optional<uint64_t> length() const;
    /// Format as header value
    [[nodiscard]] std::string toString() const;

    /// Compare
    bool operator==(const RangeSpec& other) const = default;
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
