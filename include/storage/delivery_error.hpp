#pragma once
#include <cstdint>
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
namespace repoblob::storage {
//---------------------------------------------------------------------------
/// Classified delivery failure, carries the context needed for a diagnostic response
class DeliveryError : public std::runtime_error {
    public:
    /// The error kinds
    enum class Kind : uint8_t {
        MalformedRange,
        InvalidRangeOrder,
        RangeNotSatisfiable,
        ObjectNotFound
    };

    private:
    /// The kind
    Kind _kind;
    /// The descriptor path, may be empty
    std::string _path;
    /// The offending range header, empty for non-range errors
    std::string _rangeHeader;

    protected:
    /// The constructor
    DeliveryError(Kind kind, const std::string& message, std::string path, std::string rangeHeader);

    public:
    /// Get the kind name
    static constexpr auto getKindName(const Kind& kind) noexcept {
        switch (kind) {
            case Kind::MalformedRange: return "MalformedRange";
            case Kind::InvalidRangeOrder: return "InvalidRangeOrder";
            case Kind::RangeNotSatisfiable: return "RangeNotSatisfiable";
            case Kind::ObjectNotFound: return "ObjectNotFound";
            default: return "Unknown";
        }
    }

    /// Get the kind
    [[nodiscard]] Kind kind() const noexcept { return _kind; }
    /// Get the descriptor path
    [[nodiscard]] const std::string& getPath() const noexcept { return _path; }
    /// Get the offending range header
    [[nodiscard]] const std::string& getRangeHeader() const noexcept { return _rangeHeader; }
};
//---------------------------------------------------------------------------
/// The range header does not match "bytes=<start>-<end?>" or a number does not fit
class MalformedRange : public DeliveryError {
    public:
    MalformedRange(const std::string& message, std::string rangeHeader, std::string path = "");
};
//---------------------------------------------------------------------------
/// The range is well-formed but its end precedes its start
class InvalidRangeOrder : public DeliveryError {
    public:
    InvalidRangeOrder(const std::string& message, std::string rangeHeader, std::string path);
};
//---------------------------------------------------------------------------
/// The range starts at or after the end of the object
class RangeNotSatisfiable : public DeliveryError {
    /// The object length
    uint64_t _fileLength;

    public:
    RangeNotSatisfiable(std::string path, uint64_t offset, uint64_t fileLength);

    /// Get the object length
    [[nodiscard]] uint64_t getFileLength() const noexcept { return _fileLength; }
};
//---------------------------------------------------------------------------
/// The object is absent in the store
class ObjectNotFound : public DeliveryError {
    public:
    explicit ObjectNotFound(std::string path);
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
