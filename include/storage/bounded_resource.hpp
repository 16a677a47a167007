#pragma once
#include "storage/byte_stream.hpp"
#include <cstdint>
#include <memory>
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
/// A stored object restricted to a delivery window.
/// Owned by exactly one request; the stream is closed on release or destruction.
class BoundedResource {
    /// The stream over the window
    std::unique_ptr<ByteStream> _stream;
    /// The total object length
    uint64_t _fileLength;
    /// The first delivered byte
    uint64_t _offset;
    /// The delivered length
    uint64_t _contentLength;
    /// The content type, empty if unknown
    std::string _contentType;
    /// The stored filename
    std::string _filename;

    public:
    /// The constructor, throws std::invalid_argument if the window exceeds the object
    BoundedResource(std::unique_ptr<ByteStream> stream, uint64_t fileLength, uint64_t offset, uint64_t contentLength, std::string contentType, std::string filename);

    /// Get the total object length
    [[nodiscard]] uint64_t getFileLength() const { return _fileLength; }
    /// Get the first delivered byte
    [[nodiscard]] uint64_t getOffset() const { return _offset; }
    /// Get the delivered length
    [[nodiscard]] uint64_t contentLength() const { return _contentLength; }
    /// Get the content type
    [[nodiscard]] const std::string& getContentType() const { return _contentType; }
    /// Get the stored filename
    [[nodiscard]] const std::string& getFilename() const { return _filename; }
    /// Is this a window of the object rather than the whole object
    [[nodiscard]] bool isPartial() const { return _offset != 0 || _contentLength != _fileLength; }

    /// Read the next bytes of the window, 0 once exhausted
    [[nodiscard]] uint64_t read(uint8_t* data, uint64_t length);
    /// The bytes not yet read
    [[nodiscard]] uint64_t remaining() const;
    /// Close the stream
    void release() noexcept { _stream.reset(); }
    /// Was the stream closed
    [[nodiscard]] bool released() const { return !_stream; }
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
