#pragma once
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
/// A finite, not restartable stream over a byte window of a stored object
class ByteStream {
    public:
    /// The destructor releases the underlying source
    virtual ~ByteStream() noexcept = default;
    /// Read up to length bytes into data, returns 0 once the window is exhausted
    [[nodiscard]] virtual uint64_t read(uint8_t* data, uint64_t length) = 0;
    /// The bytes left in the window
    [[nodiscard]] virtual uint64_t remaining() const = 0;
};
//---------------------------------------------------------------------------
/// Streams a window of an immutable in-memory object
class MemoryStream : public ByteStream {
    /// The object, shared with the store
    std::shared_ptr<const std::string> _object;
    /// The current position
    uint64_t _position;
    /// The end of the window (exclusive)
    uint64_t _end;

    public:
    /// The constructor
    MemoryStream(std::shared_ptr<const std::string> object, uint64_t offset, uint64_t length);

    /// Read up to length bytes
    [[nodiscard]] uint64_t read(uint8_t* data, uint64_t length) override;
    /// The bytes left in the window
    [[nodiscard]] uint64_t remaining() const override { return _end - _position; }
};
//---------------------------------------------------------------------------
/// Streams a window of a file, owns the file descriptor
class FileStream : public ByteStream {
    /// The file descriptor
    int _fd;
    /// The current position
    uint64_t _position;
    /// The end of the window (exclusive)
    uint64_t _end;

    public:
    /// The constructor, takes ownership of fd
    FileStream(int fd, uint64_t offset, uint64_t length);
    /// The destructor closes the file
    ~FileStream() noexcept override;
    /// Delete copy
    FileStream(const FileStream&) = delete;
    /// Delete copy assignment
    FileStream& operator=(const FileStream&) = delete;

    /// Read up to length bytes with pread
    [[nodiscard]] uint64_t read(uint8_t* data, uint64_t length) override;
    /// The bytes left in the window
    [[nodiscard]] uint64_t remaining() const override { return _end - _position; }
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
