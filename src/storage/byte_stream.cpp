#include "storage/byte_stream.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>
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
MemoryStream::MemoryStream(shared_ptr<const string> object, uint64_t offset, uint64_t length) : _object(move(object)), _position(offset), _end(offset + length)
// The constructor
{
    if (!_object || _end > _object->size() || _end < _position)
        throw invalid_argument("MemoryStream: window exceeds the object!");
}
//---------------------------------------------------------------------------
uint64_t MemoryStream::read(uint8_t* data, uint64_t length)
// Copy the next bytes of the window
{
    auto count = min(length, _end - _position);
    if (count)
        memcpy(data, _object->data() + _position, count);
    _position += count;
    return count;
}
//---------------------------------------------------------------------------
FileStream::FileStream(int fd, uint64_t offset, uint64_t length) : _fd(fd), _position(offset), _end(offset + length)
// The constructor
{
    if (_fd < 0)
        throw invalid_argument("FileStream: invalid file descriptor!");
}
//---------------------------------------------------------------------------
FileStream::~FileStream() noexcept
// The destructor
{
    close(_fd);
}
//---------------------------------------------------------------------------
uint64_t FileStream::read(uint8_t* data, uint64_t length)
// Read the next bytes of the window
{
    auto count = min(length, _end - _position);
    if (!count)
        return 0;
    while (true) {
        auto res = ::pread(_fd, data, count, static_cast<off_t>(_position));
        if (res < 0) {
            if (errno == EINTR)
                continue;
            throw runtime_error("FileStream read error! " + string(strerror(errno)));
        }
        if (res == 0)
            throw runtime_error("FileStream read error! The file was truncated.");
        _position += static_cast<uint64_t>(res);
        return static_cast<uint64_t>(res);
    }
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
