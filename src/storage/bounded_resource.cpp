#include "storage/bounded_resource.hpp"
#include <stdexcept>
#include <utility>
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
BoundedResource::BoundedResource(unique_ptr<ByteStream> stream, uint64_t fileLength, uint64_t offset, uint64_t contentLength, string contentType, string filename)
    : _stream(move(stream)), _fileLength(fileLength), _offset(offset), _contentLength(contentLength), _contentType(move(contentType)), _filename(move(filename))
// The constructor
{
    if (!_stream)
        throw invalid_argument("BoundedResource: missing stream!");
    if (_offset > _fileLength || _contentLength > _fileLength - _offset)
        throw invalid_argument("BoundedResource: window exceeds the object!");
    if (_stream->remaining() != _contentLength)
        throw invalid_argument("BoundedResource: stream does not match the window!");
}
//---------------------------------------------------------------------------
uint64_t BoundedResource::read(uint8_t* data, uint64_t length)
// Read the next bytes of the window
{
    if (!_stream)
        throw logic_error("BoundedResource: read after release!");
    return _stream->read(data, length);
}
//---------------------------------------------------------------------------
uint64_t BoundedResource::remaining() const
// The bytes not yet read
{
    return _stream ? _stream->remaining() : 0;
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
