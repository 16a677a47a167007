#include "storage/memory_store.hpp"
#include "storage/delivery_error.hpp"
#include "storage/media_types.hpp"
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
void MemoryStore::put(const FileDescriptor& descriptor, string data)
// Store with the media type of the filename
{
    put(descriptor, move(data), string(MediaTypes::lookup(descriptor.getFilename())));
}
//---------------------------------------------------------------------------
void MemoryStore::put(const FileDescriptor& descriptor, string data, string contentType)
// Store an object
{
    auto object = make_shared<const string>(move(data));
    lock_guard lock(_mutex);
    _objects.insert_or_assign(descriptor.getPath(), Entry{.data = move(object), .contentType = move(contentType)});
}
//---------------------------------------------------------------------------
bool MemoryStore::contains(const FileDescriptor& descriptor) const
// Does the object exist
{
    lock_guard lock(_mutex);
    return _objects.contains(descriptor.getPath());
}
//---------------------------------------------------------------------------
unique_ptr<BoundedResource> MemoryStore::open(const FileDescriptor& descriptor, bool ranged, uint64_t offset, optional<uint64_t> length)
// Open a stream over a window
{
    auto path = descriptor.getPath();
    Entry entry;
    {
        lock_guard lock(_mutex);
        auto it = _objects.find(path);
        if (it == _objects.end())
            throw ObjectNotFound(path);
        entry = it->second;
    }

    uint64_t fileLength = entry.data->size();
    auto w = ranged ? window(descriptor, fileLength, offset, length) : Window{.offset = 0, .length = fileLength};
    auto stream = make_unique<MemoryStream>(entry.data, w.offset, w.length);
    return make_unique<BoundedResource>(move(stream), fileLength, w.offset, w.length, move(entry.contentType), move(path));
}
//---------------------------------------------------------------------------
unique_ptr<BoundedResource> MemoryStore::resolve(const FileDescriptor& descriptor)
// Resolve the whole object
{
    return open(descriptor, false, 0, nullopt);
}
//---------------------------------------------------------------------------
unique_ptr<BoundedResource> MemoryStore::resolveRange(const FileDescriptor& descriptor, uint64_t offset, optional<uint64_t> length)
// Resolve a window
{
    return open(descriptor, true, offset, length);
}
//---------------------------------------------------------------------------
ObjectStore::DeleteResult MemoryStore::remove(const FileDescriptor& descriptor)
// Delete the object
{
    lock_guard lock(_mutex);
    return _objects.erase(descriptor.getPath()) ? DeleteResult::Deleted : DeleteResult::NotFound;
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
