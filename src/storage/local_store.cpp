#include "storage/local_store.hpp"
#include "storage/delivery_error.hpp"
#include "storage/file_system.hpp"
#include "storage/media_types.hpp"
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
LocalStore::LocalStore(string root) : _root(move(root))
// The constructor
{
    if (_root.empty())
        throw invalid_argument("LocalStore: empty root directory!");
    while (_root.size() > 1 && _root.back() == '/')
        _root.pop_back();
}
//---------------------------------------------------------------------------
string LocalStore::getFilePath(const FileDescriptor& descriptor) const
// Get the file path
{
    return _root + "/" + descriptor.getPath();
}
//---------------------------------------------------------------------------
void LocalStore::put(const FileDescriptor& descriptor, string_view data)
// Store an object
{
    FileSystem::writeAtomically(getFilePath(descriptor), data);
}
//---------------------------------------------------------------------------
unique_ptr<BoundedResource> LocalStore::open(const FileDescriptor& descriptor, bool ranged, uint64_t offset, optional<uint64_t> length)
// Open a stream over a window
{
    auto file = FileSystem::openRegular(getFilePath(descriptor));
    if (!file)
        throw ObjectNotFound(descriptor.getPath());

    Window w;
    try {
        w = ranged ? window(descriptor, file->size, offset, length) : Window{.offset = 0, .length = file->size};
    } catch (...) {
        ::close(file->fd);
        throw;
    }
    auto stream = make_unique<FileStream>(file->fd, w.offset, w.length);
    return make_unique<BoundedResource>(move(stream), file->size, w.offset, w.length, string(MediaTypes::lookup(descriptor.getFilename())), descriptor.getPath());
}
//---------------------------------------------------------------------------
unique_ptr<BoundedResource> LocalStore::resolve(const FileDescriptor& descriptor)
// Resolve the whole object
{
    return open(descriptor, false, 0, nullopt);
}
//---------------------------------------------------------------------------
unique_ptr<BoundedResource> LocalStore::resolveRange(const FileDescriptor& descriptor, uint64_t offset, optional<uint64_t> length)
// Resolve a window
{
    return open(descriptor, true, offset, length);
}
//---------------------------------------------------------------------------
ObjectStore::DeleteResult LocalStore::remove(const FileDescriptor& descriptor)
// Delete the object
{
    return FileSystem::unlinkFile(getFilePath(descriptor)) ? DeleteResult::Deleted : DeleteResult::NotFound;
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
