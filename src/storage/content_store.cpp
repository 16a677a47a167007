#include "storage/content_store.hpp"
#include "storage/delivery_error.hpp"
#include "storage/file_system.hpp"
#include "storage/media_types.hpp"
#include "utils/utils.hpp"
#include <algorithm>
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
ContentStore::Reference ContentStore::Reference::parse(string_view content)
// Parse a reference file
{
    while (!content.empty() && (content.back() == '\n' || content.back() == '\r' || content.back() == ' '))
        content.remove_suffix(1);

    auto pos = content.find(' ');
    auto digest = content.substr(0, pos);
    if (digest.size() != 64 || !all_of(digest.begin(), digest.end(), [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }))
        throw runtime_error("Invalid content reference: " + string(content) + "!");

    Reference reference;
    reference.digest = digest;
    if (pos != content.npos)
        reference.contentType = content.substr(pos + 1);
    return reference;
}
//---------------------------------------------------------------------------
string ContentStore::Reference::serialize() const
// Serialize the reference
{
    if (contentType.empty())
        return digest + "\n";
    return digest + " " + contentType + "\n";
}
//---------------------------------------------------------------------------
ContentStore::ContentStore(string root) : _root(move(root))
// The constructor
{
    if (_root.empty())
        throw invalid_argument("ContentStore: empty root directory!");
    while (_root.size() > 1 && _root.back() == '/')
        _root.pop_back();
}
//---------------------------------------------------------------------------
string ContentStore::getReferencePath(const FileDescriptor& descriptor) const
// Get the reference path
{
    return _root + "/refs/" + descriptor.getPath();
}
//---------------------------------------------------------------------------
string ContentStore::getBlobPath(string_view digest) const
// Get the blob path
{
    return _root + "/objects/" + string(digest.substr(0, 2)) + "/" + string(digest);
}
//---------------------------------------------------------------------------
string ContentStore::put(const FileDescriptor& descriptor, string_view data)
// Store with the media type of the filename
{
    return put(descriptor, data, string(MediaTypes::lookup(descriptor.getFilename())));
}
//---------------------------------------------------------------------------
string ContentStore::put(const FileDescriptor& descriptor, string_view data, string contentType)
// Store the blob once and point the reference to it
{
    Reference reference;
    reference.digest = utils::sha256Encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    reference.contentType = move(contentType);

    auto blobPath = getBlobPath(reference.digest);
    if (!FileSystem::exists(blobPath))
        FileSystem::writeAtomically(blobPath, data);
    FileSystem::writeAtomically(getReferencePath(descriptor), reference.serialize());
    return reference.digest;
}
//---------------------------------------------------------------------------
unique_ptr<BoundedResource> ContentStore::open(const FileDescriptor& descriptor, bool ranged, uint64_t offset, optional<uint64_t> length)
// Follow the reference and open a stream over a window of the blob
{
    auto content = FileSystem::readFile(getReferencePath(descriptor));
    if (!content)
        throw ObjectNotFound(descriptor.getPath());
    auto reference = Reference::parse(*content);

    auto file = FileSystem::openRegular(getBlobPath(reference.digest));
    if (!file)
        throw runtime_error("Missing blob " + reference.digest + " referenced by " + descriptor.getPath() + "!");

    Window w;
    try {
        w = ranged ? window(descriptor, file->size, offset, length) : Window{.offset = 0, .length = file->size};
    } catch (...) {
        ::close(file->fd);
        throw;
    }
    auto stream = make_unique<FileStream>(file->fd, w.offset, w.length);
    return make_unique<BoundedResource>(move(stream), file->size, w.offset, w.length, move(reference.contentType), descriptor.getPath());
}
//---------------------------------------------------------------------------
unique_ptr<BoundedResource> ContentStore::resolve(const FileDescriptor& descriptor)
// Resolve the whole object
{
    return open(descriptor, false, 0, nullopt);
}
//---------------------------------------------------------------------------
unique_ptr<BoundedResource> ContentStore::resolveRange(const FileDescriptor& descriptor, uint64_t offset, optional<uint64_t> length)
// Resolve a window
{
    return open(descriptor, true, offset, length);
}
//---------------------------------------------------------------------------
ObjectStore::DeleteResult ContentStore::remove(const FileDescriptor& descriptor)
// Delete the reference
{
    return FileSystem::unlinkFile(getReferencePath(descriptor)) ? DeleteResult::Deleted : DeleteResult::NotFound;
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
