#pragma once
#include "storage/object_store.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
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
/// Keeps immutable objects in memory, used for tests and ephemeral mirrors
class MemoryStore : public ObjectStore {
    /// A stored object
    struct Entry {
        /// The data, shared with the open streams
        std::shared_ptr<const std::string> data;
        /// The content type
        std::string contentType;
    };
    /// The objects by path
    std::unordered_map<std::string, Entry> _objects;
    /// Guards the objects
    mutable std::mutex _mutex;

    /// Open a stream over a window
    std::unique_ptr<BoundedResource> open(const FileDescriptor& descriptor, bool ranged, uint64_t offset, std::optional<uint64_t> length);

    public:
    /// Store an object, the content type defaults to the media type of the filename
    void put(const FileDescriptor& descriptor, std::string data);
    /// Store an object with content type
    void put(const FileDescriptor& descriptor, std::string data, std::string contentType);
    /// Does the object exist
    [[nodiscard]] bool contains(const FileDescriptor& descriptor) const;

    /// Resolve the whole object
    [[nodiscard]] std::unique_ptr<BoundedResource> resolve(const FileDescriptor& descriptor) override;
    /// Resolve a window of the object
    [[nodiscard]] std::unique_ptr<BoundedResource> resolveRange(const FileDescriptor& descriptor, uint64_t offset, std::optional<uint64_t> length) override;
    /// Delete the object
    DeleteResult remove(const FileDescriptor& descriptor) override;
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
