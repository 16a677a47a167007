#pragma once
#include "storage/object_store.hpp"
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
/// Content addressed store.
/// Blobs live at <root>/objects/<h0h1>/<sha256>, references at
/// <root>/refs/<repo>/<arch>/<filename> and contain "<sha256> <contentType>".
/// Deleting removes the reference, blobs are shared between references.
class ContentStore : public ObjectStore {
    public:
    /// A parsed reference
    struct Reference {
        /// The hex sha256 of the blob
        std::string digest;
        /// The content type, may be empty
        std::string contentType;

        /// Parse a reference file, throws std::runtime_error
        [[nodiscard]] static Reference parse(std::string_view content);
        /// Serialize the reference
        [[nodiscard]] std::string serialize() const;
    };

    private:
    /// The root directory
    std::string _root;

    /// Open a stream over a window
    std::unique_ptr<BoundedResource> open(const FileDescriptor& descriptor, bool ranged, uint64_t offset, std::optional<uint64_t> length);

    public:
    /// The constructor
    explicit ContentStore(std::string root);

    /// Get the reference path
    [[nodiscard]] std::string getReferencePath(const FileDescriptor& descriptor) const;
    /// Get the blob path of a digest
    [[nodiscard]] std::string getBlobPath(std::string_view digest) const;
    /// Store an object, returns the digest
    std::string put(const FileDescriptor& descriptor, std::string_view data);
    /// Store an object with content type, returns the digest
    std::string put(const FileDescriptor& descriptor, std::string_view data, std::string contentType);

    /// Resolve the whole object
    [[nodiscard]] std::unique_ptr<BoundedResource> resolve(const FileDescriptor& descriptor) override;
    /// Resolve a window of the object
    [[nodiscard]] std::unique_ptr<BoundedResource> resolveRange(const FileDescriptor& descriptor, uint64_t offset, std::optional<uint64_t> length) override;
    /// Delete the reference
    DeleteResult remove(const FileDescriptor& descriptor) override;
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
