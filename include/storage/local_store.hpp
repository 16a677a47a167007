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
/// Path addressed store, objects live at <root>/<repo>/<arch>/<filename>
class LocalStore : public ObjectStore {
    /// The root directory
    std::string _root;

    /// Open a stream over a window
    std::unique_ptr<BoundedResource> open(const FileDescriptor& descriptor, bool ranged, uint64_t offset, std::optional<uint64_t> length);

    public:
    /// The constructor
    explicit LocalStore(std::string root);

    /// Get the file path of an object
    [[nodiscard]] std::string getFilePath(const FileDescriptor& descriptor) const;
    /// Store an object
    void put(const FileDescriptor& descriptor, std::string_view data);

    /// Resolve the whole object
    [[nodiscard]] std::unique_ptr<BoundedResource> resolve(const FileDescriptor& descriptor) override;
    /// Resolve a window of the object
    [[nodiscard]] std::unique_ptr<BoundedResource> resolveRange(const FileDescriptor& descriptor, uint64_t offset, std::optional<uint64_t> length) override;
    /// Delete the object
    DeleteResult remove(const FileDescriptor& descriptor) override;
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
