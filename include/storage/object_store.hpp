#pragma once
#include "storage/bounded_resource.hpp"
#include "storage/file_descriptor.hpp"
#include <cstdint>
#include <memory>
#include <optional>
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
/// The interface of the backing object stores.
/// Missing objects raise ObjectNotFound, I/O failures std::runtime_error.
class ObjectStore {
    public:
    /// The outcome of a delete
    enum class DeleteResult : uint8_t {
        Deleted,
        NotFound
    };
    /// A byte window of an object
    struct Window {
        /// The first byte
        uint64_t offset;
        /// The number of bytes
        uint64_t length;
    };

    /// The destructor
    virtual ~ObjectStore() noexcept = default;

    /// Resolve the whole object
    [[nodiscard]] virtual std::unique_ptr<BoundedResource> resolve(const FileDescriptor& descriptor) = 0;
    /// Resolve a window of the object, an absent length reads to the end
    [[nodiscard]] virtual std::unique_ptr<BoundedResource> resolveRange(const FileDescriptor& descriptor, uint64_t offset, std::optional<uint64_t> length) = 0;
    /// Delete the object
    virtual DeleteResult remove(const FileDescriptor& descriptor) = 0;

    /// Clamp a requested window to the object.
    /// The end is capped to the last byte, an offset beyond the object raises RangeNotSatisfiable.
    [[nodiscard]] static Window window(const FileDescriptor& descriptor, uint64_t fileLength, uint64_t offset, std::optional<uint64_t> length);

    /// Create a store from its uri: memory://, file:///<dir> or cas:///<dir>
    [[nodiscard]] static std::unique_ptr<ObjectStore> makeStore(std::string_view uri);
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
