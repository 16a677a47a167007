#pragma once
#include "delivery/metrics.hpp"
#include "storage/bounded_resource.hpp"
#include "storage/file_descriptor.hpp"
#include <cstdint>
#include <map>
#include <memory>
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
namespace repoblob {
//---------------------------------------------------------------------------
namespace storage {
class ObjectStore;
}
namespace utils {
class Logger;
}
//---------------------------------------------------------------------------
namespace delivery {
//---------------------------------------------------------------------------
/// The outcome of a delivery operation
struct Delivery {
    /// The delivery status
    enum class Status : uint16_t {
        OK = 200,
        NoContent = 204,
        PartialContent = 206
    };

    /// The status
    Status status;
    /// The response headers
    std::map<std::string, std::string> headers;
    /// The body, null for deletes
    std::unique_ptr<storage::BoundedResource> resource;

    /// Get a header value, empty if absent
    [[nodiscard]] std::string_view getHeader(std::string_view name) const;
};
//---------------------------------------------------------------------------
/// Resolves descriptors to bounded resources, handles ranged delivery and
/// idempotent deletes. Holds no mutable state of its own.
class DeliveryService {
    public:
    /// Whole object deliveries
    static constexpr std::string_view counterGet = "repoblob.delivery.get.rpm";
    /// Ranged deliveries
    static constexpr std::string_view counterGetRange = "repoblob.delivery.get.rpm-range";
    /// Deletes of existing objects
    static constexpr std::string_view counterDelete = "repoblob.delivery.delete.rpm";
    /// Deletes of absent objects
    static constexpr std::string_view counterDeleteNonExistent = "repoblob.delivery.delete.nonExistentRPM";

    private:
    /// The store
    storage::ObjectStore& _store;
    /// The metrics sink
    Metrics& _metrics;
    /// The logger
    utils::Logger& _logger;

    /// Add the content headers
    static void addContentHeaders(Delivery& delivery);

    public:
    /// The constructor
    DeliveryService(storage::ObjectStore& store, Metrics& metrics, utils::Logger& logger);

    /// Deliver the whole object
    [[nodiscard]] Delivery deliverFile(const storage::FileDescriptor& descriptor);
    /// Deliver the byte range of the Range header value
    [[nodiscard]] Delivery deliverRangeOfFile(const storage::FileDescriptor& descriptor, std::string_view rangeHeader);
    /// Delete the object, succeeds whether or not it existed
    Delivery deleteFile(const storage::FileDescriptor& descriptor);

    /// Strip the directory components of a path
    [[nodiscard]] static std::string_view baseName(std::string_view path);
    /// The Content-Disposition value of a resource
    [[nodiscard]] static std::string contentDisposition(const storage::BoundedResource& resource);
    /// The Content-Range value of a resource
    [[nodiscard]] static std::string contentRange(const storage::BoundedResource& resource);
};
//---------------------------------------------------------------------------
} // namespace delivery
} // namespace repoblob
