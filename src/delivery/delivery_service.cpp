#include "delivery/delivery_service.hpp"
#include "storage/media_types.hpp"
#include "storage/object_store.hpp"
#include "storage/range_spec.hpp"
#include "utils/logger.hpp"
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::delivery {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string_view Delivery::getHeader(string_view name) const
// Get a header value
{
    auto it = headers.find(string(name));
    return it == headers.end() ? string_view() : string_view(it->second);
}
//---------------------------------------------------------------------------
DeliveryService::DeliveryService(storage::ObjectStore& store, Metrics& metrics, utils::Logger& logger) : _store(store), _metrics(metrics), _logger(logger)
// The constructor
{
}
//---------------------------------------------------------------------------
string_view DeliveryService::baseName(string_view path)
// Strip the directory components
{
    auto pos = path.rfind('/');
    return pos == path.npos ? path : path.substr(pos + 1);
}
//---------------------------------------------------------------------------
string DeliveryService::contentDisposition(const storage::BoundedResource& resource)
// Attachment for packages, inline otherwise
{
    string disposition = storage::MediaTypes::isPackage(resource.getContentType()) ? "attachment" : "inline";
    return disposition + "; filename=" + string(baseName(resource.getFilename()));
}
//---------------------------------------------------------------------------
string DeliveryService::contentRange(const storage::BoundedResource& resource)
// bytes <start>-<last>/<total>
{
    auto start = resource.getOffset();
    auto range = resource.contentLength() ? to_string(start) + "-" + to_string(start + resource.contentLength() - 1) : string("*");
    return "bytes " + range + "/" + to_string(resource.getFileLength());
}
//---------------------------------------------------------------------------
void DeliveryService::addContentHeaders(Delivery& delivery)
// Add the content headers
{
    auto& resource = *delivery.resource;
    delivery.headers["Content-Length"] = to_string(resource.contentLength());
    if (!resource.getContentType().empty())
        delivery.headers["Content-Type"] = resource.getContentType();
    delivery.headers["Content-Disposition"] = contentDisposition(resource);
}
//---------------------------------------------------------------------------
Delivery DeliveryService::deliverFile(const storage::FileDescriptor& descriptor)
// Deliver the whole object
{
    Delivery delivery{.status = Delivery::Status::OK, .headers = {}, .resource = _store.resolve(descriptor)};
    addContentHeaders(delivery);
    _metrics.increment(counterGet);
    return delivery;
}
//---------------------------------------------------------------------------
Delivery DeliveryService::deliverRangeOfFile(const storage::FileDescriptor& descriptor, string_view rangeHeader)
// Validate the range before touching the store
{
    auto range = storage::RangeSpec::parse(rangeHeader, descriptor.getPath());

    Delivery delivery{.status = Delivery::Status::PartialContent, .headers = {}, .resource = _store.resolveRange(descriptor, range.getStart(), range.length())};
    delivery.headers["Accept-Ranges"] = "bytes";
    delivery.headers["Content-Range"] = contentRange(*delivery.resource);
    addContentHeaders(delivery);
    _metrics.increment(counterGetRange);
    return delivery;
}
//---------------------------------------------------------------------------
Delivery DeliveryService::deleteFile(const storage::FileDescriptor& descriptor)
// Delete, absent objects are no error
{
    auto result = _store.remove(descriptor);
    if (result == storage::ObjectStore::DeleteResult::Deleted) {
        _logger.info("Deleted file " + descriptor.getPath());
        _metrics.increment(counterDelete);
    } else {
        _logger.info("ignoring delete of none existing resource '" + descriptor.getPath() + "'");
        _metrics.increment(counterDeleteNonExistent);
    }
    return Delivery{.status = Delivery::Status::NoContent, .headers = {}, .resource = nullptr};
}
//---------------------------------------------------------------------------
} // namespace repoblob::delivery
