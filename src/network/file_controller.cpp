#include "network/file_controller.hpp"
#include "delivery/delivery_service.hpp"
#include "storage/delivery_error.hpp"
#include "storage/file_descriptor.hpp"
#include "utils/logger.hpp"
#include <stdexcept>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
FileController::FileController(delivery::DeliveryService& service, utils::Logger& logger) : _service(service), _logger(logger)
// The constructor
{
}
//---------------------------------------------------------------------------
void FileController::registerRoutes(Router& router)
// Register the routes
{
    router.add(HttpRequest::Method::GET, string(prefix) + "/{repo}/{arch}/{filename}", [this](const HttpRequest& request, const Router::Parameters& parameters) {
        return deliverFile(request, parameters);
    });
    router.add(HttpRequest::Method::DELETE, string(prefix) + "/{repoName}/{arch}/{filename}" + string(packageExtension), [this](const HttpRequest& request, const Router::Parameters& parameters) {
        return deleteFile(request, parameters);
    });
}
//---------------------------------------------------------------------------
template <typename Operation>
Reply FileController::guarded(const HttpRequest& request, Operation&& operation)
// Translate the errors into replies
{
    try {
        return operation();
    } catch (const storage::RangeNotSatisfiable& e) {
        auto reply = Reply::text(HttpResponse::Code::RANGE_NOT_SATISFIABLE_416, string(storage::DeliveryError::getKindName(e.kind())) + ": " + e.what() + "\n");
        reply.response.headers.emplace("Content-Range", "bytes */" + to_string(e.getFileLength()));
        return reply;
    } catch (const storage::ObjectNotFound& e) {
        return Reply::text(HttpResponse::Code::NOT_FOUND_404, string(storage::DeliveryError::getKindName(e.kind())) + ": " + e.what() + "\n");
    } catch (const storage::DeliveryError& e) {
        // MalformedRange and InvalidRangeOrder
        _logger.debug(string(e.what()) + " Range: " + e.getRangeHeader());
        return Reply::text(HttpResponse::Code::BAD_REQUEST_400, string(storage::DeliveryError::getKindName(e.kind())) + ": " + e.what() + "\nRange: " + e.getRangeHeader() + "\n");
    } catch (const invalid_argument& e) {
        return Reply::text(HttpResponse::Code::BAD_REQUEST_400, string(e.what()) + "\n");
    } catch (const exception& e) {
        _logger.error(string(HttpRequest::getRequestMethod(request.method)) + " " + request.path + " failed: " + e.what());
        return Reply::text(HttpResponse::Code::INTERNAL_SERVER_ERROR_500, "Internal error\n");
    }
}
//---------------------------------------------------------------------------
Reply FileController::deliverFile(const HttpRequest& request, const Router::Parameters& parameters)
// Deliver, ranged if a Range header is present
{
    return guarded(request, [&]() {
        storage::FileDescriptor descriptor(parameters.at("repo"), parameters.at("arch"), parameters.at("filename"));
        if (auto range = request.getHeader("Range"))
            return toReply(_service.deliverRangeOfFile(descriptor, *range));
        return toReply(_service.deliverFile(descriptor));
    });
}
//---------------------------------------------------------------------------
Reply FileController::deleteFile(const HttpRequest& request, const Router::Parameters& parameters)
// Delete the package, the route strips the extension
{
    return guarded(request, [&]() {
        storage::FileDescriptor descriptor(parameters.at("repoName"), parameters.at("arch"), parameters.at("filename") + string(packageExtension));
        return toReply(_service.deleteFile(descriptor));
    });
}
//---------------------------------------------------------------------------
Reply FileController::toReply(delivery::Delivery&& delivery)
// Translate a delivery
{
    Reply reply;
    switch (delivery.status) {
        case delivery::Delivery::Status::OK: reply.response.code = HttpResponse::Code::OK_200; break;
        case delivery::Delivery::Status::PartialContent: reply.response.code = HttpResponse::Code::PARTIAL_CONTENT_206; break;
        case delivery::Delivery::Status::NoContent: reply.response.code = HttpResponse::Code::NO_CONTENT_204; break;
    }
    reply.response.headers = move(delivery.headers);
    reply.resource = move(delivery.resource);
    return reply;
}
//---------------------------------------------------------------------------
} // namespace repoblob::network
