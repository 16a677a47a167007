#pragma once
#include "network/router.hpp"
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
namespace delivery {
class DeliveryService;
struct Delivery;
}
namespace utils {
class Logger;
}
//---------------------------------------------------------------------------
namespace network {
//---------------------------------------------------------------------------
/// Binds the delivery operations to the /repo routes and maps errors to status codes
class FileController {
    public:
    /// The route prefix
    static constexpr std::string_view prefix = "/repo";
    /// The extension of deletable packages
    static constexpr std::string_view packageExtension = ".rpm";

    private:
    /// The delivery service
    delivery::DeliveryService& _service;
    /// The logger
    utils::Logger& _logger;

    /// Run an operation and translate its errors
    template <typename Operation>
    Reply guarded(const HttpRequest& request, Operation&& operation);

    public:
    /// The constructor
    FileController(delivery::DeliveryService& service, utils::Logger& logger);

    /// Register GET /repo/{repo}/{arch}/{filename} and DELETE /repo/{repoName}/{arch}/{filename}.rpm
    void registerRoutes(Router& router);

    /// Deliver the whole file or the range of the Range header
    [[nodiscard]] Reply deliverFile(const HttpRequest& request, const Router::Parameters& parameters);
    /// Delete the package
    [[nodiscard]] Reply deleteFile(const HttpRequest& request, const Router::Parameters& parameters);

    /// Translate a delivery into a reply
    [[nodiscard]] static Reply toReply(delivery::Delivery&& delivery);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace repoblob
