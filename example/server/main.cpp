#include "delivery/delivery_service.hpp"
#include "delivery/metrics.hpp"
#include "network/config.hpp"
#include "network/file_controller.hpp"
#include "network/router.hpp"
#include "network/server.hpp"
#include "storage/object_store.hpp"
#include "utils/logger.hpp"
#include <csignal>
#include <exception>
#include <iostream>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
using namespace repoblob;
//---------------------------------------------------------------------------
namespace {
/// The running server, stopped by SIGINT and SIGTERM
network::DeliveryServer* runningServer = nullptr;
//---------------------------------------------------------------------------
void handleSignal(int /*signal*/) {
    if (runningServer)
        runningServer->stop();
}
} // namespace
//---------------------------------------------------------------------------
int main(int argc, char** argv) {
    if (argc > 3) {
        cerr << "Usage: " << argv[0] << " [http://host:port] [memory:// | file:///dir | cas:///dir]" << endl;
        return 1;
    }

    utils::StreamLogger logger;
    try {
        // Environment first, positional arguments override it
        auto config = network::Config::fromEnvironment();
        if (argc > 1)
            config.listen = network::Config::parseListen(argv[1]);
        if (argc > 2)
            config.store = argv[2];
        logger.setLevel(config.logLevel);

        auto store = storage::ObjectStore::makeStore(config.store);
        delivery::CounterMetrics metrics;
        delivery::DeliveryService service(*store, metrics, logger);

        network::Router router;
        network::FileController controller(service, logger);
        controller.registerRoutes(router);

        network::DeliveryServer server(config, router, logger);
        runningServer = &server;
        signal(SIGINT, handleSignal);
        signal(SIGTERM, handleSignal);
        signal(SIGPIPE, SIG_IGN);
        server.run();
        runningServer = nullptr;

        for (auto& [name, value] : metrics.snapshot())
            logger.info(name + " " + to_string(value));
    } catch (const exception& e) {
        logger.error(e.what());
        return 1;
    }
    return 0;
}
//---------------------------------------------------------------------------
