#include "delivery/metrics.hpp"
#include <catch2/catch.hpp>
#include <thread>
#include <vector>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::delivery::test {
//---------------------------------------------------------------------------
TEST_CASE("counter_metrics") {
    CounterMetrics metrics;
    REQUIRE(metrics.get("repoblob.delivery.get.rpm") == 0);
    metrics.increment("repoblob.delivery.get.rpm");
    metrics.increment("repoblob.delivery.get.rpm");
    metrics.increment("repoblob.delivery.delete.rpm");
    REQUIRE(metrics.get("repoblob.delivery.get.rpm") == 2);

    auto snapshot = metrics.snapshot();
    REQUIRE(snapshot.size() == 2);
    REQUIRE(snapshot.at("repoblob.delivery.delete.rpm") == 1);

    SECTION("concurrent increments") {
        std::vector<std::thread> threads;
        for (auto i = 0; i < 4; i++)
            threads.emplace_back([&metrics]() {
                for (auto j = 0; j < 1000; j++)
                    metrics.increment("parallel");
            });
        for (auto& thread : threads)
            thread.join();
        REQUIRE(metrics.get("parallel") == 4000);
    }
}
//---------------------------------------------------------------------------
} // namespace repoblob::delivery::test
