#include "utils/logger.hpp"
#include <catch2/catch.hpp>
#include <sstream>
#include <stdexcept>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::utils::test {
//---------------------------------------------------------------------------
TEST_CASE("stream_logger") {
    std::stringstream out;
    StreamLogger logger(&out, Logger::Level::Info);
    logger.info("Deleted file updates/x86_64/foo-1.0.rpm");
    logger.debug("not written");
    logger.error("failed");
    REQUIRE(out.str() == "[info] Deleted file updates/x86_64/foo-1.0.rpm\n[error] failed\n");
}
//---------------------------------------------------------------------------
TEST_CASE("memory_logger_levels") {
    MemoryLogger logger(Logger::Level::Warning);
    logger.info("hidden");
    logger.warning("shown");
    REQUIRE(logger.getLines().size() == 1);
    REQUIRE(logger.contains("shown"));
    REQUIRE(!logger.contains("hidden"));

    REQUIRE(Logger::parseLevel("debug") == Logger::Level::Debug);
    REQUIRE(Logger::parseLevel("error") == Logger::Level::Error);
    REQUIRE_THROWS_AS(Logger::parseLevel("verbose"), std::runtime_error);
}
//---------------------------------------------------------------------------
} // namespace repoblob::utils::test
