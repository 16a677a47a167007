#include "storage/file_descriptor.hpp"
#include "storage/media_types.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::storage::test {
//---------------------------------------------------------------------------
TEST_CASE("file_descriptor") {
    FileDescriptor descriptor("updates", "x86_64", "foo-1.0.rpm");
    REQUIRE(descriptor.getRepo() == "updates");
    REQUIRE(descriptor.getArch() == "x86_64");
    REQUIRE(descriptor.getFilename() == "foo-1.0.rpm");
    REQUIRE(descriptor.getPath() == "updates/x86_64/foo-1.0.rpm");
    REQUIRE(descriptor == FileDescriptor("updates", "x86_64", "foo-1.0.rpm"));

    SECTION("invalid components") {
        REQUIRE_THROWS_AS(FileDescriptor("", "x86_64", "foo.rpm"), std::invalid_argument);
        REQUIRE_THROWS_AS(FileDescriptor("updates", "", "foo.rpm"), std::invalid_argument);
        REQUIRE_THROWS_AS(FileDescriptor("updates", "x86_64", ""), std::invalid_argument);
        REQUIRE_THROWS_AS(FileDescriptor("updates", "x86_64", "../foo.rpm"), std::invalid_argument);
        REQUIRE_THROWS_AS(FileDescriptor("..", "x86_64", "foo.rpm"), std::invalid_argument);
    }
    SECTION("control characters") {
        REQUIRE_THROWS_AS(FileDescriptor("updates", "x86_64", "a\r\nSet-Cookie: x=1.rpm"), std::invalid_argument);
        REQUIRE_THROWS_AS(FileDescriptor("updates", std::string("x86\0_64", 7), "foo.rpm"), std::invalid_argument);
        REQUIRE_THROWS_AS(FileDescriptor("up\tdates", "x86_64", "foo.rpm"), std::invalid_argument);
        REQUIRE_THROWS_AS(FileDescriptor("updates", "x86_64", "foo\x7f.rpm"), std::invalid_argument);
        REQUIRE(FileDescriptor("updates", "x86_64", "foo 1.0.rpm").getFilename() == "foo 1.0.rpm");
    }
}
//---------------------------------------------------------------------------
TEST_CASE("media_types") {
    REQUIRE(MediaTypes::lookup("foo-1.0.rpm") == MediaTypes::package);
    REQUIRE(MediaTypes::lookup("repomd.xml") == "application/xml");
    REQUIRE(MediaTypes::lookup("primary.sqlite") == "application/x-sqlite3");
    REQUIRE(MediaTypes::lookup("README").empty());
    REQUIRE(MediaTypes::lookup(".rpm").empty());
    REQUIRE(MediaTypes::isPackage("application/x-rpm"));
    REQUIRE(!MediaTypes::isPackage("application/xml"));
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage::test
