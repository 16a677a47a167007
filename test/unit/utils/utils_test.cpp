#include "utils/utils.hpp"
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
namespace repoblob::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("url_encoding") {
    REQUIRE(decodeUrlParameters("foo-1.0.rpm") == "foo-1.0.rpm");
    REQUIRE(decodeUrlParameters("foo%2B1.0.rpm") == "foo+1.0.rpm");
    REQUIRE(decodeUrlParameters("a%20b") == "a b");
    REQUIRE(decodeUrlParameters(encodeUrlParameters("x86_64 & noarch")) == "x86_64 & noarch");
    REQUIRE_THROWS_AS(decodeUrlParameters("broken%2"), runtime_error);
    REQUIRE_THROWS_AS(decodeUrlParameters("broken%zz"), runtime_error);
}
//---------------------------------------------------------------------------
TEST_CASE("sha256") {
    string empty;
    REQUIRE(sha256Encode(reinterpret_cast<const uint8_t*>(empty.data()), 0) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    string abc = "abc";
    auto digest = sha256Encode(reinterpret_cast<const uint8_t*>(abc.data()), abc.size());
    REQUIRE(digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    Sha256 incremental;
    incremental.update(reinterpret_cast<const uint8_t*>(abc.data()), 1);
    incremental.update(reinterpret_cast<const uint8_t*>(abc.data()) + 1, 2);
    REQUIRE(incremental.finish() == digest);
}
//---------------------------------------------------------------------------
TEST_CASE("hex_and_case") {
    const uint8_t bytes[] = {0x00, 0xab, 0xff};
    REQUIRE(hexEncode(bytes, 3) == "00abff");
    REQUIRE(hexEncode(bytes, 3, true) == "00ABFF");
    REQUIRE(equalsIgnoreCase("Content-Length", "content-length"));
    REQUIRE(!equalsIgnoreCase("Range", "Ranges"));
}
//---------------------------------------------------------------------------
} // namespace repoblob::utils::test
