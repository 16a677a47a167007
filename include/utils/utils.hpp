#pragma once
#include <cstdint>
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
typedef struct evp_md_ctx_st EVP_MD_CTX;
//---------------------------------------------------------------------------
namespace repoblob::utils {
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX
std::string encodeUrlParameters(std::string_view encode);
/// Decode %HEX escapes of an url path segment, throws on malformed escapes
std::string decodeUrlParameters(std::string_view decode);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Build sha256 of the data encoded as hex
std::string sha256Encode(const uint8_t* data, uint64_t length);
/// Compare ASCII strings ignoring case
bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept;
//---------------------------------------------------------------------------
/// Incremental sha256, used for hashing objects that are streamed into a store
class Sha256 {
    /// The OpenSSL digest context
    EVP_MD_CTX* _context;

    public:
    /// The constructor
    Sha256();
    /// The destructor
    ~Sha256() noexcept;
    /// Delete copy
    Sha256(const Sha256&) = delete;
    /// Delete copy assignment
    Sha256& operator=(const Sha256&) = delete;

    /// Hash the next piece of data
    void update(const uint8_t* data, uint64_t length);
    /// Finish and return the hex digest
    [[nodiscard]] std::string finish();
};
//---------------------------------------------------------------------------
} // namespace repoblob::utils
