#include "utils/utils.hpp"
#include <cassert>
#include <cctype>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/sha.h>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace repoblob {
namespace utils {
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
bool equalsIgnoreCase(string_view a, string_view b) noexcept
// Compare ignoring ASCII case
{
    if (a.size() != b.size())
        return false;
    for (auto i = 0u; i < a.size(); i++)
        if (tolower(static_cast<unsigned char>(a[i])) != tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}
//---------------------------------------------------------------------------
string encodeUrlParameters(string_view encode)
// Encodes a string for url
{
    string result;
    for (auto c : encode) {
        if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~')
            result += c;
        else {
            result += "%";
            result += hexEncode(reinterpret_cast<uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
static int hexValue(char c)
// Value of a hex digit or -1
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
//---------------------------------------------------------------------------
string decodeUrlParameters(string_view decode)
// Decodes the %HEX escapes of a path segment
{
    string result;
    result.reserve(decode.size());
    for (auto i = 0ull; i < decode.size(); i++) {
        if (decode[i] != '%') {
            result += decode[i];
            continue;
        }
        if (i + 2 >= decode.size())
            throw runtime_error("Invalid url encoding: Incomplete escape!");
        auto high = hexValue(decode[i + 1]);
        auto low = hexValue(decode[i + 2]);
        if (high < 0 || low < 0)
            throw runtime_error("Invalid url encoding: Escape needs two hex digits!");
        result += static_cast<char>((high << 4) | low);
        i += 2;
    }
    return result;
}
//---------------------------------------------------------------------------
string sha256Encode(const uint8_t* data, uint64_t length)
// Encodes the data as sha256 hex string
{
    Sha256 sha;
    sha.update(data, length);
    return sha.finish();
}
//---------------------------------------------------------------------------
Sha256::Sha256()
// The constructor
{
    if ((_context = EVP_MD_CTX_new()) == nullptr)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestInit_ex(_context, EVP_sha256(), nullptr) <= 0) {
        EVP_MD_CTX_free(_context);
        throw runtime_error("OpenSSL Error!");
    }
}
//---------------------------------------------------------------------------
Sha256::~Sha256() noexcept
// The destructor
{
    EVP_MD_CTX_free(_context);
}
//---------------------------------------------------------------------------
void Sha256::update(const uint8_t* data, uint64_t length)
// Hash the next piece of data
{
    if (EVP_DigestUpdate(_context, data, length) <= 0)
        throw runtime_error("OpenSSL Error!");
}
//---------------------------------------------------------------------------
string Sha256::finish()
// Finish the digest
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned digestLength = SHA256_DIGEST_LENGTH;
    if (EVP_DigestFinal_ex(_context, hash, &digestLength) <= 0)
        throw runtime_error("OpenSSL Error!");
    return hexEncode(hash, digestLength);
}
//---------------------------------------------------------------------------
} // namespace utils
} // namespace repoblob
