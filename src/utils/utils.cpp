#include "utils/utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace blobcopy {
namespace utils {
//---------------------------------------------------------------------------
UUID UUID::generate()
// Generates a random v4 uuid
{
    UUID uuid;
    if (RAND_bytes(uuid.bytes.data(), static_cast<int>(uuid.bytes.size())) != 1)
        throw runtime_error("OpenSSL Error - RAND_bytes!");
    // Version 4, variant 10xx
    uuid.bytes[6] = static_cast<uint8_t>((uuid.bytes[6] & 0x0F) | 0x40);
    uuid.bytes[8] = static_cast<uint8_t>((uuid.bytes[8] & 0x3F) | 0x80);
    return uuid;
}
//---------------------------------------------------------------------------
UUID UUID::parse(string_view text)
// Parses the canonical form
{
    static constexpr size_t canonicalLength = 36;
    if (text.size() != canonicalLength)
        throw invalid_argument("invalid uuid: " + string(text));

    auto nibble = [&text](char c) -> uint8_t {
        if (c >= '0' && c <= '9')
            return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f')
            return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F')
            return static_cast<uint8_t>(c - 'A' + 10);
        throw invalid_argument("invalid uuid: " + string(text));
    };

    UUID uuid;
    auto byte = 0u;
    for (auto i = 0u; i < canonicalLength;) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-')
                throw invalid_argument("invalid uuid: " + string(text));
            i++;
            continue;
        }
        uuid.bytes[byte++] = static_cast<uint8_t>((nibble(text[i]) << 4) | nibble(text[i + 1]));
        i += 2;
    }
    return uuid;
}
//---------------------------------------------------------------------------
string UUID::toString() const
// The canonical form
{
    auto hex = hexEncode(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}
//---------------------------------------------------------------------------
bool UUID::empty() const
// Checks for the zero uuid
{
    return all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}
//---------------------------------------------------------------------------
string base64Encode(const uint8_t* input, uint64_t length)
// Encodes a string as a base64 string
{
    if (!in_range<int>(length))
        throw runtime_error("base64 input too large");
    auto baseLength = 4 * ((length + 2) / 3);
    auto buffer = make_unique<char[]>(baseLength + 1);
    auto encodeLength = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input, static_cast<int>(length));
    if (encodeLength < 0 || static_cast<unsigned>(encodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    return string(buffer.get(), static_cast<unsigned>(encodeLength));
}
//---------------------------------------------------------------------------
pair<unique_ptr<uint8_t[]>, uint64_t> base64Decode(const uint8_t* input, uint64_t length)
// Decodes from base64 to raw string
{
    if (!in_range<int>(length))
        throw runtime_error("base64 input too large");
    auto baseLength = 3 * length / 4;
    auto buffer = make_unique<uint8_t[]>(baseLength + 1);
    if (!length) {
        return {move(buffer), 0};
    }
    if (length % 4)
        throw runtime_error("Invalid base64 length!");
    auto decodeLength = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input, static_cast<int>(length));
    if (decodeLength < 0 || static_cast<unsigned>(decodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    // EVP_DecodeBlock keeps the padding bytes
    while (length && input[--length] == '=')
        --decodeLength;
    return {move(buffer), static_cast<uint64_t>(decodeLength)};
}
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
string encodeUrlParameters(const string& encode)
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
pair<unique_ptr<uint8_t[]>, uint64_t> hmacSign(const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength)
// Encodes the msg with the key with hmac-sha256
{
    unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)> mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr), EVP_MAC_free);
    if (!mac)
        throw runtime_error("OpenSSL Error!");

    OSSL_PARAM params[2];
    auto* p = params;
    string digest = "SHA2-256";
    *p++ = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest.data(), digest.size());
    *p = OSSL_PARAM_construct_end();

    unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)> mctx(EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free);
    if (!mctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_init(mctx.get(), keyData, keyLength, params) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_update(mctx.get(), msgData, msgLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    size_t len;
    if (EVP_MAC_final(mctx.get(), nullptr, &len, 0) <= 0)
        throw runtime_error("OpenSSL Error!");

    auto hash = make_unique<uint8_t[]>(len);

    if (EVP_MAC_final(mctx.get(), hash.get(), &len, len) <= 0)
        throw runtime_error("OpenSSL Error!");

    return {move(hash), SHA256_DIGEST_LENGTH};
}
//---------------------------------------------------------------------------
string toLower(string_view value)
// Lower case copy
{
    string result(value);
    transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return result;
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace blobcopy
