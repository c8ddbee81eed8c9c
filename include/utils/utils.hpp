#pragma once
#include <array>
#include <cassert>
#include <compare>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::utils {
//---------------------------------------------------------------------------
#ifndef NDEBUG
#define verify(expression) assert(expression)
#else
#define verify(expression) ((void) (expression))
#endif
//---------------------------------------------------------------------------
/// A random version 4 uuid
struct UUID {
    /// The raw bytes
    std::array<uint8_t, 16> bytes{};

    /// Generate a new random uuid
    [[nodiscard]] static UUID generate();
    /// Parse the canonical 8-4-4-4-12 form, throws std::invalid_argument
    [[nodiscard]] static UUID parse(std::string_view text);
    /// The canonical lowercase form
    [[nodiscard]] std::string toString() const;
    /// Is it the all-zero uuid
    [[nodiscard]] bool empty() const;

    /// Equality
    bool operator==(const UUID& other) const = default;
    /// Ordering
    auto operator<=>(const UUID& other) const = default;
};
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX
std::string encodeUrlParameters(const std::string& encode);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Encode everything from binary representation to base64
std::string base64Encode(const uint8_t* input, uint64_t length);
/// Decodes from base64 to raw string
std::pair<std::unique_ptr<uint8_t[]>, uint64_t> base64Decode(const uint8_t* input, uint64_t length);
/// Sign with hmac and return sha256 encoded signature
std::pair<std::unique_ptr<uint8_t[]>, uint64_t> hmacSign(const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength);
/// Lower case copy of an ascii string
std::string toLower(std::string_view value);
//---------------------------------------------------------------------------
} // namespace blobcopy::utils
