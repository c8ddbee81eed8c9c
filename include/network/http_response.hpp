#pragma once
#include <cstdint>
#include <map>
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
namespace blobcopy::network {
//---------------------------------------------------------------------------
/// Implements an helper to deserialize http responses
struct HttpResponse {
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The headers - need to be without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The status code
    uint16_t code = 0;
    /// The reason phrase
    std::string reason;
    /// The type
    Type type = Type::HTTP_1_1;

    /// Get the response type
    static constexpr auto getResponseType(const Type& type) noexcept {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "UNKNOWN";
        }
    }
    /// Check for successful operation 2xx operations
    static constexpr bool checkSuccess(uint16_t code) {
        return code >= 200 && code < 300;
    }
    /// Check if the result has no content
    static constexpr bool withoutContent(uint16_t code) {
        return code == 204 || code == 304 || (code >= 100 && code < 200);
    }
    /// Codes that are worth another try
    static constexpr bool retryable(uint16_t code) {
        return code == 408 || code == 429 || code == 500 || code == 502 || code == 503 || code == 504;
    }
    /// Find a header case-insensitively
    [[nodiscard]] const std::string* findHeader(std::string_view name) const;
    /// Deserialize the response, throws std::runtime_error
    [[nodiscard]] static HttpResponse deserialize(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::network
