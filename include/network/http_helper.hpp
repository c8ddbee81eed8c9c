#pragma once
#include "network/http_response.hpp"
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
namespace blobcopy::network {
//---------------------------------------------------------------------------
/// Implements an helper to resolve http responses
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        Unknown,
        NoContent,
        ContentLength,
        ChunkedEncoding,
        UntilClose
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The content length, known for ContentLength and after decoding ChunkedEncoding
        uint64_t length = 0;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::Unknown;
    };

    private:
    /// Detect the protocol
    [[nodiscard]] static Info detect(std::string_view header);
    /// Walks the chunked body, returns the consumed bytes or 0 if incomplete
    static uint64_t decodeChunked(std::string_view body, std::string* content);

    public:
    /// Is the header complete
    [[nodiscard]] static bool headerComplete(std::string_view data);
    /// Retrieve the content without http meta info
    [[nodiscard]] static std::string retrieveContent(std::string_view data, const Info& info);
    /// Detect end / content, closed marks that the peer finished sending
    [[nodiscard]] static bool finished(std::string_view data, std::unique_ptr<Info>& info, bool closed = false);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::network
