#pragma once
#include <cstdint>
#include <span>
#include <string>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::cloud {
//---------------------------------------------------------------------------
/// Sniffs the content type from the leading bytes of an object
class ContentType {
    public:
    /// The number of bytes inspected
    static constexpr uint64_t sniffLength = 512;
    /// The fallback type
    static constexpr const char* binary = "application/octet-stream";

    /// Detect the content type of the data
    [[nodiscard]] static std::string detect(std::span<const uint8_t> data);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::cloud
