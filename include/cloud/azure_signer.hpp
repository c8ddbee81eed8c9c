#pragma once
#include "network/http_request.hpp"
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
/// Implements the Azure Shared Key Signing Logic
/// It follows the docu: https://learn.microsoft.com/en-us/rest/api/storageservices/authorize-with-shared-key
class AzureSigner {
    public:
    /// The service version we sign for
    static constexpr const char* version = "2015-02-21";

    /// Builds the string to sign
    [[nodiscard]] static std::string canonicalRequest(const std::string& accountName, const network::HttpRequest& request);
    /// Adds the version and the Authorization header, throws std::runtime_error on an invalid key
    static void signRequest(const std::string& accountName, const std::string& accountKey, network::HttpRequest& request);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::cloud
