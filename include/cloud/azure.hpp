#pragma once
#include "cloud/block_blob.hpp"
#include "network/http_client.hpp"
#include "network/http_request.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
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
namespace test {
class AzureTester;
} // namespace test
//---------------------------------------------------------------------------
/// Builds the Azure block blob requests of one blob
class Azure {
    public:
    /// The location of a blob
    struct Location {
        /// The service endpoint
        network::Endpoint endpoint;
        /// The account name, the first host label or the first path segment for emulators
        std::string accountName;
        /// The account is part of the path
        bool pathStyle = false;
        /// The container name
        std::string container;
        /// The blob name
        std::string blob;
        /// The shared access signature queries
        std::map<std::string, std::string> sas;
    };

    /// The shared key
    struct Secret {
        /// The storage account
        std::string accountName;
        /// The base64 account key
        std::string accountKey;
    };

    /// The fake XMS timestamp
    static constexpr const char* fakeXMSTimestamp = "Fri, 01 Jan 2100 00:00:00 GMT";
    /// Use the fake timestamp
    static bool testEnviornment;

    private:
    /// The location
    Location _location;
    /// The secret, signing is skipped with a SAS
    std::optional<Secret> _secret;

    /// Common request setup
    [[nodiscard]] network::HttpRequest baseRequest() const;
    /// Sign the request if a shared key is used
    void sign(network::HttpRequest& request) const;
    /// Adds the metadata headers
    static void addMetadata(network::HttpRequest& request, const Metadata& metadata);

    public:
    /// The constructor
    Azure(Location location, std::optional<Secret> secret);

    /// Parse a destination url http(s)://host[:port]/container/blob[?sas], throws std::runtime_error
    [[nodiscard]] static Location parseUrl(std::string_view url);
    /// Decode %HEX sequences
    [[nodiscard]] static std::string decodePath(std::string_view path);
    /// Encode a blob path, keeping the separators
    [[nodiscard]] static std::string encodePath(std::string_view path);

    /// Get the location
    [[nodiscard]] const Location& getLocation() const { return _location; }
    /// The encoded request path
    [[nodiscard]] std::string path() const;
    /// Does the request carry a SAS
    [[nodiscard]] bool usesSas() const { return !_location.sas.empty(); }

    /// Builds the put block request without the body
    [[nodiscard]] network::HttpRequest putBlockRequest(const std::string& blockId, uint64_t length) const;
    /// Builds the put block list request for the given body
    [[nodiscard]] network::HttpRequest putBlockListRequest(uint64_t length, const BlobHeaders& headers, const Metadata& metadata) const;
    /// Builds the put blob request without the body
    [[nodiscard]] network::HttpRequest putBlobRequest(uint64_t length, const BlobHeaders& headers, const Metadata& metadata) const;

    /// The block list body
    [[nodiscard]] static std::string blockListBody(const std::vector<std::string>& blockIds);
    /// Extracts the error code of an error response body
    [[nodiscard]] static std::string errorCode(std::string_view body);

    friend test::AzureTester;
};
//---------------------------------------------------------------------------
} // namespace blobcopy::cloud
