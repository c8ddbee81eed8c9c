#pragma once
#include "cloud/azure.hpp"
#include "cloud/block_blob.hpp"
#include "network/http_client.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
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
/// An Azure block blob with the retry pipeline of one transfer
class AzureBlockBlob : public BlockBlob {
    /// The request builder
    Azure _azure;
    /// The shared http client
    std::shared_ptr<network::HttpClient> _client;
    /// The pipeline
    PipelineOptions _options;

    /// Sends the request built by build with retries
    BlobResult execute(const char* operation, const utils::CancellationToken& token, const std::function<network::HttpRequest()>& build, network::BodySource* body);

    public:
    /// The constructor
    AzureBlockBlob(Azure azure, std::shared_ptr<network::HttpClient> client, PipelineOptions options);

    /// Stage one block
    [[nodiscard]] BlobResult stageBlock(const utils::CancellationToken& token, const std::string& blockId, network::BodySource& body) override;
    /// Commit the block list
    [[nodiscard]] BlobResult commitBlockList(const utils::CancellationToken& token, const std::vector<std::string>& blockIds, const BlobHeaders& headers, const Metadata& metadata) override;
    /// Upload the whole object
    [[nodiscard]] BlobResult upload(const utils::CancellationToken& token, network::BodySource* body, const BlobHeaders& headers, const Metadata& metadata) override;
};
//---------------------------------------------------------------------------
/// Opens Azure block blobs from destination urls
class AzureBlockBlobFactory : public BlockBlobFactory {
    /// The shared http client
    std::shared_ptr<network::HttpClient> _client;
    /// The shared key, unused for destinations with SAS
    std::optional<Azure::Secret> _secret;

    public:
    /// The constructor
    AzureBlockBlobFactory(std::shared_ptr<network::HttpClient> client, std::optional<Azure::Secret> secret);
    /// Reads BLOBCOPY_ACCOUNT_NAME and BLOBCOPY_ACCOUNT_KEY
    [[nodiscard]] static std::optional<Azure::Secret> secretFromEnvironment();

    /// Open the destination
    [[nodiscard]] std::unique_ptr<BlockBlob> open(const std::string& destination, const PipelineOptions& options) override;
};
//---------------------------------------------------------------------------
} // namespace blobcopy::cloud
