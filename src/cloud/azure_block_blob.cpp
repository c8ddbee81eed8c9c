#include "cloud/azure_block_blob.hpp"
#include "network/body_source.hpp"
#include "network/http_response.hpp"
#include <cstdlib>
#include <span>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
AzureBlockBlob::AzureBlockBlob(Azure azure, shared_ptr<network::HttpClient> client, PipelineOptions options) : _azure(move(azure)), _client(move(client)), _options(move(options))
// The constructor
{
}
//---------------------------------------------------------------------------
BlobResult AzureBlockBlob::execute(const char* operation, const utils::CancellationToken& token, const function<network::HttpRequest()>& build, network::BodySource* body)
// Sends the request with retries
{
    auto& retry = _options.retry;
    for (unsigned attempt = 1;; attempt++) {
        // Signatures carry the date, so every try is built again
        auto request = build();
        auto result = _client->send(_azure.getLocation().endpoint, request, body, token, retry.tryTimeout);

        if (result.getState() == network::MessageState::Cancelled)
            return {false, 0, string(operation) + " cancelled"};
        auto code = result.getResponseCodeNumber();
        if (result.successCode()) {
            _options.emit(utils::LogLevel::Debug, string(operation) + " succeeded with " + result.describe());
            return {true, code, ""};
        }

        string message = string(operation) + " failed: " + result.describe();
        bool retryable;
        if (result.success()) {
            auto errorCode = Azure::errorCode(result.getResult());
            if (!errorCode.empty())
                message += " (" + errorCode + ")";
            retryable = network::HttpResponse::retryable(code);
        } else {
            // Certificate and protocol failures do not heal
            retryable = !result.failed(network::MessageFailureCode::TLS) && !result.failed(network::MessageFailureCode::HTTP);
        }

        if (!retryable || attempt >= retry.maxTries)
            return {false, code, message + " after " + to_string(attempt) + (attempt == 1 ? " try" : " tries")};

        auto delay = retry.delay(attempt);
        _options.emit(utils::LogLevel::Warning, message + ", retrying in " + to_string(delay.count()) + " ms");
        if (token.waitFor(delay))
            return {false, 0, string(operation) + " cancelled"};
    }
}
//---------------------------------------------------------------------------
BlobResult AzureBlockBlob::stageBlock(const utils::CancellationToken& token, const string& blockId, network::BodySource& body)
// Stage one block
{
    return execute("PutBlock", token, [&] { return _azure.putBlockRequest(blockId, body.size()); }, &body);
}
//---------------------------------------------------------------------------
BlobResult AzureBlockBlob::commitBlockList(const utils::CancellationToken& token, const vector<string>& blockIds, const BlobHeaders& headers, const Metadata& metadata)
// Commit the block list
{
    auto blockList = Azure::blockListBody(blockIds);
    network::BufferSource body({reinterpret_cast<const uint8_t*>(blockList.data()), blockList.size()});
    return execute("PutBlockList", token, [&] { return _azure.putBlockListRequest(blockList.size(), headers, metadata); }, &body);
}
//---------------------------------------------------------------------------
BlobResult AzureBlockBlob::upload(const utils::CancellationToken& token, network::BodySource* body, const BlobHeaders& headers, const Metadata& metadata)
// Upload the whole object
{
    auto length = body ? body->size() : 0;
    return execute("PutBlob", token, [&] { return _azure.putBlobRequest(length, headers, metadata); }, body);
}
//---------------------------------------------------------------------------
AzureBlockBlobFactory::AzureBlockBlobFactory(shared_ptr<network::HttpClient> client, optional<Azure::Secret> secret) : _client(move(client)), _secret(move(secret))
// The constructor
{
}
//---------------------------------------------------------------------------
optional<Azure::Secret> AzureBlockBlobFactory::secretFromEnvironment()
// Reads the shared key from the environment
{
    auto accountName = getenv("BLOBCOPY_ACCOUNT_NAME");
    auto accountKey = getenv("BLOBCOPY_ACCOUNT_KEY");
    if (!accountName || !accountKey || !*accountName || !*accountKey)
        return nullopt;
    return Azure::Secret{accountName, accountKey};
}
//---------------------------------------------------------------------------
unique_ptr<BlockBlob> AzureBlockBlobFactory::open(const string& destination, const PipelineOptions& options)
// Open the destination
{
    auto location = Azure::parseUrl(destination);
    if (location.sas.empty() && !_secret)
        throw runtime_error("No credentials for " + location.endpoint.host + ": destination has no SAS and no shared key is configured");
    Azure azure(move(location), _secret);
    return make_unique<AzureBlockBlob>(move(azure), _client, options);
}
//---------------------------------------------------------------------------
} // namespace blobcopy::cloud
