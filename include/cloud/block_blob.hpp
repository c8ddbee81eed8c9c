#pragma once
#include "utils/cancellation.hpp"
#include "utils/log.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
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
namespace blobcopy {
//---------------------------------------------------------------------------
namespace network {
class BodySource;
} // namespace network
//---------------------------------------------------------------------------
namespace cloud {
//---------------------------------------------------------------------------
/// The outcome of a remote blob operation
struct BlobResult {
    /// Did the operation succeed
    bool success = false;
    /// The http status code, 0 without response
    uint16_t statusCode = 0;
    /// The error description
    std::string errorMessage;
};
//---------------------------------------------------------------------------
/// The object level http headers
struct BlobHeaders {
    /// The content type
    std::string contentType;
    /// The content encoding
    std::string contentEncoding;
};
//---------------------------------------------------------------------------
/// User defined metadata
using Metadata = std::map<std::string, std::string>;
//---------------------------------------------------------------------------
/// The retry policy of a destination handle
struct RetryOptions {
    /// The maximum number of tries of one operation
    unsigned maxTries = 5;
    /// The timeout of a single try
    std::chrono::milliseconds tryTimeout = std::chrono::minutes(10);
    /// The initial delay between tries
    std::chrono::milliseconds retryDelay = std::chrono::seconds(1);
    /// The maximum delay between tries
    std::chrono::milliseconds maxRetryDelay = std::chrono::seconds(3);

    /// The delay after the failed try with the 1-based number attempt
    [[nodiscard]] std::chrono::milliseconds delay(unsigned attempt) const {
        auto result = retryDelay;
        for (unsigned i = 1; i < attempt && result < maxRetryDelay; i++)
            result *= 2;
        return result < maxRetryDelay ? result : maxRetryDelay;
    }
};
//---------------------------------------------------------------------------
/// The request pipeline bound to a transfer
struct PipelineOptions {
    /// The log sink
    using LogFunction = std::function<void(utils::LogLevel, const std::string&)>;

    /// The retry policy
    RetryOptions retry;
    /// The log sink of the transfer
    LogFunction log;
    /// The minimum level forwarded to the sink
    utils::LogLevel minimumLevel = utils::LogLevel::Info;

    /// Forward a message if enabled
    void emit(utils::LogLevel level, const std::string& message) const {
        if (log && utils::Log::enabled(level, minimumLevel))
            log(level, message);
    }
};
//---------------------------------------------------------------------------
/// A destination that supports staged block upload and block list commit
class BlockBlob {
    public:
    /// The maximum number of blocks of a blob
    static constexpr uint64_t maxBlocks = 50000;

    /// The destructor
    virtual ~BlockBlob() noexcept = default;

    /// Stage one block
    [[nodiscard]] virtual BlobResult stageBlock(const utils::CancellationToken& token, const std::string& blockId, network::BodySource& body) = 0;
    /// Commit the blocks in the given order
    [[nodiscard]] virtual BlobResult commitBlockList(const utils::CancellationToken& token, const std::vector<std::string>& blockIds, const BlobHeaders& headers, const Metadata& metadata) = 0;
    /// Upload the whole object in one request, a null body uploads an empty object
    [[nodiscard]] virtual BlobResult upload(const utils::CancellationToken& token, network::BodySource* body, const BlobHeaders& headers, const Metadata& metadata) = 0;
};
//---------------------------------------------------------------------------
/// Opens destination handles
class BlockBlobFactory {
    public:
    /// The destructor
    virtual ~BlockBlobFactory() noexcept = default;
    /// Open the destination, throws std::runtime_error for invalid destinations
    [[nodiscard]] virtual std::unique_ptr<BlockBlob> open(const std::string& destination, const PipelineOptions& options) = 0;
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace blobcopy
