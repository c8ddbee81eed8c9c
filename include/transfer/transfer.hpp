#pragma once
#include "cloud/block_blob.hpp"
#include "transfer/transfer_status.hpp"
#include "utils/cancellation.hpp"
#include "utils/log.hpp"
#include <atomic>
#include <cstdint>
#include <string>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::transfer {
//---------------------------------------------------------------------------
class Job;
class JobPart;
class ThroughputCounter;
//---------------------------------------------------------------------------
/// One file level operation as ordered by the client
struct TransferDescriptor {
    /// The local source path
    std::string source;
    /// The destination url
    std::string destination;
    /// The size of the source in bytes
    uint64_t sourceSize = 0;
    /// The chunk size, 0 uses the engine default
    uint64_t blockSize = 0;
    /// The number of chunks, recomputed on submission
    uint32_t numChunks = 0;

    /// Equality
    bool operator==(const TransferDescriptor& other) const = default;
};
//---------------------------------------------------------------------------
/// The state of one transfer.
/// The status only moves forward and the first terminal status wins, so a Failed transfer is never reported as Cancelled or Complete.
class Transfer {
    /// The descriptor
    const TransferDescriptor _descriptor;
    /// The owning part
    JobPart& _jobPart;
    /// The status
    std::atomic<TransferStatus> _status;
    /// The finished chunks, including the skipped ones
    std::atomic<uint32_t> _chunksDone;
    /// The cancellation signal of this transfer
    utils::CancellationSource _cancellation;
    /// Was the transfer reported as done
    std::atomic<bool> _done;

    public:
    /// The constructor
    Transfer(TransferDescriptor descriptor, JobPart& jobPart);
    /// Delete copy
    Transfer(const Transfer&) = delete;
    /// Delete copy assignment
    Transfer& operator=(const Transfer&) = delete;

    /// The descriptor
    [[nodiscard]] const TransferDescriptor& descriptor() const { return _descriptor; }
    /// The owning part
    [[nodiscard]] JobPart& jobPart() const { return _jobPart; }
    /// The owning job
    [[nodiscard]] Job& job() const;
    /// The throughput counter of the job
    [[nodiscard]] ThroughputCounter& throughput() const;

    /// The status
    [[nodiscard]] TransferStatus status() const { return _status.load(std::memory_order_acquire); }
    /// Move the status forward, returns false if the transition is not allowed
    bool setStatus(TransferStatus status);
    /// The finished chunks
    [[nodiscard]] uint32_t chunksDone() const { return _chunksDone.load(std::memory_order_acquire); }
    /// Count a finished chunk and return the new count
    uint32_t chunkDone() { return _chunksDone.fetch_add(1, std::memory_order_acq_rel) + 1; }

    /// The token passed to every operation of the transfer
    [[nodiscard]] const utils::CancellationToken& token() const { return _cancellation.token(); }
    /// Was the transfer cancelled, also true after a failure
    [[nodiscard]] bool isCancelled() const { return _cancellation.isCancelled(); }
    /// Cancel the transfer, a running transfer becomes Cancelled
    void cancel();
    /// Fail the transfer and cancel its remaining chunks
    void fail();
    /// Report the transfer as done to its part, only the first call counts
    bool transferDone();
    /// Was the transfer reported as done
    [[nodiscard]] bool done() const { return _done.load(std::memory_order_acquire); }

    /// The minimum log level of the transfer
    [[nodiscard]] utils::LogLevel minimumLogLevel() const;
    /// Would a message of the level be logged
    [[nodiscard]] bool shouldLog(utils::LogLevel level) const;
    /// Log through the job logger, prefixed with source and destination
    void log(utils::LogLevel level, const std::string& message) const;
    /// The pipeline options for the destination handle of this transfer
    [[nodiscard]] cloud::PipelineOptions pipelineOptions() const;
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
