#pragma once
#include "cloud/block_blob.hpp"
#include "transfer/throughput.hpp"
#include "transfer/transfer.hpp"
#include "utils/log.hpp"
#include "utils/utils.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
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
namespace spdlog {
class logger;
} // namespace spdlog
//---------------------------------------------------------------------------
namespace blobcopy::transfer {
//---------------------------------------------------------------------------
/// The job identifier
using JobID = utils::UUID;
//---------------------------------------------------------------------------
/// The object level attributes of all blobs of a part
struct BlobAttributes {
    /// The content type, empty sniffs it from the source
    std::string contentType;
    /// The content encoding
    std::string contentEncoding;
    /// The user metadata
    cloud::Metadata metadata;

    /// Equality
    bool operator==(const BlobAttributes& other) const = default;
};
//---------------------------------------------------------------------------
/// A batch of transfers submitted together
struct JobPartOrder {
    /// The job
    JobID jobId;
    /// The part number
    uint32_t partNumber = 0;
    /// Is it the last part of the job
    bool isFinalPart = false;
    /// The minimum log level of the transfers
    utils::LogLevel logLevel = utils::LogLevel::Info;
    /// The blob attributes
    BlobAttributes blobAttributes;
    /// The transfers
    std::vector<TransferDescriptor> transfers;

    /// Equality
    bool operator==(const JobPartOrder& other) const = default;
};
//---------------------------------------------------------------------------
class Job;
//---------------------------------------------------------------------------
/// The transfers of one submitted part
class JobPart {
    /// The job
    Job& _job;
    /// The part number
    const uint32_t _partNumber;
    /// Is it the final part
    const bool _isFinalPart;
    /// The minimum log level
    const utils::LogLevel _logLevel;
    /// The blob attributes
    const BlobAttributes _blobAttributes;
    /// The transfers, fixed after construction
    std::vector<std::unique_ptr<Transfer>> _transfers;
    /// The transfers reported as done
    std::atomic<uint64_t> _transfersDone;

    public:
    /// The constructor normalizes block size and chunk count of every transfer
    JobPart(Job& job, JobPartOrder&& order, uint64_t defaultBlockSize);

    /// The job
    [[nodiscard]] Job& job() const { return _job; }
    /// The part number
    [[nodiscard]] uint32_t partNumber() const { return _partNumber; }
    /// Is it the final part
    [[nodiscard]] bool isFinalPart() const { return _isFinalPart; }
    /// The minimum log level
    [[nodiscard]] utils::LogLevel logLevel() const { return _logLevel; }
    /// The blob attributes
    [[nodiscard]] const BlobAttributes& blobAttributes() const { return _blobAttributes; }
    /// The transfers
    [[nodiscard]] const std::vector<std::unique_ptr<Transfer>>& transfers() const { return _transfers; }
    /// The transfers reported as done
    [[nodiscard]] uint64_t transfersDone() const { return _transfersDone.load(std::memory_order_acquire); }
    /// Are all transfers done
    [[nodiscard]] bool done() const { return transfersDone() == _transfers.size(); }

    /// Count a finished transfer
    void transferDone(const Transfer& transfer);
};
//---------------------------------------------------------------------------
/// A job collects the parts submitted under one id
class Job {
    /// The id
    const JobID _id;
    /// The logger of the job
    std::shared_ptr<spdlog::logger> _logger;
    /// The transferred bytes
    ThroughputCounter _throughput;
    /// Guards the parts and the pause state
    mutable std::mutex _mutex;
    /// The parts in submission order
    std::vector<std::unique_ptr<JobPart>> _parts;
    /// Was the final part submitted
    bool _finalPartOrdered;
    /// Is the job paused
    bool _paused;
    /// The transfers held back while paused
    std::vector<Transfer*> _held;
    /// Was the job cancelled
    std::atomic<bool> _cancelled;

    public:
    /// The constructor
    Job(JobID id, std::shared_ptr<spdlog::logger> logger);
    /// Delete copy
    Job(const Job&) = delete;
    /// Delete copy assignment
    Job& operator=(const Job&) = delete;

    /// The id
    [[nodiscard]] const JobID& id() const { return _id; }
    /// The logger
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const { return _logger; }
    /// The throughput counter
    [[nodiscard]] ThroughputCounter& throughput() { return _throughput; }

    /// Add a part, throws std::runtime_error for a duplicate part, a part after the final one or a cancelled job
    JobPart& addPart(JobPartOrder&& order, uint64_t defaultBlockSize);
    /// Visit every transfer in submission order
    template <typename Visitor>
    void forEachTransfer(Visitor&& visitor) const {
        std::lock_guard lock(_mutex);
        for (auto& part : _parts)
            for (auto& transfer : part->transfers())
                visitor(*transfer);
    }
    /// Was the final part submitted
    [[nodiscard]] bool finalPartOrdered() const;
    /// Are all parts submitted and all transfers done
    [[nodiscard]] bool done() const;

    /// Cancel every transfer, returns the transfers that were held back
    std::vector<Transfer*> cancel();
    /// Was the job cancelled
    [[nodiscard]] bool isCancelled() const { return _cancelled.load(std::memory_order_acquire); }
    /// Pause the job, throws std::runtime_error if cancelled
    void pause();
    /// Resume the job and return the held transfers, throws std::runtime_error if cancelled
    std::vector<Transfer*> resume();
    /// Is the job paused
    [[nodiscard]] bool isPaused() const;
    /// Hold the transfer back if the job is paused
    bool holdIfPaused(Transfer& transfer);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
