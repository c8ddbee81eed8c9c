#pragma once
#include "cloud/block_blob.hpp"
#include "transfer/config.hpp"
#include "transfer/job.hpp"
#include "transfer/pacer.hpp"
#include "transfer/transfer_status.hpp"
#include "transfer/worker_pool.hpp"
#include <cstdint>
#include <map>
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
namespace blobcopy::transfer {
//---------------------------------------------------------------------------
/// A transfer as listed to clients
struct TransferDetail {
    /// The source
    std::string src;
    /// The destination
    std::string dst;
    /// The status
    TransferStatus transferStatus = TransferStatus::NotStarted;

    /// Equality
    bool operator==(const TransferDetail& other) const = default;
};
//---------------------------------------------------------------------------
/// The progress of a job
struct JobProgressSummary {
    /// The job
    JobID jobId;
    /// All transfers of the submitted parts
    uint64_t totalTransfers = 0;
    /// The completed transfers
    uint64_t transfersCompleted = 0;
    /// The failed transfers
    uint64_t transfersFailed = 0;
    /// The cancelled transfers
    uint64_t transfersCancelled = 0;
    /// Was the final part submitted
    bool completeJobOrdered = false;
    /// Finished transfers in percent
    double percentageProgress = 0;
    /// The transferred bytes
    uint64_t bytesTransferred = 0;
    /// The rate since the previous summary in Mbit/s
    double throughputMbps = 0;
    /// The failed transfers
    std::vector<TransferDetail> failedTransfers;
};
//---------------------------------------------------------------------------
/// Owns the jobs, the pacer and the worker pool of the engine.
/// Unknown jobs and rejected orders are reported with std::runtime_error.
class JobManager {
    /// The config
    const Config _config;
    /// The destination factory
    std::shared_ptr<cloud::BlockBlobFactory> _factory;
    /// The engine logger
    std::shared_ptr<spdlog::logger> _logger;
    /// The pacer
    Pacer _pacer;
    /// Guards the jobs
    mutable std::mutex _mutex;
    /// The jobs
    std::map<JobID, std::unique_ptr<Job>> _jobs;
    /// The job ids in submission order
    std::vector<JobID> _jobOrder;
    /// The workers, stopped before everything else is destroyed
    std::unique_ptr<WorkerPool> _pool;

    /// Find a job, throws std::runtime_error
    Job& findJob(const JobID& jobId) const;
    /// Queue the prologue of a transfer
    void schedule(Transfer& transfer);
    /// Run the prologue unless the job is paused
    void runTransfer(Transfer& transfer, Channel<ChunkMsg>& chunkChannel);

    public:
    /// The constructor starts the workers, throws std::invalid_argument for an invalid config
    JobManager(Config config, std::shared_ptr<cloud::BlockBlobFactory> factory, std::shared_ptr<spdlog::logger> logger = utils::Log::engine());
    /// Delete copy
    JobManager(const JobManager&) = delete;
    /// Delete copy assignment
    JobManager& operator=(const JobManager&) = delete;
    /// The destructor cancels unfinished jobs and stops the workers
    ~JobManager();

    /// Submit a part and schedule its transfers
    void submitJobPart(JobPartOrder&& order);
    /// The jobs in submission order
    [[nodiscard]] std::vector<JobID> listJobs() const;
    /// The progress of a job
    [[nodiscard]] JobProgressSummary progressSummary(const JobID& jobId);
    /// The transfers of a job with the given status
    [[nodiscard]] std::vector<TransferDetail> listTransfers(const JobID& jobId, TransferStatus status) const;
    /// Cancel a job
    void cancelJob(const JobID& jobId);
    /// Pause a job
    void pauseJob(const JobID& jobId);
    /// Resume a job
    void resumeJob(const JobID& jobId);
    /// Are all transfers of a completely ordered job done
    [[nodiscard]] bool jobDone(const JobID& jobId) const;

    /// The config
    [[nodiscard]] const Config& config() const { return _config; }
    /// The pacer
    [[nodiscard]] Pacer& pacer() { return _pacer; }
    /// The worker pool
    [[nodiscard]] WorkerPool& pool() { return *_pool; }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
