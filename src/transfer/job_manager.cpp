#include "transfer/job_manager.hpp"
#include "transfer/local_to_block_blob.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>
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
using namespace std;
//---------------------------------------------------------------------------
JobManager::JobManager(Config config, shared_ptr<cloud::BlockBlobFactory> factory, shared_ptr<spdlog::logger> logger) : _config(move(config)), _factory(move(factory)), _logger(move(logger)), _pacer(_config.pacerBytesPerSecond())
// The constructor
{
    _config.validate();
    _pool = make_unique<WorkerPool>(_config.chunkWorkers, _config.transferWorkers, _config.chunkChannelCapacity, _logger);
    if (_pacer.unlimited())
        _logger->info("engine started with {} chunk workers, bandwidth unlimited", _config.chunkWorkers);
    else
        _logger->info("engine started with {} chunk workers, bandwidth {} Mbit/s", _config.chunkWorkers, _config.bandwidthMbps);
}
//---------------------------------------------------------------------------
JobManager::~JobManager()
// The destructor
{
    for (auto& id : listJobs()) {
        if (!jobDone(id))
            cancelJob(id);
    }
    _pool->stop();
}
//---------------------------------------------------------------------------
Job& JobManager::findJob(const JobID& jobId) const
// Find a job
{
    lock_guard lock(_mutex);
    auto it = _jobs.find(jobId);
    if (it == _jobs.end())
        throw runtime_error("no job with id " + jobId.toString());
    return *it->second;
}
//---------------------------------------------------------------------------
void JobManager::submitJobPart(JobPartOrder&& order)
// Submit a part
{
    if (order.jobId.empty())
        throw runtime_error("the job id must not be empty");

    JobPart* part;
    {
        lock_guard lock(_mutex);
        auto it = _jobs.find(order.jobId);
        if (it != _jobs.end()) {
            part = &it->second->addPart(move(order), _config.defaultBlockSize);
        } else {
            auto id = order.jobId;
            auto job = make_unique<Job>(id, utils::Log::makeJobLogger(id.toString(), _config.logDirectory, _config.logLevel));
            part = &job->addPart(move(order), _config.defaultBlockSize);
            _jobs.emplace(id, move(job));
            _jobOrder.push_back(id);
            _logger->info("job {} created", id.toString());
        }
    }
    for (auto& transfer : part->transfers())
        schedule(*transfer);
}
//---------------------------------------------------------------------------
void JobManager::schedule(Transfer& transfer)
// Queue the prologue
{
    auto scheduled = _pool->scheduleTransfer({[this, &transfer](Channel<ChunkMsg>& chunkChannel) { runTransfer(transfer, chunkChannel); }});
    if (!scheduled) {
        transfer.log(utils::LogLevel::Warning, "the engine is stopped, the transfer is cancelled");
        transfer.cancel();
        transfer.transferDone();
    }
}
//---------------------------------------------------------------------------
void JobManager::runTransfer(Transfer& transfer, Channel<ChunkMsg>& chunkChannel)
// Run the prologue
{
    if (transfer.job().holdIfPaused(transfer)) {
        transfer.log(utils::LogLevel::Debug, "held back, the job is paused");
        return;
    }
    auto controller = make_shared<LocalToBlockBlob>(transfer, *_factory, _pacer);
    controller->runPrologue(chunkChannel);
}
//---------------------------------------------------------------------------
vector<JobID> JobManager::listJobs() const
// The jobs
{
    lock_guard lock(_mutex);
    return _jobOrder;
}
//---------------------------------------------------------------------------
JobProgressSummary JobManager::progressSummary(const JobID& jobId)
// The progress of a job
{
    auto& job = findJob(jobId);
    JobProgressSummary summary;
    summary.jobId = jobId;
    summary.completeJobOrdered = job.finalPartOrdered();
    job.forEachTransfer([&summary](const Transfer& transfer) {
        summary.totalTransfers++;
        switch (transfer.status()) {
            case TransferStatus::Complete: summary.transfersCompleted++; break;
            case TransferStatus::Failed:
                summary.transfersFailed++;
                summary.failedTransfers.push_back({transfer.descriptor().source, transfer.descriptor().destination, TransferStatus::Failed});
                break;
            case TransferStatus::Cancelled: summary.transfersCancelled++; break;
            default: break;
        }
    });
    if (summary.totalTransfers)
        summary.percentageProgress = 100.0 * static_cast<double>(summary.transfersCompleted + summary.transfersFailed + summary.transfersCancelled) / static_cast<double>(summary.totalTransfers);
    summary.bytesTransferred = job.throughput().bytes();
    summary.throughputMbps = job.throughput().snapshotMbps();
    return summary;
}
//---------------------------------------------------------------------------
vector<TransferDetail> JobManager::listTransfers(const JobID& jobId, TransferStatus status) const
// The transfers with a status
{
    if (status == TransferStatus::Invalid)
        throw runtime_error("invalid transfer status");
    vector<TransferDetail> details;
    findJob(jobId).forEachTransfer([&details, status](const Transfer& transfer) {
        if (transfer.status() == status)
            details.push_back({transfer.descriptor().source, transfer.descriptor().destination, status});
    });
    return details;
}
//---------------------------------------------------------------------------
void JobManager::cancelJob(const JobID& jobId)
// Cancel a job
{
    auto held = findJob(jobId).cancel();
    // Held transfers never ran their prologue
    for (auto transfer : held)
        transfer->transferDone();
}
//---------------------------------------------------------------------------
void JobManager::pauseJob(const JobID& jobId)
// Pause a job
{
    findJob(jobId).pause();
}
//---------------------------------------------------------------------------
void JobManager::resumeJob(const JobID& jobId)
// Resume a job
{
    for (auto transfer : findJob(jobId).resume())
        schedule(*transfer);
}
//---------------------------------------------------------------------------
bool JobManager::jobDone(const JobID& jobId) const
// Is the job done
{
    return findJob(jobId).done();
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
