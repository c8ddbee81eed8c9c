#include "transfer/worker_pool.hpp"
#include <exception>
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
WorkerPool::WorkerPool(unsigned chunkWorkers, unsigned transferWorkers, uint64_t chunkChannelCapacity, shared_ptr<spdlog::logger> logger) : _chunkChannel(chunkChannelCapacity), _transferChannel(transferChannelCapacity), _logger(move(logger)), _executedChunks(0), _stopped(false)
// Starts the workers
{
    _chunkWorkers.reserve(chunkWorkers);
    for (auto i = 0u; i < chunkWorkers; i++)
        _chunkWorkers.emplace_back(&WorkerPool::chunkWorker, this, i);
    _transferWorkers.reserve(transferWorkers);
    for (auto i = 0u; i < transferWorkers; i++)
        _transferWorkers.emplace_back(&WorkerPool::transferWorker, this, i);
    _logger->debug("started {} chunk workers and {} transfer workers", chunkWorkers, transferWorkers);
}
//---------------------------------------------------------------------------
WorkerPool::~WorkerPool()
// The destructor
{
    stop();
}
//---------------------------------------------------------------------------
void WorkerPool::chunkWorker(unsigned workerId)
// Executes chunks until the channel is closed and drained
{
    while (auto msg = _chunkChannel.receive()) {
        try {
            msg->doTransfer(workerId);
        } catch (const exception& error) {
            _logger->error("chunk worker {}: unexpected failure: {}", workerId, error.what());
        }
        _executedChunks.fetch_add(1);
    }
}
//---------------------------------------------------------------------------
void WorkerPool::transferWorker(unsigned workerId)
// Runs prologues until the channel is closed and drained
{
    while (auto msg = _transferChannel.receive()) {
        try {
            msg->runPrologue(_chunkChannel);
        } catch (const exception& error) {
            _logger->error("transfer worker {}: unexpected failure: {}", workerId, error.what());
        }
    }
}
//---------------------------------------------------------------------------
void WorkerPool::stop()
// Drains and joins
{
    lock_guard lock(_stopMutex);
    if (_stopped)
        return;
    _stopped = true;

    // Prologues still emit chunks, so the chunk channel closes after the transfer workers are done
    _transferChannel.close();
    for (auto& worker : _transferWorkers)
        worker.join();
    _chunkChannel.close();
    for (auto& worker : _chunkWorkers)
        worker.join();
    _logger->debug("worker pool stopped after {} chunks", executedChunks());
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
