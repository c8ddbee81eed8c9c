#pragma once
#include "transfer/channel.hpp"
#include "transfer/chunk.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
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
/// A unit of work on the transfer channel, runs a prologue
struct TransferMsg {
    /// Runs the prologue, emitting chunks onto the channel
    std::function<void(Channel<ChunkMsg>& chunkChannel)> runPrologue;
};
//---------------------------------------------------------------------------
/// The worker pool shared by all transfers of all jobs.
/// Chunk workers drain the bounded chunk channel, transfer workers run prologues which block while the chunk channel is full.
class WorkerPool {
    /// The capacity of the transfer channel
    static constexpr uint64_t transferChannelCapacity = 1ull << 16;

    /// The chunk channel
    Channel<ChunkMsg> _chunkChannel;
    /// The transfer channel
    Channel<TransferMsg> _transferChannel;
    /// The chunk workers
    std::vector<std::thread> _chunkWorkers;
    /// The transfer workers
    std::vector<std::thread> _transferWorkers;
    /// The logger
    std::shared_ptr<spdlog::logger> _logger;
    /// The number of executed chunks
    std::atomic<uint64_t> _executedChunks;
    /// Guards stop
    std::mutex _stopMutex;
    /// Was the pool stopped
    bool _stopped;

    /// The chunk worker loop
    void chunkWorker(unsigned workerId);
    /// The transfer worker loop
    void transferWorker(unsigned workerId);

    public:
    /// The constructor starts the workers
    WorkerPool(unsigned chunkWorkers, unsigned transferWorkers, uint64_t chunkChannelCapacity, std::shared_ptr<spdlog::logger> logger);
    /// Delete copy
    WorkerPool(const WorkerPool&) = delete;
    /// Delete copy assignment
    WorkerPool& operator=(const WorkerPool&) = delete;
    /// The destructor stops the workers
    ~WorkerPool();

    /// Schedule a chunk, blocks while the channel is full, false after stop
    bool scheduleChunk(ChunkMsg&& msg) { return _chunkChannel.send(std::move(msg)); }
    /// Schedule a prologue, false after stop
    bool scheduleTransfer(TransferMsg&& msg) { return _transferChannel.send(std::move(msg)); }
    /// Drain the queued work and join the workers
    void stop();

    /// The chunk channel
    [[nodiscard]] Channel<ChunkMsg>& chunkChannel() { return _chunkChannel; }
    /// The number of executed chunks
    [[nodiscard]] uint64_t executedChunks() const { return _executedChunks.load(); }
    /// The number of chunk workers
    [[nodiscard]] unsigned chunkWorkers() const { return static_cast<unsigned>(_chunkWorkers.size()); }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
