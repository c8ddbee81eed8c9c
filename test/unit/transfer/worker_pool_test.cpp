#include "transfer/channel.hpp"
#include "transfer/worker_pool.hpp"
#include "utils/log.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <catch2/catch.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::transfer::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static shared_ptr<spdlog::logger> nullLogger() {
    return utils::Log::makeLogger("worker_pool_test", {make_shared<spdlog::sinks::null_sink_mt>()}, utils::LogLevel::Debug);
}
//---------------------------------------------------------------------------
TEST_CASE("channel") {
    Channel<int> channel(2);
    REQUIRE(channel.capacity() == 2);
    REQUIRE(channel.trySend(1));
    REQUIRE(channel.trySend(2));
    REQUIRE(!channel.trySend(3));
    REQUIRE(channel.size() == 2);

    // A blocked sender continues once a slot is free
    atomic<bool> sent(false);
    thread sender([&] {
        channel.send(3);
        sent = true;
    });
    this_thread::sleep_for(chrono::milliseconds(50));
    REQUIRE(!sent);
    REQUIRE(*channel.receive() == 1);
    sender.join();
    REQUIRE(sent);

    channel.close();
    REQUIRE(!channel.send(4));
    REQUIRE(*channel.receive() == 2);
    REQUIRE(*channel.receive() == 3);
    REQUIRE(!channel.receive());
}
//---------------------------------------------------------------------------
TEST_CASE("worker_pool") {
    WorkerPool pool(4, 2, 8, nullLogger());
    REQUIRE(pool.chunkWorkers() == 4);

    atomic<uint64_t> executed(0);
    atomic<uint64_t> prologues(0);
    atomic<uint64_t> rejected(0);
    for (auto i = 0; i < 10; i++) {
        REQUIRE(pool.scheduleTransfer({[&](Channel<ChunkMsg>& chunks) {
            prologues++;
            // Emitting more chunks than the channel holds blocks until workers drain it
            for (auto k = 0; k < 20; k++)
                if (!chunks.send({[&](unsigned workerId) {
                        if (workerId < 4)
                            executed++;
                    }}))
                    rejected++;
        }}));
    }
    pool.stop();
    REQUIRE(prologues == 10);
    REQUIRE(rejected == 0);
    REQUIRE(executed == 200);
    REQUIRE(pool.executedChunks() == 200);
    REQUIRE(!pool.scheduleChunk({[](unsigned) {}}));
    REQUIRE(!pool.scheduleTransfer({[](Channel<ChunkMsg>&) {}}));
}
//---------------------------------------------------------------------------
TEST_CASE("worker_pool_failures") {
    WorkerPool pool(1, 1, 4, nullLogger());
    atomic<uint64_t> executed(0);
    REQUIRE(pool.scheduleTransfer({[](Channel<ChunkMsg>&) { throw runtime_error("prologue"); }}));
    REQUIRE(pool.scheduleChunk({[](unsigned) { throw runtime_error("chunk"); }}));
    REQUIRE(pool.scheduleChunk({[&](unsigned) { executed++; }}));
    pool.stop();
    REQUIRE(executed == 1);
    REQUIRE(pool.executedChunks() == 2);
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer::test
