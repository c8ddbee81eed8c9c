#include "transfer/local_to_block_blob.hpp"
#include "../temp_file.hpp"
#include "fake_block_blob.hpp"
#include "transfer/job.hpp"
#include "transfer/pacer.hpp"
#include "transfer/worker_pool.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>
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
// Helper to inspect a controller and drive it without the engine
class LocalToBlockBlobTester {
    public:
    /// The store
    FakeStore store;
    /// The factory
    FakeBlockBlobFactory factory{store};
    /// The pacer
    Pacer pacer{0};
    /// The job
    Job job{JobID::generate(), utils::Log::makeLogger("local_to_block_blob_test", {make_shared<spdlog::sinks::null_sink_mt>()}, utils::LogLevel::Debug)};

    /// Add a part with one transfer
    Transfer& addTransfer(const string& source, uint64_t size, uint64_t blockSize, const string& destination = "https://acc.blob.core.windows.net/data/object") {
        JobPartOrder order;
        order.jobId = job.id();
        order.partNumber = nextPart++;
        order.logLevel = utils::LogLevel::Debug;
        order.blobAttributes.metadata = {{"origin", "test"}};
        order.transfers.push_back({source, destination, size, blockSize, 0});
        return *job.addPart(move(order), 1024).transfers().front();
    }
    /// Create a controller
    shared_ptr<LocalToBlockBlob> controller(Transfer& transfer) {
        return make_shared<LocalToBlockBlob>(transfer, factory, pacer);
    }

    static unsigned releases(const LocalToBlockBlob& controller) { return controller._releases.load(); }
    static const vector<string>& blockIds(const LocalToBlockBlob& controller) { return controller._blockIds; }
    static bool sourceReleased(const LocalToBlockBlob& controller) { return !controller._source.mapped() && !controller._source.isOpen(); }

    private:
    uint32_t nextPart = 0;
};
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_small_object") {
    LocalToBlockBlobTester tester;
    auto content = blobcopy::test::TempFile::pattern(100);
    blobcopy::test::TempFile file(content);
    auto& transfer = tester.addTransfer(file.path(), content.size(), 100);
    auto controller = tester.controller(transfer);

    Channel<ChunkMsg> chunks(4);
    controller->runPrologue(chunks);

    REQUIRE(chunks.size() == 0);
    REQUIRE(transfer.status() == TransferStatus::Complete);
    REQUIRE(transfer.done());
    REQUIRE(tester.store.uploadCalls == 1);
    REQUIRE(tester.store.stageCalls == 0);
    REQUIRE(tester.store.commitCalls == 0);
    REQUIRE(tester.store.object(transfer.descriptor().destination) == content);
    REQUIRE(tester.store.headers[transfer.descriptor().destination].contentType == "text/plain; charset=utf-8");
    REQUIRE(tester.store.metadata[transfer.descriptor().destination].at("origin") == "test");
    REQUIRE(tester.job.throughput().bytes() == 100);
    REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
    REQUIRE(LocalToBlockBlobTester::sourceReleased(*controller));
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_empty_object") {
    LocalToBlockBlobTester tester;
    blobcopy::test::TempFile file("");
    auto& transfer = tester.addTransfer(file.path(), 0, 100);
    REQUIRE(transfer.descriptor().numChunks == 0);
    auto controller = tester.controller(transfer);

    Channel<ChunkMsg> chunks(4);
    controller->runPrologue(chunks);

    REQUIRE(transfer.status() == TransferStatus::Complete);
    REQUIRE(tester.store.uploadCalls == 1);
    REQUIRE(tester.store.object(transfer.descriptor().destination).empty());
    REQUIRE(tester.store.headers[transfer.descriptor().destination].contentType == "application/octet-stream");
    REQUIRE(tester.job.throughput().bytes() == 0);
    REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_chunks_out_of_order") {
    LocalToBlockBlobTester tester;
    auto content = blobcopy::test::TempFile::pattern(250);
    blobcopy::test::TempFile file(content);
    auto& transfer = tester.addTransfer(file.path(), content.size(), 100);
    REQUIRE(transfer.descriptor().numChunks == 3);
    auto controller = tester.controller(transfer);

    Channel<ChunkMsg> chunks(4);
    controller->runPrologue(chunks);
    REQUIRE(chunks.size() == 3);
    REQUIRE(transfer.status() == TransferStatus::InProgress);

    vector<ChunkMsg> msgs;
    while (chunks.size())
        msgs.push_back(move(*chunks.receive()));

    // The last executed chunk commits, whatever its index
    reverse(msgs.begin(), msgs.end());
    for (auto i = 0u; i < msgs.size(); i++) {
        REQUIRE(tester.store.commitCalls == 0);
        REQUIRE(!transfer.done());
        msgs[i].doTransfer(i);
    }
    REQUIRE(tester.store.commitCalls == 1);
    REQUIRE(transfer.chunksDone() == 3);
    REQUIRE(transfer.status() == TransferStatus::Complete);
    REQUIRE(transfer.done());
    REQUIRE(tester.store.object(transfer.descriptor().destination) == content);
    REQUIRE(tester.job.throughput().bytes() == 250);

    auto& ids = LocalToBlockBlobTester::blockIds(*controller);
    REQUIRE(ids.size() == 3);
    REQUIRE(set<string>(ids.begin(), ids.end()).size() == 3);
    REQUIRE(tester.store.staged[ids[0]] == content.substr(0, 100));
    REQUIRE(tester.store.staged[ids[2]] == content.substr(200, 50));

    REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
    REQUIRE(LocalToBlockBlobTester::sourceReleased(*controller));
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_worker_pool") {
    LocalToBlockBlobTester tester;
    tester.store.stageJitterMs = 5;
    auto content = blobcopy::test::TempFile::pattern(64 * 1024 + 17);
    blobcopy::test::TempFile file(content);
    auto& transfer = tester.addTransfer(file.path(), content.size(), 1024);
    auto controller = tester.controller(transfer);

    {
        WorkerPool pool(8, 1, 4, tester.job.logger());
        REQUIRE(pool.scheduleTransfer({[controller](Channel<ChunkMsg>& chunks) { controller->runPrologue(chunks); }}));
        pool.stop();
    }
    REQUIRE(transfer.status() == TransferStatus::Complete);
    REQUIRE(transfer.chunksDone() == 65);
    REQUIRE(tester.store.stageCalls == 65);
    REQUIRE(tester.store.commitCalls == 1);
    REQUIRE(tester.store.object(transfer.descriptor().destination) == content);
    REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_fail_fast") {
    LocalToBlockBlobTester tester;
    tester.store.failStageCall = 1;
    auto content = blobcopy::test::TempFile::pattern(1000);
    blobcopy::test::TempFile file(content);
    auto& transfer = tester.addTransfer(file.path(), content.size(), 100);
    auto controller = tester.controller(transfer);

    Channel<ChunkMsg> chunks(16);
    controller->runPrologue(chunks);
    auto worker = 0u;
    while (chunks.size())
        chunks.receive()->doTransfer(worker++);

    // The remaining chunks are skipped but still counted
    REQUIRE(tester.store.stageCalls == 1);
    REQUIRE(transfer.chunksDone() == 10);
    REQUIRE(transfer.status() == TransferStatus::Failed);
    REQUIRE(transfer.isCancelled());
    REQUIRE(transfer.done());
    REQUIRE(tester.store.commitCalls == 0);
    REQUIRE(!tester.store.exists(transfer.descriptor().destination));
    REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_commit_failure") {
    LocalToBlockBlobTester tester;
    tester.store.failCommit = true;
    auto content = blobcopy::test::TempFile::pattern(300);
    blobcopy::test::TempFile file(content);
    auto& transfer = tester.addTransfer(file.path(), content.size(), 100);
    auto controller = tester.controller(transfer);

    Channel<ChunkMsg> chunks(16);
    controller->runPrologue(chunks);
    while (chunks.size())
        chunks.receive()->doTransfer(0);

    REQUIRE(tester.store.commitCalls == 1);
    REQUIRE(transfer.status() == TransferStatus::Failed);
    REQUIRE(transfer.done());
    REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_throwing_destination") {
    LocalToBlockBlobTester tester;
    tester.store.throwCommit = true;
    tester.store.throwUpload = true;
    auto content = blobcopy::test::TempFile::pattern(250);
    blobcopy::test::TempFile file(content);
    auto& small = tester.addTransfer(file.path(), 50, 100, "https://acc.blob.core.windows.net/data/small");
    auto& chunked = tester.addTransfer(file.path(), content.size(), 100, "https://acc.blob.core.windows.net/data/chunked");
    auto smallController = tester.controller(small);
    auto chunkedController = tester.controller(chunked);

    {
        WorkerPool pool(4, 2, 16, tester.job.logger());
        REQUIRE(pool.scheduleTransfer({[smallController](Channel<ChunkMsg>& chunks) { smallController->runPrologue(chunks); }}));
        REQUIRE(pool.scheduleTransfer({[chunkedController](Channel<ChunkMsg>& chunks) { chunkedController->runPrologue(chunks); }}));
        pool.stop();
    }

    REQUIRE(tester.store.uploadCalls == 1);
    REQUIRE(small.status() == TransferStatus::Failed);
    REQUIRE(small.done());
    REQUIRE(LocalToBlockBlobTester::releases(*smallController) == 1);

    REQUIRE(tester.store.commitCalls == 1);
    REQUIRE(chunked.chunksDone() == 3);
    REQUIRE(chunked.status() == TransferStatus::Failed);
    REQUIRE(chunked.done());
    REQUIRE(LocalToBlockBlobTester::releases(*chunkedController) == 1);
    REQUIRE(small.jobPart().done());
    REQUIRE(chunked.jobPart().done());
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_cancel_mid_flight") {
    LocalToBlockBlobTester tester;
    tester.store.blockStages = true;
    auto content = blobcopy::test::TempFile::pattern(4096);
    blobcopy::test::TempFile file(content);
    auto& transfer = tester.addTransfer(file.path(), content.size(), 512);
    auto controller = tester.controller(transfer);

    WorkerPool pool(2, 1, 16, tester.job.logger());
    REQUIRE(pool.scheduleTransfer({[controller](Channel<ChunkMsg>& chunks) { controller->runPrologue(chunks); }}));
    auto deadline = chrono::steady_clock::now() + chrono::seconds(10);
    while (tester.store.stageCalls < 2 && chrono::steady_clock::now() < deadline)
        this_thread::sleep_for(chrono::milliseconds(1));
    REQUIRE(tester.store.stageCalls == 2);
    REQUIRE(transfer.status() == TransferStatus::InProgress);

    transfer.cancel();
    pool.stop();

    REQUIRE(transfer.status() == TransferStatus::Cancelled);
    REQUIRE(transfer.chunksDone() == 8);
    REQUIRE(tester.store.stageCalls == 2);
    REQUIRE(tester.store.commitCalls == 0);
    REQUIRE(transfer.done());
    REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_cancel_before_start") {
    LocalToBlockBlobTester tester;
    auto content = blobcopy::test::TempFile::pattern(300);
    blobcopy::test::TempFile file(content);
    auto& transfer = tester.addTransfer(file.path(), content.size(), 100);
    auto controller = tester.controller(transfer);

    transfer.cancel();
    Channel<ChunkMsg> chunks(16);
    controller->runPrologue(chunks);

    REQUIRE(chunks.size() == 0);
    REQUIRE(tester.store.openCalls == 0);
    REQUIRE(transfer.status() == TransferStatus::Cancelled);
    REQUIRE(transfer.done());
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_closed_channel") {
    LocalToBlockBlobTester tester;
    auto content = blobcopy::test::TempFile::pattern(300);
    blobcopy::test::TempFile file(content);
    auto& transfer = tester.addTransfer(file.path(), content.size(), 100);
    auto controller = tester.controller(transfer);

    Channel<ChunkMsg> chunks(16);
    chunks.close();
    controller->runPrologue(chunks);

    REQUIRE(transfer.status() == TransferStatus::Cancelled);
    REQUIRE(transfer.chunksDone() == 3);
    REQUIRE(tester.store.stageCalls == 0);
    REQUIRE(transfer.done());
    REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("local_to_block_blob_setup_failure") {
    LocalToBlockBlobTester tester;
    auto content = blobcopy::test::TempFile::pattern(300);
    blobcopy::test::TempFile file(content);

    SECTION("invalid destination") {
        auto& transfer = tester.addTransfer(file.path(), content.size(), 100, "invalid://object");
        auto controller = tester.controller(transfer);
        Channel<ChunkMsg> chunks(16);
        controller->runPrologue(chunks);
        REQUIRE(transfer.status() == TransferStatus::Failed);
        REQUIRE(transfer.done());
        REQUIRE(chunks.size() == 0);
        REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
    }
    SECTION("missing source") {
        auto& transfer = tester.addTransfer(file.path() + ".missing", content.size(), 100);
        auto controller = tester.controller(transfer);
        Channel<ChunkMsg> chunks(16);
        controller->runPrologue(chunks);
        REQUIRE(transfer.status() == TransferStatus::Failed);
        REQUIRE(transfer.done());
        REQUIRE(tester.store.stageCalls == 0);
        REQUIRE(LocalToBlockBlobTester::releases(*controller) == 1);
    }
    SECTION("too many blocks") {
        blobcopy::test::TempFile large(blobcopy::test::TempFile::pattern(cloud::BlockBlob::maxBlocks + 1));
        auto& transfer = tester.addTransfer(large.path(), cloud::BlockBlob::maxBlocks + 1, 1);
        auto controller = tester.controller(transfer);
        Channel<ChunkMsg> chunks(16);
        controller->runPrologue(chunks);
        REQUIRE(transfer.status() == TransferStatus::Failed);
        REQUIRE(tester.store.openCalls == 1);
        REQUIRE(chunks.size() == 0);
        REQUIRE(LocalToBlockBlobTester::sourceReleased(*controller));
    }
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer::test
