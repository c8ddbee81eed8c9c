#pragma once
#include "cloud/block_blob.hpp"
#include "transfer/channel.hpp"
#include "transfer/chunk.hpp"
#include "utils/mapped_file.hpp"
#include <atomic>
#include <cstdint>
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
namespace blobcopy::transfer {
//---------------------------------------------------------------------------
namespace test {
class LocalToBlockBlobTester;
} // namespace test
//---------------------------------------------------------------------------
class Pacer;
class Transfer;
//---------------------------------------------------------------------------
/// Uploads one local file into a block blob.
/// The prologue maps the source and either uploads it in one request or emits one chunk per block onto the chunk channel.
/// Every chunk is counted exactly once, also when it is skipped, and the chunk that completes the count commits the block list
/// and releases the source. The chunks keep the controller alive through shared ownership.
class LocalToBlockBlob : public std::enable_shared_from_this<LocalToBlockBlob> {
    /// The transfer
    Transfer& _transfer;
    /// The destination factory
    cloud::BlockBlobFactory& _factory;
    /// The pacer
    Pacer& _pacer;
    /// The destination handle
    std::unique_ptr<cloud::BlockBlob> _blob;
    /// The mapped source
    utils::MappedFile _source;
    /// The block ids by chunk index
    std::vector<std::string> _blockIds;
    /// The number of chunks
    uint32_t _numChunks;
    /// The number of release calls
    std::atomic<unsigned> _releases;

    /// Open the destination and map the source, false on failure
    bool setup();
    /// Upload the whole source in one request
    void putBlob();
    /// Emit the chunks
    void scheduleChunks(Channel<ChunkMsg>& chunkChannel);
    /// Generate the closure of one chunk
    ChunkMsg generateUploadFunc(ChunkRange range);
    /// Stage one chunk
    ChunkOutcome stageChunk(const ChunkRange& range, unsigned workerId);
    /// Count a finished chunk, the last one runs the epilogue
    void chunkDone(const ChunkRange& range, ChunkOutcome outcome);
    /// Commit the block list
    void epilogue();
    /// Finish a cancelled or failed transfer without commit
    void finalizeCancelled();
    /// The object headers
    [[nodiscard]] cloud::BlobHeaders blobHeaders() const;
    /// Unmap and close the source
    void release();

    public:
    /// The constructor
    LocalToBlockBlob(Transfer& transfer, cloud::BlockBlobFactory& factory, Pacer& pacer);

    /// Run the prologue, blocks while the chunk channel is full
    void runPrologue(Channel<ChunkMsg>& chunkChannel);

    friend test::LocalToBlockBlobTester;
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
