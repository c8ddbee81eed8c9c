#include "transfer/local_to_block_blob.hpp"
#include "cloud/content_type.hpp"
#include "network/body_source.hpp"
#include "transfer/job.hpp"
#include "transfer/pacer.hpp"
#include "transfer/transfer.hpp"
#include "utils/utils.hpp"
#include <cstring>
#include <exception>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>
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
using utils::LogLevel;
//---------------------------------------------------------------------------
LocalToBlockBlob::LocalToBlockBlob(Transfer& transfer, cloud::BlockBlobFactory& factory, Pacer& pacer) : _transfer(transfer), _factory(factory), _pacer(pacer), _numChunks(0), _releases(0)
// The constructor
{
}
//---------------------------------------------------------------------------
void LocalToBlockBlob::runPrologue(Channel<ChunkMsg>& chunkChannel)
// Turn the transfer into chunks
{
    auto& descriptor = _transfer.descriptor();
    if (_transfer.isCancelled()) {
        _transfer.log(LogLevel::Info, "cancelled before the transfer started");
        _transfer.transferDone();
        return;
    }
    _transfer.setStatus(TransferStatus::InProgress);

    if (!setup())
        return;

    if (descriptor.sourceSize == 0 || descriptor.sourceSize <= descriptor.blockSize) {
        putBlob();
        return;
    }
    scheduleChunks(chunkChannel);
}
//---------------------------------------------------------------------------
bool LocalToBlockBlob::setup()
// Open the destination and map the source
{
    auto& descriptor = _transfer.descriptor();
    try {
        _blob = _factory.open(descriptor.destination, _transfer.pipelineOptions());
        if (descriptor.sourceSize > 0)
            _source = utils::MappedFile::open(descriptor.source, descriptor.sourceSize);
        if (descriptor.sourceSize > descriptor.blockSize && computeNumChunks(descriptor.sourceSize, descriptor.blockSize) > cloud::BlockBlob::maxBlocks)
            throw runtime_error(fmt::format("{} blocks of {} bytes exceed the limit of {} blocks", computeNumChunks(descriptor.sourceSize, descriptor.blockSize), descriptor.blockSize, cloud::BlockBlob::maxBlocks));
    } catch (const exception& error) {
        _transfer.log(LogLevel::Error, fmt::format("failed to prepare the transfer: {}", error.what()));
        _transfer.fail();
        release();
        _transfer.transferDone();
        return false;
    }
    return true;
}
//---------------------------------------------------------------------------
cloud::BlobHeaders LocalToBlockBlob::blobHeaders() const
// Derive the object headers
{
    auto& attributes = _transfer.jobPart().blobAttributes();
    cloud::BlobHeaders headers;
    headers.contentType = attributes.contentType.empty() ? cloud::ContentType::detect(_source.view()) : attributes.contentType;
    headers.contentEncoding = attributes.contentEncoding;
    return headers;
}
//---------------------------------------------------------------------------
void LocalToBlockBlob::putBlob()
// Upload the whole source in one request
{
    auto& descriptor = _transfer.descriptor();
    auto& metadata = _transfer.jobPart().blobAttributes().metadata;
    cloud::BlobResult result;
    try {
        if (descriptor.sourceSize == 0) {
            result = _blob->upload(_transfer.token(), nullptr, blobHeaders(), metadata);
        } else {
            network::BufferSource whole(_source.view());
            PacedReader body(whole, _pacer, _transfer.token());
            result = _blob->upload(_transfer.token(), &body, blobHeaders(), metadata);
        }
    } catch (const exception& error) {
        result = {false, 0, error.what()};
    }

    if (!result.success) {
        if (_transfer.isCancelled()) {
            _transfer.log(LogLevel::Info, fmt::format("upload stopped by cancellation: {}", result.errorMessage));
        } else {
            _transfer.log(LogLevel::Info, fmt::format("upload failed with status {}: {}", result.statusCode, result.errorMessage));
            _transfer.setStatus(TransferStatus::Failed);
        }
    } else {
        _transfer.log(LogLevel::Info, fmt::format("uploaded {} bytes in one request", descriptor.sourceSize));
        _transfer.setStatus(TransferStatus::Complete);
    }

    if (descriptor.sourceSize != 0)
        _transfer.throughput().updateCurrentBytes(descriptor.sourceSize);
    release();
    _transfer.transferDone();
}
//---------------------------------------------------------------------------
void LocalToBlockBlob::scheduleChunks(Channel<ChunkMsg>& chunkChannel)
// Emit one chunk per block
{
    auto& descriptor = _transfer.descriptor();
    auto ranges = computeChunkRanges(descriptor.sourceSize, descriptor.blockSize);
    _numChunks = static_cast<uint32_t>(ranges.size());
    _blockIds.resize(_numChunks);
    _transfer.log(LogLevel::Debug, fmt::format("scheduling {} chunks of {} bytes", _numChunks, descriptor.blockSize));

    for (auto i = 0u; i < ranges.size(); i++) {
        if (chunkChannel.send(generateUploadFunc(ranges[i])))
            continue;
        // The engine stopped, the unsent chunks are counted as skipped
        _transfer.log(LogLevel::Warning, fmt::format("chunk channel closed after {} of {} chunks", i, _numChunks));
        _transfer.cancel();
        for (auto j = i; j < ranges.size(); j++)
            chunkDone(ranges[j], ChunkOutcome::Cancelled);
        return;
    }
}
//---------------------------------------------------------------------------
ChunkMsg LocalToBlockBlob::generateUploadFunc(ChunkRange range)
// The closure of one chunk
{
    return {[self = shared_from_this(), range](unsigned workerId) {
        auto outcome = self->stageChunk(range, workerId);
        self->chunkDone(range, outcome);
    }};
}
//---------------------------------------------------------------------------
ChunkOutcome LocalToBlockBlob::stageChunk(const ChunkRange& range, unsigned workerId)
// Stage one block
{
    if (_transfer.isCancelled()) {
        _transfer.log(LogLevel::Info, fmt::format("chunk {} skipped, the transfer was cancelled", range.index));
        return ChunkOutcome::Cancelled;
    }

    cloud::BlobResult result;
    try {
        auto id = utils::UUID::generate().toString();
        auto blockId = utils::base64Encode(reinterpret_cast<const uint8_t*>(id.data()), id.size());
        _blockIds[range.index] = blockId;
        network::BufferSource slice(_source.slice(range.offset, range.length));
        PacedReader body(slice, _pacer, _transfer.token());
        result = _blob->stageBlock(_transfer.token(), blockId, body);
    } catch (const exception& error) {
        result = {false, 0, error.what()};
    }
    if (!result.success) {
        if (_transfer.isCancelled()) {
            _transfer.log(LogLevel::Info, fmt::format("chunk {} stopped by cancellation: {}", range.index, result.errorMessage));
            return ChunkOutcome::Cancelled;
        }
        _transfer.log(LogLevel::Error, fmt::format("chunk {} failed on worker {} with status {}: {}", range.index, workerId, result.statusCode, result.errorMessage));
        _transfer.fail();
        return ChunkOutcome::Failed;
    }

    _transfer.throughput().updateCurrentBytes(range.length);
    _transfer.log(LogLevel::Debug, fmt::format("chunk {} staged on worker {}", range.index, workerId));
    return ChunkOutcome::Succeeded;
}
//---------------------------------------------------------------------------
void LocalToBlockBlob::chunkDone(const ChunkRange& range, ChunkOutcome outcome)
// Count the chunk, only the last one continues
{
    auto done = _transfer.chunkDone();
    if (done < _numChunks)
        return;
    // Publishes the block ids of all other chunks
    atomic_thread_fence(memory_order_acquire);

    _transfer.log(LogLevel::Debug, fmt::format("chunk {} completed the count of {} chunks", range.index, _numChunks));
    if (outcome == ChunkOutcome::Failed || _transfer.isCancelled()) {
        finalizeCancelled();
        return;
    }
    epilogue();
}
//---------------------------------------------------------------------------
void LocalToBlockBlob::epilogue()
// Commit the block list
{
    _transfer.log(LogLevel::Info, fmt::format("all {} chunks staged, committing the block list", _numChunks));
    cloud::BlobResult result;
    try {
        result = _blob->commitBlockList(_transfer.token(), _blockIds, blobHeaders(), _transfer.jobPart().blobAttributes().metadata);
    } catch (const exception& error) {
        result = {false, 0, error.what()};
    }
    if (!result.success) {
        _transfer.log(LogLevel::Error, fmt::format("commit failed with status {}: {}", result.statusCode, result.errorMessage));
        _transfer.setStatus(TransferStatus::Failed);
    } else {
        _transfer.log(LogLevel::Info, "block list committed");
        _transfer.setStatus(TransferStatus::Complete);
    }
    release();
    _transfer.transferDone();
}
//---------------------------------------------------------------------------
void LocalToBlockBlob::finalizeCancelled()
// Finish without commit
{
    _transfer.log(LogLevel::Info, fmt::format("transfer finished as {} without commit", toString(_transfer.status())));
    release();
    _transfer.transferDone();
}
//---------------------------------------------------------------------------
void LocalToBlockBlob::release()
// Unmap and close the source
{
    _releases.fetch_add(1);
    _source.unmap();
    if (auto error = _source.close())
        _transfer.log(LogLevel::Error, fmt::format("failed to close the source: {}", strerror(error)));
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
