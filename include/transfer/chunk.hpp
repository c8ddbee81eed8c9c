#pragma once
#include <cstdint>
#include <functional>
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
/// The byte range of one chunk
struct ChunkRange {
    /// The chunk index
    uint32_t index;
    /// The byte offset
    uint64_t offset;
    /// The byte length
    uint64_t length;

    /// Equality
    bool operator==(const ChunkRange& other) const = default;
};
//---------------------------------------------------------------------------
/// The outcome of one chunk execution
enum class ChunkOutcome : uint8_t {
    /// Skipped or interrupted by the cancellation of the transfer
    Cancelled,
    /// Hard failure, the transfer is cancelled
    Failed,
    /// Staged
    Succeeded
};
//---------------------------------------------------------------------------
/// A unit of work on the chunk channel
struct ChunkMsg {
    /// Executes the chunk on the given worker
    std::function<void(unsigned workerId)> doTransfer;
};
//---------------------------------------------------------------------------
/// The number of chunks, ceil(sourceSize / chunkSize)
constexpr uint64_t computeNumChunks(uint64_t sourceSize, uint64_t chunkSize) {
    return chunkSize ? (sourceSize + chunkSize - 1) / chunkSize : 0;
}
//---------------------------------------------------------------------------
/// The ranges tiling [0, sourceSize) in index order, the last one may be shorter
std::vector<ChunkRange> computeChunkRanges(uint64_t sourceSize, uint64_t chunkSize);
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
