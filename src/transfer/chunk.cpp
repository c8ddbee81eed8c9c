#include "transfer/chunk.hpp"
#include <stdexcept>
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
vector<ChunkRange> computeChunkRanges(uint64_t sourceSize, uint64_t chunkSize)
// The chunk ranges
{
    if (!chunkSize)
        throw invalid_argument("chunk size must not be zero");
    auto numChunks = computeNumChunks(sourceSize, chunkSize);
    if (numChunks > UINT32_MAX)
        throw invalid_argument("too many chunks");

    vector<ChunkRange> ranges;
    ranges.reserve(numChunks);
    for (uint64_t startIndex = 0, index = 0; startIndex < sourceSize; startIndex += chunkSize, index++) {
        auto length = sourceSize - startIndex < chunkSize ? sourceSize - startIndex : chunkSize;
        ranges.push_back({static_cast<uint32_t>(index), startIndex, length});
    }
    return ranges;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
