#include "transfer/pacer.hpp"
#include <algorithm>
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
using namespace std::chrono;
//---------------------------------------------------------------------------
Pacer::Pacer(uint64_t bytesPerSecond) : _bytesPerSecond(bytesPerSecond), _available(0), _last(steady_clock::now())
// The constructor
{
}
//---------------------------------------------------------------------------
void Pacer::acquire(uint64_t bytes, const utils::CancellationToken& token)
// Take bytes and sleep off the deficit
{
    if (unlimited() || !bytes)
        return;

    double deficit;
    {
        lock_guard lock(_mutex);
        auto now = steady_clock::now();
        auto elapsed = duration<double>(now - _last).count();
        _last = now;
        _available = min(_available + elapsed * static_cast<double>(_bytesPerSecond), static_cast<double>(_bytesPerSecond));
        _available -= static_cast<double>(bytes);
        deficit = _available < 0 ? -_available : 0;
    }
    if (deficit > 0)
        token.waitFor(duration<double>(deficit / static_cast<double>(_bytesPerSecond)));
}
//---------------------------------------------------------------------------
span<const uint8_t> PacedReader::next(uint64_t maxLength)
// The next paced piece
{
    auto piece = _source.next(min(maxLength, pieceSize));
    _pacer.acquire(piece.size(), _token);
    return piece;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
