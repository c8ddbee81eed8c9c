#include "transfer/job.hpp"
#include "transfer/chunk.hpp"
#include <algorithm>
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
JobPart::JobPart(Job& job, JobPartOrder&& order, uint64_t defaultBlockSize) : _job(job), _partNumber(order.partNumber), _isFinalPart(order.isFinalPart), _logLevel(order.logLevel), _blobAttributes(move(order.blobAttributes)), _transfersDone(0)
// The constructor
{
    _transfers.reserve(order.transfers.size());
    for (auto& descriptor : order.transfers) {
        if (!descriptor.blockSize)
            descriptor.blockSize = defaultBlockSize;
        // The client value is not trusted
        auto numChunks = computeNumChunks(descriptor.sourceSize, descriptor.blockSize);
        descriptor.numChunks = static_cast<uint32_t>(min<uint64_t>(numChunks, UINT32_MAX));
        _transfers.push_back(make_unique<Transfer>(move(descriptor), *this));
    }
}
//---------------------------------------------------------------------------
void JobPart::transferDone(const Transfer& transfer)
// Count a finished transfer
{
    auto done = _transfersDone.fetch_add(1, memory_order_acq_rel) + 1;
    _job.logger()->debug("part {}: {} finished with status {} ({}/{})", _partNumber, transfer.descriptor().source, toString(transfer.status()), done, _transfers.size());
    if (done == _transfers.size())
        _job.logger()->info("part {}: all {} transfers finished", _partNumber, _transfers.size());
}
//---------------------------------------------------------------------------
Job::Job(JobID id, shared_ptr<spdlog::logger> logger) : _id(id), _logger(move(logger)), _throughput(), _finalPartOrdered(false), _paused(false), _cancelled(false)
// The constructor
{
}
//---------------------------------------------------------------------------
JobPart& Job::addPart(JobPartOrder&& order, uint64_t defaultBlockSize)
// Add a part
{
    lock_guard lock(_mutex);
    if (isCancelled())
        throw runtime_error("job " + _id.toString() + " was cancelled");
    if (_finalPartOrdered)
        throw runtime_error("the final part of job " + _id.toString() + " was already submitted");
    for (auto& part : _parts)
        if (part->partNumber() == order.partNumber)
            throw runtime_error("part " + to_string(order.partNumber) + " of job " + _id.toString() + " was already submitted");

    auto& part = *_parts.emplace_back(make_unique<JobPart>(*this, move(order), defaultBlockSize));
    if (part.isFinalPart())
        _finalPartOrdered = true;
    _logger->info("part {} submitted with {} transfers{}", part.partNumber(), part.transfers().size(), part.isFinalPart() ? " (final)" : "");
    return part;
}
//---------------------------------------------------------------------------
bool Job::finalPartOrdered() const
// Was the final part submitted
{
    lock_guard lock(_mutex);
    return _finalPartOrdered;
}
//---------------------------------------------------------------------------
bool Job::done() const
// Are all transfers done
{
    lock_guard lock(_mutex);
    if (!_finalPartOrdered)
        return false;
    return all_of(_parts.begin(), _parts.end(), [](auto& part) { return part->done(); });
}
//---------------------------------------------------------------------------
vector<Transfer*> Job::cancel()
// Cancel every transfer
{
    vector<Transfer*> held;
    lock_guard lock(_mutex);
    _cancelled.store(true, memory_order_release);
    for (auto& part : _parts)
        for (auto& transfer : part->transfers())
            transfer->cancel();
    held.swap(_held);
    _paused = false;
    _logger->info("job cancelled, {} held transfers released", held.size());
    return held;
}
//---------------------------------------------------------------------------
void Job::pause()
// Pause the job
{
    lock_guard lock(_mutex);
    if (isCancelled())
        throw runtime_error("job " + _id.toString() + " was cancelled and cannot be paused");
    if (!_paused)
        _logger->info("job paused");
    _paused = true;
}
//---------------------------------------------------------------------------
vector<Transfer*> Job::resume()
// Resume the job
{
    lock_guard lock(_mutex);
    if (isCancelled())
        throw runtime_error("job " + _id.toString() + " was cancelled and cannot be resumed");
    vector<Transfer*> held;
    held.swap(_held);
    if (_paused)
        _logger->info("job resumed, {} held transfers rescheduled", held.size());
    _paused = false;
    return held;
}
//---------------------------------------------------------------------------
bool Job::isPaused() const
// Is the job paused
{
    lock_guard lock(_mutex);
    return _paused;
}
//---------------------------------------------------------------------------
bool Job::holdIfPaused(Transfer& transfer)
// Hold back a transfer of a paused job
{
    lock_guard lock(_mutex);
    if (!_paused)
        return false;
    _held.push_back(&transfer);
    return true;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
