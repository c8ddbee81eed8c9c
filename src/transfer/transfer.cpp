#include "transfer/transfer.hpp"
#include "transfer/job.hpp"
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
Transfer::Transfer(TransferDescriptor descriptor, JobPart& jobPart) : _descriptor(move(descriptor)), _jobPart(jobPart), _status(TransferStatus::NotStarted), _chunksDone(0), _cancellation(), _done(false)
// The constructor
{
}
//---------------------------------------------------------------------------
Job& Transfer::job() const
// The owning job
{
    return _jobPart.job();
}
//---------------------------------------------------------------------------
ThroughputCounter& Transfer::throughput() const
// The throughput counter of the job
{
    return job().throughput();
}
//---------------------------------------------------------------------------
bool Transfer::setStatus(TransferStatus status)
// Move the status forward
{
    if (status == TransferStatus::NotStarted || status == TransferStatus::Invalid)
        return false;
    auto current = _status.load(memory_order_acquire);
    while (true) {
        if (isTerminal(current) || current == status)
            return false;
        if (status == TransferStatus::InProgress && current != TransferStatus::NotStarted)
            return false;
        if (_status.compare_exchange_weak(current, status, memory_order_acq_rel))
            return true;
    }
}
//---------------------------------------------------------------------------
void Transfer::cancel()
// Cancel the transfer
{
    setStatus(TransferStatus::Cancelled);
    _cancellation.cancel();
}
//---------------------------------------------------------------------------
void Transfer::fail()
// Fail the transfer
{
    setStatus(TransferStatus::Failed);
    _cancellation.cancel();
}
//---------------------------------------------------------------------------
bool Transfer::transferDone()
// Report to the part
{
    if (_done.exchange(true, memory_order_acq_rel))
        return false;
    _jobPart.transferDone(*this);
    return true;
}
//---------------------------------------------------------------------------
utils::LogLevel Transfer::minimumLogLevel() const
// The minimum log level
{
    return _jobPart.logLevel();
}
//---------------------------------------------------------------------------
bool Transfer::shouldLog(utils::LogLevel level) const
// Is the level enabled
{
    return utils::Log::enabled(level, minimumLogLevel());
}
//---------------------------------------------------------------------------
void Transfer::log(utils::LogLevel level, const string& message) const
// Log a message of this transfer
{
    if (!shouldLog(level))
        return;
    job().logger()->log(utils::Log::toSpdlog(level), "{} -> {}: {}", _descriptor.source, _descriptor.destination, message);
}
//---------------------------------------------------------------------------
cloud::PipelineOptions Transfer::pipelineOptions() const
// The pipeline bound to the log sink of this transfer
{
    cloud::PipelineOptions options;
    options.log = [this](utils::LogLevel level, const string& message) { log(level, message); };
    options.minimumLevel = minimumLogLevel();
    return options;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
