#pragma once
#include "rpc/codec.hpp"
#include "rpc/command.hpp"
#include "rpc/dispatcher.hpp"
#include <string>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::rpc {
//---------------------------------------------------------------------------
/// The typed side of a dispatcher.
/// Responses that cannot be decoded raise DecodeError, all other failures are in the errorMessage of the response.
class Client {
    /// The dispatcher
    Dispatcher& _dispatcher;

    /// Encode, dispatch and decode
    template <typename Response, typename Request>
    Response call(RpcCmd command, const Request& request) {
        return decode<Response>(_dispatcher.dispatch(command, encode(request)));
    }

    public:
    /// The constructor
    explicit Client(Dispatcher& dispatcher) : _dispatcher(dispatcher) {}

    /// Submit a job part
    [[nodiscard]] CommonResponse submitJobPart(const transfer::JobPartOrder& order);
    /// List the jobs
    [[nodiscard]] ListJobsResponse listJobs();
    /// The progress summary of a job
    [[nodiscard]] ListJobSummaryResponse listJobProgressSummary(const transfer::JobID& jobId);
    /// The transfers of a job with a status
    [[nodiscard]] ListJobTransfersResponse listJobTransfers(const transfer::JobID& jobId, transfer::TransferStatus ofStatus);
    /// Cancel a job
    [[nodiscard]] CommonResponse cancelJob(const transfer::JobID& jobId);
    /// Pause a job
    [[nodiscard]] CommonResponse pauseJob(const transfer::JobID& jobId);
    /// Resume a job
    [[nodiscard]] CommonResponse resumeJob(const transfer::JobID& jobId);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::rpc
