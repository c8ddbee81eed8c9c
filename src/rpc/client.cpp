#include "rpc/client.hpp"
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
using namespace std;
//---------------------------------------------------------------------------
CommonResponse Client::submitJobPart(const transfer::JobPartOrder& order)
// Submit a job part
{
    return call<CommonResponse>(RpcCmd::SubmitJobPart, order);
}
//---------------------------------------------------------------------------
ListJobsResponse Client::listJobs()
// List the jobs
{
    return call<ListJobsResponse>(RpcCmd::ListJobs, ListJobsRequest{});
}
//---------------------------------------------------------------------------
ListJobSummaryResponse Client::listJobProgressSummary(const transfer::JobID& jobId)
// The progress summary
{
    return call<ListJobSummaryResponse>(RpcCmd::ListJobProgressSummary, JobRequest{jobId});
}
//---------------------------------------------------------------------------
ListJobTransfersResponse Client::listJobTransfers(const transfer::JobID& jobId, transfer::TransferStatus ofStatus)
// The transfers with a status
{
    return call<ListJobTransfersResponse>(RpcCmd::ListJobTransfers, ListJobTransfersRequest{jobId, ofStatus});
}
//---------------------------------------------------------------------------
CommonResponse Client::cancelJob(const transfer::JobID& jobId)
// Cancel a job
{
    return call<CommonResponse>(RpcCmd::CancelJob, JobRequest{jobId});
}
//---------------------------------------------------------------------------
CommonResponse Client::pauseJob(const transfer::JobID& jobId)
// Pause a job
{
    return call<CommonResponse>(RpcCmd::PauseJob, JobRequest{jobId});
}
//---------------------------------------------------------------------------
CommonResponse Client::resumeJob(const transfer::JobID& jobId)
// Resume a job
{
    return call<CommonResponse>(RpcCmd::ResumeJob, JobRequest{jobId});
}
//---------------------------------------------------------------------------
} // namespace blobcopy::rpc
