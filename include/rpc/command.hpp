#pragma once
#include "transfer/job.hpp"
#include "transfer/job_manager.hpp"
#include "transfer/transfer_status.hpp"
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
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
/// The commands understood by the engine
enum class RpcCmd : uint8_t {
    SubmitJobPart,
    ListJobs,
    ListJobProgressSummary,
    ListJobTransfers,
    CancelJob,
    PauseJob,
    ResumeJob
};
//---------------------------------------------------------------------------
/// The command name
constexpr std::string_view toString(RpcCmd command) {
    switch (command) {
        case RpcCmd::SubmitJobPart: return "submitJobPart";
        case RpcCmd::ListJobs: return "listJobs";
        case RpcCmd::ListJobProgressSummary: return "listJobProgressSummary";
        case RpcCmd::ListJobTransfers: return "listJobTransfers";
        case RpcCmd::CancelJob: return "cancelJob";
        case RpcCmd::PauseJob: return "pauseJob";
        case RpcCmd::ResumeJob: return "resumeJob";
        default: return "unknown";
    }
}
//---------------------------------------------------------------------------
/// Parse a command name
constexpr std::optional<RpcCmd> parseRpcCmd(std::string_view name) {
    for (auto command : {RpcCmd::SubmitJobPart, RpcCmd::ListJobs, RpcCmd::ListJobProgressSummary, RpcCmd::ListJobTransfers, RpcCmd::CancelJob, RpcCmd::PauseJob, RpcCmd::ResumeJob})
        if (toString(command) == name)
            return command;
    return std::nullopt;
}
//---------------------------------------------------------------------------
/// A response that only reports errors
struct CommonResponse {
    /// Empty on success
    std::string errorMessage;
};
//---------------------------------------------------------------------------
/// Request without arguments
struct ListJobsRequest {};
//---------------------------------------------------------------------------
/// The known jobs
struct ListJobsResponse {
    /// Empty on success
    std::string errorMessage;
    /// The jobs in submission order
    std::vector<transfer::JobID> jobIds;
};
//---------------------------------------------------------------------------
/// A request naming one job, used for the summary, cancel, pause and resume
struct JobRequest {
    /// The job
    transfer::JobID jobId;
};
//---------------------------------------------------------------------------
/// The progress summary of a job
struct ListJobSummaryResponse {
    /// Empty on success
    std::string errorMessage;
    /// The summary
    transfer::JobProgressSummary summary;
};
//---------------------------------------------------------------------------
/// The transfers of a job with one status
struct ListJobTransfersRequest {
    /// The job
    transfer::JobID jobId;
    /// The status filter
    transfer::TransferStatus ofStatus = transfer::TransferStatus::Invalid;
};
//---------------------------------------------------------------------------
/// The matching transfers
struct ListJobTransfersResponse {
    /// Empty on success
    std::string errorMessage;
    /// The job
    transfer::JobID jobId;
    /// The transfers
    std::vector<transfer::TransferDetail> details;
};
//---------------------------------------------------------------------------
} // namespace blobcopy::rpc
