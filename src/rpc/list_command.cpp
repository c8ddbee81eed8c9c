#include "rpc/list_command.hpp"
#include <stdexcept>
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
bool ListCommand::run(const ListRequest& request)
// Validate and dispatch
{
    auto status = transfer::TransferStatus::Invalid;
    if (!request.ofStatus.empty()) {
        status = transfer::parseTransferStatus(request.ofStatus);
        if (status == transfer::TransferStatus::Invalid) {
            _out << "invalid transfer status " << request.ofStatus << ", expected NotStarted, InProgress, Complete, Failed or Cancelled" << endl;
            return false;
        }
    }

    transfer::JobID jobId;
    if (!request.jobId.empty()) {
        try {
            jobId = transfer::JobID::parse(request.jobId);
        } catch (const invalid_argument& error) {
            _out << "invalid job id " << request.jobId << ": " << error.what() << endl;
            return false;
        }
    }

    if (jobId.empty())
        return printJobs(_out, _client.listJobs());
    if (request.ofStatus.empty())
        return printSummary(_out, _client.listJobProgressSummary(jobId));
    return printTransfers(_out, _client.listJobTransfers(jobId, status));
}
//---------------------------------------------------------------------------
bool ListCommand::printJobs(ostream& out, const ListJobsResponse& response)
// Print the job list
{
    if (!response.errorMessage.empty()) {
        out << "listing the jobs failed: " << response.errorMessage << endl;
        return false;
    }
    out << "Existing jobs" << endl;
    for (auto& jobId : response.jobIds)
        out << jobId.toString() << endl;
    return true;
}
//---------------------------------------------------------------------------
bool ListCommand::printSummary(ostream& out, const ListJobSummaryResponse& response)
// Print a progress summary
{
    if (!response.errorMessage.empty()) {
        out << "listing the progress summary failed: " << response.errorMessage << endl;
        return false;
    }
    auto& summary = response.summary;
    out << "----------- Progress summary of job " << summary.jobId.toString() << " -----------" << endl;
    out << "Total transfers:       " << summary.totalTransfers << endl;
    out << "Completed transfers:   " << summary.transfersCompleted << endl;
    out << "Failed transfers:      " << summary.transfersFailed << endl;
    out << "Cancelled transfers:   " << summary.transfersCancelled << endl;
    out << "Final part ordered:    " << (summary.completeJobOrdered ? "yes" : "no") << endl;
    out << "Progress:              " << summary.percentageProgress << " %" << endl;
    out << "Bytes transferred:     " << summary.bytesTransferred << endl;
    out << "Throughput:            " << summary.throughputMbps << " Mbit/s" << endl;
    for (auto i = 0u; i < summary.failedTransfers.size(); i++)
        out << "failed transfer " << i << "\tsource: " << summary.failedTransfers[i].src << "\tdestination: " << summary.failedTransfers[i].dst << endl;
    return true;
}
//---------------------------------------------------------------------------
bool ListCommand::printTransfers(ostream& out, const ListJobTransfersResponse& response)
// Print a transfer listing
{
    if (!response.errorMessage.empty()) {
        out << "listing the transfers failed: " << response.errorMessage << endl;
        return false;
    }
    out << "----------- Transfers of job " << response.jobId.toString() << " -----------" << endl;
    for (auto& detail : response.details)
        out << "source: " << detail.src << " destination: " << detail.dst << " status: " << transfer::toString(detail.transferStatus) << endl;
    return true;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::rpc
