#pragma once
#include "rpc/client.hpp"
#include "rpc/command.hpp"
#include <ostream>
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
/// The arguments of the list command as typed by the user
struct ListRequest {
    /// The job id, empty lists all jobs
    std::string jobId;
    /// The status filter, empty prints the progress summary
    std::string ofStatus;
};
//---------------------------------------------------------------------------
/// Lists jobs, the progress of a job or its transfers with a status.
/// The arguments are validated before anything is dispatched.
class ListCommand {
    /// The client
    Client& _client;
    /// The output
    std::ostream& _out;

    public:
    /// The constructor
    ListCommand(Client& client, std::ostream& out) : _client(client), _out(out) {}

    /// Run the command, false if the arguments were rejected or the engine reported an error.
    /// Throws DecodeError for responses that cannot be decoded.
    bool run(const ListRequest& request);

    /// Print the job list
    static bool printJobs(std::ostream& out, const ListJobsResponse& response);
    /// Print a progress summary
    static bool printSummary(std::ostream& out, const ListJobSummaryResponse& response);
    /// Print a transfer listing
    static bool printTransfers(std::ostream& out, const ListJobTransfersResponse& response);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::rpc
