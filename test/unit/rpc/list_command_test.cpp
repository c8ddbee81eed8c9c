#include "rpc/list_command.hpp"
#include "rpc/client.hpp"
#include "rpc/codec.hpp"
#include "rpc/dispatcher.hpp"
#include <sstream>
#include <string>
#include <vector>
#include <catch2/catch.hpp>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::rpc::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Records the commands and answers with canned responses
class RecordingDispatcher : public Dispatcher {
    public:
    /// The dispatched commands
    vector<RpcCmd> commands;
    /// The dispatched requests
    vector<string> requests;
    /// The job of the canned responses
    transfer::JobID jobId = transfer::JobID::parse("0f8fad5b-d9cb-469f-a165-70867728950e");
    /// The error of the canned responses
    string errorMessage;

    using Dispatcher::dispatch;
    string dispatch(RpcCmd command, const string& request) override {
        commands.push_back(command);
        requests.push_back(request);
        switch (command) {
            case RpcCmd::ListJobs: return encode(ListJobsResponse{errorMessage, {jobId}});
            case RpcCmd::ListJobProgressSummary: {
                ListJobSummaryResponse response;
                response.errorMessage = errorMessage;
                response.summary.jobId = jobId;
                response.summary.totalTransfers = 2;
                response.summary.transfersCompleted = 1;
                response.summary.transfersFailed = 1;
                response.summary.completeJobOrdered = true;
                response.summary.percentageProgress = 100;
                response.summary.failedTransfers.push_back({"/data/b", "https://acc.blob.core.windows.net/c/b", transfer::TransferStatus::Failed});
                return encode(response);
            }
            case RpcCmd::ListJobTransfers: return encode(ListJobTransfersResponse{errorMessage, jobId, {{"/data/a", "https://acc.blob.core.windows.net/c/a", transfer::TransferStatus::Complete}}});
            default: return encode(CommonResponse{errorMessage});
        }
    }
};
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("list_command_jobs") {
    RecordingDispatcher dispatcher;
    Client client(dispatcher);
    stringstream out;
    ListCommand command(client, out);

    REQUIRE(command.run({"", ""}));
    REQUIRE(dispatcher.commands == vector<RpcCmd>{RpcCmd::ListJobs});
    REQUIRE(out.str() == "Existing jobs\n0f8fad5b-d9cb-469f-a165-70867728950e\n");
}
//---------------------------------------------------------------------------
TEST_CASE("list_command_summary") {
    RecordingDispatcher dispatcher;
    Client client(dispatcher);
    stringstream out;
    ListCommand command(client, out);

    REQUIRE(command.run({"0F8FAD5B-D9CB-469F-A165-70867728950E", ""}));
    REQUIRE(dispatcher.commands == vector<RpcCmd>{RpcCmd::ListJobProgressSummary});
    REQUIRE(decode<JobRequest>(dispatcher.requests[0]).jobId == dispatcher.jobId);
    auto text = out.str();
    REQUIRE(text.starts_with("----------- Progress summary of job 0f8fad5b-d9cb-469f-a165-70867728950e"));
    REQUIRE(text.find("Failed transfers:      1\n") != string::npos);
    REQUIRE(text.find("failed transfer 0\tsource: /data/b\tdestination: https://acc.blob.core.windows.net/c/b\n") != string::npos);
}
//---------------------------------------------------------------------------
TEST_CASE("list_command_transfers") {
    RecordingDispatcher dispatcher;
    Client client(dispatcher);
    stringstream out;
    ListCommand command(client, out);

    REQUIRE(command.run({"0f8fad5b-d9cb-469f-a165-70867728950e", "Complete"}));
    REQUIRE(dispatcher.commands == vector<RpcCmd>{RpcCmd::ListJobTransfers});
    REQUIRE(decode<ListJobTransfersRequest>(dispatcher.requests[0]).ofStatus == transfer::TransferStatus::Complete);
    REQUIRE(out.str() == "----------- Transfers of job 0f8fad5b-d9cb-469f-a165-70867728950e -----------\nsource: /data/a destination: https://acc.blob.core.windows.net/c/a status: Complete\n");
}
//---------------------------------------------------------------------------
TEST_CASE("list_command_rejected_arguments") {
    RecordingDispatcher dispatcher;
    Client client(dispatcher);
    stringstream out;
    ListCommand command(client, out);

    // Nothing is dispatched for invalid arguments
    REQUIRE(!command.run({"0f8fad5b-d9cb-469f-a165-70867728950e", "Done"}));
    REQUIRE(out.str().starts_with("invalid transfer status Done"));
    REQUIRE(!command.run({"job-1", ""}));
    REQUIRE(out.str().find("invalid job id job-1") != string::npos);
    REQUIRE(dispatcher.commands.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("list_command_engine_errors") {
    RecordingDispatcher dispatcher;
    dispatcher.errorMessage = "no job with id 0f8fad5b-d9cb-469f-a165-70867728950e";
    Client client(dispatcher);
    stringstream out;
    ListCommand command(client, out);

    REQUIRE(!command.run({"0f8fad5b-d9cb-469f-a165-70867728950e", ""}));
    REQUIRE(out.str() == "listing the progress summary failed: no job with id 0f8fad5b-d9cb-469f-a165-70867728950e\n");
}
//---------------------------------------------------------------------------
} // namespace blobcopy::rpc::test
