#include "rpc/dispatcher.hpp"
#include "rpc/codec.hpp"
#include "transfer/job_manager.hpp"
#include <stdexcept>
#include <utility>
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
namespace {
//---------------------------------------------------------------------------
template <typename Request, typename Response, typename Handler>
string handle(const string& payload, Handler&& handler)
// Decode, run the handler and encode, failures end up in the error message
{
    Response response;
    try {
        auto request = decode<Request>(payload);
        handler(request, response);
    } catch (const DecodeError& error) {
        response = Response();
        response.errorMessage = string("malformed request: ") + error.what();
    } catch (const runtime_error& error) {
        response = Response();
        response.errorMessage = error.what();
    }
    return encode(response);
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
string Dispatcher::dispatch(string_view commandName, const string& request)
// Dispatch by name
{
    if (auto command = parseRpcCmd(commandName))
        return dispatch(*command, request);
    return encode(CommonResponse{"unrecognized command: " + string(commandName)});
}
//---------------------------------------------------------------------------
string EngineDispatcher::dispatch(RpcCmd command, const string& request)
// Route to the job manager
{
    switch (command) {
        case RpcCmd::SubmitJobPart:
            return handle<transfer::JobPartOrder, CommonResponse>(request, [this](transfer::JobPartOrder& order, CommonResponse&) {
                _manager.submitJobPart(move(order));
            });
        case RpcCmd::ListJobs:
            return handle<ListJobsRequest, ListJobsResponse>(request, [this](ListJobsRequest&, ListJobsResponse& response) {
                response.jobIds = _manager.listJobs();
            });
        case RpcCmd::ListJobProgressSummary:
            return handle<JobRequest, ListJobSummaryResponse>(request, [this](JobRequest& jobRequest, ListJobSummaryResponse& response) {
                response.summary = _manager.progressSummary(jobRequest.jobId);
            });
        case RpcCmd::ListJobTransfers:
            return handle<ListJobTransfersRequest, ListJobTransfersResponse>(request, [this](ListJobTransfersRequest& listRequest, ListJobTransfersResponse& response) {
                response.jobId = listRequest.jobId;
                response.details = _manager.listTransfers(listRequest.jobId, listRequest.ofStatus);
            });
        case RpcCmd::CancelJob:
            return handle<JobRequest, CommonResponse>(request, [this](JobRequest& jobRequest, CommonResponse&) {
                _manager.cancelJob(jobRequest.jobId);
            });
        case RpcCmd::PauseJob:
            return handle<JobRequest, CommonResponse>(request, [this](JobRequest& jobRequest, CommonResponse&) {
                _manager.pauseJob(jobRequest.jobId);
            });
        case RpcCmd::ResumeJob:
            return handle<JobRequest, CommonResponse>(request, [this](JobRequest& jobRequest, CommonResponse&) {
                _manager.resumeJob(jobRequest.jobId);
            });
        default:
            return encode(CommonResponse{"unrecognized command"});
    }
}
//---------------------------------------------------------------------------
} // namespace blobcopy::rpc
