#include "rpc/codec.hpp"
#include "utils/log.hpp"
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace utils {
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const UUID& uuid)
// Encode a uuid
{
    json = uuid.toString();
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, UUID& uuid)
// Decode a uuid
{
    uuid = UUID::parse(json.get<string>());
}
//---------------------------------------------------------------------------
} // namespace utils
//---------------------------------------------------------------------------
namespace transfer {
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const TransferStatus& status)
// Encode a status
{
    json = string(toString(status));
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, TransferStatus& status)
// Decode a status
{
    status = parseTransferStatus(json.get<string>());
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const TransferDescriptor& descriptor)
// Encode a descriptor
{
    json = nlohmann::json{
        {"source", descriptor.source},
        {"destination", descriptor.destination},
        {"sourceSize", descriptor.sourceSize},
        {"blockSize", descriptor.blockSize},
        {"numChunks", descriptor.numChunks}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, TransferDescriptor& descriptor)
// Decode a descriptor
{
    descriptor.source = json.at("source").get<string>();
    descriptor.destination = json.at("destination").get<string>();
    descriptor.sourceSize = json.at("sourceSize").get<uint64_t>();
    descriptor.blockSize = json.value("blockSize", uint64_t(0));
    descriptor.numChunks = json.value("numChunks", uint32_t(0));
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const BlobAttributes& attributes)
// Encode blob attributes
{
    json = nlohmann::json{
        {"contentType", attributes.contentType},
        {"contentEncoding", attributes.contentEncoding},
        {"metadata", attributes.metadata}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, BlobAttributes& attributes)
// Decode blob attributes
{
    attributes.contentType = json.value("contentType", string());
    attributes.contentEncoding = json.value("contentEncoding", string());
    if (json.contains("metadata"))
        attributes.metadata = json.at("metadata").get<cloud::Metadata>();
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const JobPartOrder& order)
// Encode a part order
{
    json = nlohmann::json{
        {"jobId", order.jobId},
        {"partNumber", order.partNumber},
        {"isFinalPart", order.isFinalPart},
        {"logLevel", string(utils::Log::levelName(order.logLevel))},
        {"blobAttributes", order.blobAttributes},
        {"transfers", order.transfers}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, JobPartOrder& order)
// Decode a part order
{
    order.jobId = json.at("jobId").get<utils::UUID>();
    order.partNumber = json.at("partNumber").get<uint32_t>();
    order.isFinalPart = json.at("isFinalPart").get<bool>();
    if (json.contains("logLevel"))
        order.logLevel = utils::Log::parseLevel(json.at("logLevel").get<string>());
    if (json.contains("blobAttributes"))
        order.blobAttributes = json.at("blobAttributes").get<BlobAttributes>();
    order.transfers = json.at("transfers").get<vector<TransferDescriptor>>();
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const TransferDetail& detail)
// Encode a transfer detail
{
    json = nlohmann::json{
        {"src", detail.src},
        {"dst", detail.dst},
        {"transferStatus", detail.transferStatus}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, TransferDetail& detail)
// Decode a transfer detail
{
    detail.src = json.at("src").get<string>();
    detail.dst = json.at("dst").get<string>();
    detail.transferStatus = json.at("transferStatus").get<TransferStatus>();
}
//---------------------------------------------------------------------------
} // namespace transfer
//---------------------------------------------------------------------------
namespace rpc {
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const CommonResponse& response)
// Encode a plain response
{
    json = nlohmann::json{{"errorMessage", response.errorMessage}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, CommonResponse& response)
// Decode a plain response
{
    response.errorMessage = json.at("errorMessage").get<string>();
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const ListJobsRequest& /*request*/)
// Encode an empty request
{
    json = nlohmann::json::object();
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, ListJobsRequest& /*request*/)
// Decode an empty request
{
    if (!json.is_object())
        throw DecodeError("listJobs expects an object");
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const ListJobsResponse& response)
// Encode the job list
{
    json = nlohmann::json{
        {"errorMessage", response.errorMessage},
        {"jobIds", response.jobIds}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, ListJobsResponse& response)
// Decode the job list
{
    response.errorMessage = json.at("errorMessage").get<string>();
    response.jobIds = json.at("jobIds").get<vector<transfer::JobID>>();
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const JobRequest& request)
// Encode a job request
{
    json = nlohmann::json{{"jobId", request.jobId}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, JobRequest& request)
// Decode a job request
{
    request.jobId = json.at("jobId").get<transfer::JobID>();
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const ListJobSummaryResponse& response)
// Encode a summary
{
    auto& summary = response.summary;
    auto failed = nlohmann::json::array();
    for (auto& transfer : summary.failedTransfers)
        failed.push_back({{"src", transfer.src}, {"dst", transfer.dst}});
    json = nlohmann::json{
        {"errorMessage", response.errorMessage},
        {"jobId", summary.jobId},
        {"totalTransfers", summary.totalTransfers},
        {"transfersCompleted", summary.transfersCompleted},
        {"transfersFailed", summary.transfersFailed},
        {"transfersCancelled", summary.transfersCancelled},
        {"completeJobOrdered", summary.completeJobOrdered},
        {"percentageProgress", summary.percentageProgress},
        {"bytesTransferred", summary.bytesTransferred},
        {"throughputMbps", summary.throughputMbps},
        {"failedTransfers", failed}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, ListJobSummaryResponse& response)
// Decode a summary
{
    auto& summary = response.summary;
    response.errorMessage = json.at("errorMessage").get<string>();
    summary.jobId = json.at("jobId").get<transfer::JobID>();
    summary.totalTransfers = json.at("totalTransfers").get<uint64_t>();
    summary.transfersCompleted = json.at("transfersCompleted").get<uint64_t>();
    summary.transfersFailed = json.at("transfersFailed").get<uint64_t>();
    summary.transfersCancelled = json.value("transfersCancelled", uint64_t(0));
    summary.completeJobOrdered = json.at("completeJobOrdered").get<bool>();
    summary.percentageProgress = json.at("percentageProgress").get<double>();
    summary.bytesTransferred = json.value("bytesTransferred", uint64_t(0));
    summary.throughputMbps = json.value("throughputMbps", 0.0);
    summary.failedTransfers.clear();
    for (auto& transfer : json.at("failedTransfers"))
        summary.failedTransfers.push_back({transfer.at("src").get<string>(), transfer.at("dst").get<string>(), transfer::TransferStatus::Failed});
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const ListJobTransfersRequest& request)
// Encode a transfer listing request
{
    json = nlohmann::json{
        {"jobId", request.jobId},
        {"ofStatus", request.ofStatus}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, ListJobTransfersRequest& request)
// Decode a transfer listing request
{
    request.jobId = json.at("jobId").get<transfer::JobID>();
    request.ofStatus = json.at("ofStatus").get<transfer::TransferStatus>();
}
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const ListJobTransfersResponse& response)
// Encode a transfer listing
{
    json = nlohmann::json{
        {"errorMessage", response.errorMessage},
        {"jobId", response.jobId},
        {"details", response.details}};
}
//---------------------------------------------------------------------------
void from_json(const nlohmann::json& json, ListJobTransfersResponse& response)
// Decode a transfer listing
{
    response.errorMessage = json.at("errorMessage").get<string>();
    response.jobId = json.at("jobId").get<transfer::JobID>();
    response.details = json.at("details").get<vector<transfer::TransferDetail>>();
}
//---------------------------------------------------------------------------
} // namespace rpc
} // namespace blobcopy
