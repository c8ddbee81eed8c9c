#include "rpc/codec.hpp"
#include <string>
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
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
TEST_CASE("codec_job_part_order") {
    transfer::JobPartOrder order;
    order.jobId = transfer::JobID::parse("0f8fad5b-d9cb-469f-a165-70867728950e");
    order.partNumber = 3;
    order.isFinalPart = true;
    order.logLevel = utils::LogLevel::Warning;
    order.blobAttributes = {"text/plain", "gzip", {{"owner", "alice"}}};
    order.transfers.push_back({"/data/a.bin", "https://acc.blob.core.windows.net/c/a.bin", 250, 100, 3});

    auto payload = encode(order);
    auto json = nlohmann::json::parse(payload);
    REQUIRE(json.at("jobId") == "0f8fad5b-d9cb-469f-a165-70867728950e");
    REQUIRE(json.at("logLevel") == "WARNING");
    REQUIRE(json.at("transfers").at(0).at("sourceSize") == 250);
    REQUIRE(decode<transfer::JobPartOrder>(payload) == order);

    // Optional fields fall back to their defaults
    auto minimal = decode<transfer::JobPartOrder>(R"({"jobId":"0f8fad5b-d9cb-469f-a165-70867728950e","partNumber":0,"isFinalPart":false,"transfers":[{"source":"a","destination":"b","sourceSize":1}]})");
    REQUIRE(minimal.logLevel == utils::LogLevel::Info);
    REQUIRE(minimal.blobAttributes == transfer::BlobAttributes());
    REQUIRE(minimal.transfers.at(0).blockSize == 0);
}
//---------------------------------------------------------------------------
TEST_CASE("codec_summary") {
    ListJobSummaryResponse response;
    response.summary.jobId = transfer::JobID::generate();
    response.summary.totalTransfers = 4;
    response.summary.transfersCompleted = 2;
    response.summary.transfersFailed = 1;
    response.summary.transfersCancelled = 1;
    response.summary.completeJobOrdered = true;
    response.summary.percentageProgress = 100;
    response.summary.bytesTransferred = 1234;
    response.summary.failedTransfers.push_back({"/data/b", "https://acc.blob.core.windows.net/c/b", transfer::TransferStatus::Failed});

    auto json = nlohmann::json::parse(encode(response));
    REQUIRE(json.at("failedTransfers").at(0) == nlohmann::json{{"src", "/data/b"}, {"dst", "https://acc.blob.core.windows.net/c/b"}});

    auto decoded = decode<ListJobSummaryResponse>(json.dump());
    REQUIRE(decoded.errorMessage.empty());
    REQUIRE(decoded.summary.jobId == response.summary.jobId);
    REQUIRE(decoded.summary.transfersCancelled == 1);
    REQUIRE(decoded.summary.bytesTransferred == 1234);
    REQUIRE(decoded.summary.failedTransfers == response.summary.failedTransfers);
}
//---------------------------------------------------------------------------
TEST_CASE("codec_transfer_listing") {
    ListJobTransfersRequest request{transfer::JobID::generate(), transfer::TransferStatus::Complete};
    REQUIRE(nlohmann::json::parse(encode(request)).at("ofStatus") == "Complete");

    auto unknown = decode<ListJobTransfersRequest>(R"({"jobId":"0f8fad5b-d9cb-469f-a165-70867728950e","ofStatus":"Done"})");
    REQUIRE(unknown.ofStatus == transfer::TransferStatus::Invalid);

    ListJobTransfersResponse response;
    response.jobId = request.jobId;
    response.details.push_back({"a", "b", transfer::TransferStatus::Complete});
    auto decoded = decode<ListJobTransfersResponse>(encode(response));
    REQUIRE(decoded.jobId == response.jobId);
    REQUIRE(decoded.details == response.details);
}
//---------------------------------------------------------------------------
TEST_CASE("codec_invalid_utf8") {
    // POSIX paths are raw bytes
    ListJobTransfersResponse response;
    response.jobId = transfer::JobID::generate();
    response.details.push_back({"/data/\xff.bin", "https://acc.blob.core.windows.net/c/a.bin", transfer::TransferStatus::Failed});

    string payload;
    REQUIRE_NOTHROW(payload = encode(response));
    auto decoded = decode<ListJobTransfersResponse>(payload);
    REQUIRE(decoded.details.at(0).src == "/data/\xEF\xBF\xBD.bin");
    REQUIRE(decoded.details.at(0).dst == response.details[0].dst);
}
//---------------------------------------------------------------------------
TEST_CASE("codec_decode_errors") {
    REQUIRE_THROWS_AS(decode<JobRequest>("not json"), DecodeError);
    REQUIRE_THROWS_AS(decode<JobRequest>("{}"), DecodeError);
    REQUIRE_THROWS_AS(decode<JobRequest>(R"({"jobId":"not-a-uuid"})"), DecodeError);
    REQUIRE_THROWS_AS(decode<JobRequest>(R"({"jobId":42})"), DecodeError);
    REQUIRE_THROWS_AS(decode<ListJobsRequest>("[]"), DecodeError);
    REQUIRE_THROWS_AS(decode<transfer::JobPartOrder>(R"({"jobId":"0f8fad5b-d9cb-469f-a165-70867728950e","partNumber":0,"isFinalPart":true,"logLevel":"loud","transfers":[]})"), DecodeError);
    REQUIRE_NOTHROW(decode<ListJobsRequest>("{}"));
}
//---------------------------------------------------------------------------
} // namespace blobcopy::rpc::test
