#pragma once
#include "rpc/command.hpp"
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
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
namespace utils {
/// Canonical string form
void to_json(nlohmann::json& json, const UUID& uuid);
/// Parses the canonical string form
void from_json(const nlohmann::json& json, UUID& uuid);
} // namespace utils
//---------------------------------------------------------------------------
namespace transfer {
/// Encode a status by name
void to_json(nlohmann::json& json, const TransferStatus& status);
/// Decode a status, unknown names become Invalid
void from_json(const nlohmann::json& json, TransferStatus& status);
/// Encode a descriptor
void to_json(nlohmann::json& json, const TransferDescriptor& descriptor);
/// Decode a descriptor
void from_json(const nlohmann::json& json, TransferDescriptor& descriptor);
/// Encode blob attributes
void to_json(nlohmann::json& json, const BlobAttributes& attributes);
/// Decode blob attributes
void from_json(const nlohmann::json& json, BlobAttributes& attributes);
/// Encode a part order
void to_json(nlohmann::json& json, const JobPartOrder& order);
/// Decode a part order
void from_json(const nlohmann::json& json, JobPartOrder& order);
/// Encode a transfer detail
void to_json(nlohmann::json& json, const TransferDetail& detail);
/// Decode a transfer detail
void from_json(const nlohmann::json& json, TransferDetail& detail);
} // namespace transfer
//---------------------------------------------------------------------------
namespace rpc {
//---------------------------------------------------------------------------
/// A payload that cannot be interpreted
class DecodeError : public std::runtime_error {
    public:
    /// The constructor
    explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};
//---------------------------------------------------------------------------
void to_json(nlohmann::json& json, const CommonResponse& response);
void from_json(const nlohmann::json& json, CommonResponse& response);
void to_json(nlohmann::json& json, const ListJobsRequest& request);
void from_json(const nlohmann::json& json, ListJobsRequest& request);
void to_json(nlohmann::json& json, const ListJobsResponse& response);
void from_json(const nlohmann::json& json, ListJobsResponse& response);
void to_json(nlohmann::json& json, const JobRequest& request);
void from_json(const nlohmann::json& json, JobRequest& request);
void to_json(nlohmann::json& json, const ListJobSummaryResponse& response);
void from_json(const nlohmann::json& json, ListJobSummaryResponse& response);
void to_json(nlohmann::json& json, const ListJobTransfersRequest& request);
void from_json(const nlohmann::json& json, ListJobTransfersRequest& request);
void to_json(nlohmann::json& json, const ListJobTransfersResponse& response);
void from_json(const nlohmann::json& json, ListJobTransfersResponse& response);
//---------------------------------------------------------------------------
/// Encode a payload, bytes that are not valid UTF-8 are replaced with U+FFFD
template <typename T>
std::string encode(const T& value) {
    return nlohmann::json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
//---------------------------------------------------------------------------
/// Decode a payload, throws DecodeError
template <typename T>
T decode(const std::string& payload) {
    try {
        return nlohmann::json::parse(payload).get<T>();
    } catch (const nlohmann::json::exception& error) {
        throw DecodeError(error.what());
    } catch (const std::invalid_argument& error) {
        throw DecodeError(error.what());
    }
}
//---------------------------------------------------------------------------
} // namespace rpc
} // namespace blobcopy
