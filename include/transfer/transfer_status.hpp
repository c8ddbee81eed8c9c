#pragma once
#include <cstdint>
#include <initializer_list>
#include <string_view>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::transfer {
//---------------------------------------------------------------------------
/// The status of a transfer, only moves forward
enum class TransferStatus : uint32_t {
    NotStarted = 0,
    InProgress = 1,
    Complete = 2,
    Failed = 3,
    Cancelled = 4,
    /// Sentinel for unrecognized names
    Invalid = 0xFFFFFFFF
};
//---------------------------------------------------------------------------
/// Get the status name
constexpr std::string_view toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::NotStarted: return "NotStarted";
        case TransferStatus::InProgress: return "InProgress";
        case TransferStatus::Complete: return "Complete";
        case TransferStatus::Failed: return "Failed";
        case TransferStatus::Cancelled: return "Cancelled";
        default: return "Invalid";
    }
}
//---------------------------------------------------------------------------
/// Parse a status name, unrecognized names map to Invalid
constexpr TransferStatus parseTransferStatus(std::string_view name) {
    for (auto status : {TransferStatus::NotStarted, TransferStatus::InProgress, TransferStatus::Complete, TransferStatus::Failed, TransferStatus::Cancelled})
        if (toString(status) == name)
            return status;
    return TransferStatus::Invalid;
}
//---------------------------------------------------------------------------
/// Is the status final
constexpr bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Complete || status == TransferStatus::Failed || status == TransferStatus::Cancelled;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
