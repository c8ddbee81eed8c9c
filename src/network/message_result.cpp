#include "network/message_result.hpp"
#include <string>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string MessageResult::getResult() const
// Get the body
{
    if (!_response)
        return {};
    return HttpHelper::retrieveContent(_data, *_response);
}
//---------------------------------------------------------------------------
string MessageResult::describe() const
// Describe the outcome
{
    switch (_state) {
        case MessageState::Init: return "not sent";
        case MessageState::Cancelled: return "cancelled";
        case MessageState::Finished: {
            auto& response = _response->response;
            auto description = to_string(response.code);
            if (!response.reason.empty())
                description += " " + response.reason;
            return description;
        }
        case MessageState::Aborted:
        default: {
            static constexpr pair<MessageFailureCode, const char*> names[] = {
                {MessageFailureCode::Socket, "socket"},
                {MessageFailureCode::Empty, "empty response"},
                {MessageFailureCode::Timeout, "timeout"},
                {MessageFailureCode::Send, "send"},
                {MessageFailureCode::Recv, "recv"},
                {MessageFailureCode::HTTP, "http"},
                {MessageFailureCode::TLS, "tls"},
                {MessageFailureCode::Resolve, "resolve"}};
            string description = "aborted (";
            auto first = true;
            for (auto& [code, name] : names) {
                if (failed(code)) {
                    if (!first)
                        description += ", ";
                    description += name;
                    first = false;
                }
            }
            description += ")";
            if (!_failureMessage.empty())
                description += ": " + _failureMessage;
            return description;
        }
    }
}
//---------------------------------------------------------------------------
} // namespace blobcopy::network
