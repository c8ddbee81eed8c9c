#pragma once
#include "network/http_helper.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
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
class HttpClient;
//---------------------------------------------------------------------------
/// Final status of the message
enum class MessageState : uint8_t {
    Init,
    Finished,
    Aborted,
    Cancelled
};
//---------------------------------------------------------------------------
/// The failure codes
enum class MessageFailureCode : uint16_t {
    /// Socket creation error
    Socket = 1,
    /// Empty response error
    Empty = 1 << 1,
    /// Timeout passed
    Timeout = 1 << 2,
    /// Send syscall error
    Send = 1 << 3,
    /// Recv syscall error
    Recv = 1 << 4,
    /// HTTP header error
    HTTP = 1 << 5,
    /// TLS error
    TLS = 1 << 6,
    /// Name resolution error
    Resolve = 1 << 7
};
//---------------------------------------------------------------------------
/// The result of one http exchange
class MessageResult {
    /// The raw response
    std::string _data;
    /// The http response header info
    std::unique_ptr<HttpHelper::Info> _response;
    /// The failure code
    uint16_t _failureCode;
    /// The state
    MessageState _state;
    /// The system error message of the failure
    std::string _failureMessage;

    public:
    /// The default constructor
    MessageResult() : _failureCode(0), _state(MessageState::Init) {}

    /// Get the body
    [[nodiscard]] std::string getResult() const;
    /// Get the raw response (incl. header)
    [[nodiscard]] std::string_view getErrorResponse() const { return _data; }
    /// Get the state
    [[nodiscard]] MessageState getState() const { return _state; }
    /// Get the failure code
    [[nodiscard]] uint16_t getFailureCode() const { return _failureCode; }
    /// Has the failure bit
    [[nodiscard]] bool failed(MessageFailureCode code) const { return _failureCode & static_cast<uint16_t>(code); }
    /// Get the failure description
    [[nodiscard]] std::string_view getFailureMessage() const { return _failureMessage; }
    /// Get the response code number, 0 without response
    [[nodiscard]] uint16_t getResponseCodeNumber() const { return _response ? _response->response.code : 0; }
    /// Get the response header
    [[nodiscard]] const HttpResponse* getResponse() const { return _response ? &_response->response : nullptr; }
    /// Was the exchange completed, independent of the status code
    [[nodiscard]] bool success() const { return _state == MessageState::Finished; }
    /// Was the exchange completed with a 2xx code
    [[nodiscard]] bool successCode() const { return success() && HttpResponse::checkSuccess(getResponseCodeNumber()); }

    /// Describe the outcome for logs
    [[nodiscard]] std::string describe() const;

    friend HttpClient;
};
//---------------------------------------------------------------------------
} // namespace blobcopy::network
