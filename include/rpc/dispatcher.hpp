#pragma once
#include "rpc/command.hpp"
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
namespace blobcopy::transfer {
class JobManager;
} // namespace blobcopy::transfer
//---------------------------------------------------------------------------
namespace blobcopy::rpc {
//---------------------------------------------------------------------------
/// Routes an encoded request to its handler and returns the encoded response.
/// Failures are reported in the errorMessage of the response.
class Dispatcher {
    public:
    /// The destructor
    virtual ~Dispatcher() noexcept = default;
    /// Dispatch a command
    [[nodiscard]] virtual std::string dispatch(RpcCmd command, const std::string& request) = 0;
    /// Dispatch a command by name, unknown names are answered with an error response
    [[nodiscard]] std::string dispatch(std::string_view commandName, const std::string& request);
};
//---------------------------------------------------------------------------
/// The dispatcher in front of the job manager
class EngineDispatcher : public Dispatcher {
    /// The job manager
    transfer::JobManager& _manager;

    public:
    /// The constructor
    explicit EngineDispatcher(transfer::JobManager& manager) : _manager(manager) {}

    using Dispatcher::dispatch;
    /// Dispatch a command
    [[nodiscard]] std::string dispatch(RpcCmd command, const std::string& request) override;
};
//---------------------------------------------------------------------------
} // namespace blobcopy::rpc
