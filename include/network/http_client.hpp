#pragma once
#include "network/http_request.hpp"
#include "network/message_result.hpp"
#include "network/resolver.hpp"
#include "network/tls_context.hpp"
#include "utils/cancellation.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
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
class BodySource;
//---------------------------------------------------------------------------
/// The remote peer
struct Endpoint {
    /// The host name
    std::string host;
    /// The port
    uint16_t port = 80;
    /// Use tls
    bool https = false;

    /// The value of the host header
    [[nodiscard]] std::string hostHeader() const;
};
//---------------------------------------------------------------------------
/// A blocking http client that sends each request over a fresh connection.
/// All socket waits are sliced so that a cancelled token aborts the exchange promptly.
class HttpClient {
    public:
    /// The client settings
    struct Settings {
        /// The poll slice in which cancellation is observed
        std::chrono::milliseconds pollSlice{100};
        /// The maximum bytes written per send call
        uint64_t sendChunk = 64ull << 10;
        /// The receive buffer size per recv call
        uint64_t recvChunk = 16ull << 10;
        /// The maximum accepted response size
        uint64_t maxResponseSize = 16ull << 20;
        /// Verify the server certificate
        bool verifyPeer = true;
    };

    private:
    /// The settings
    Settings _settings;
    /// The resolver
    Resolver _resolver;
    /// The tls context, created on the first https request
    std::unique_ptr<TLSContext> _tlsContext;
    /// Guards the creation of the tls context
    std::once_flag _tlsOnce;

    /// Get the tls context
    TLSContext* tlsContext();

    public:
    /// The constructor
    explicit HttpClient(Settings settings);
    /// The default constructor
    HttpClient() : HttpClient(Settings()) {}

    /// Sends the request with an optional body and receives the response, never throws for network failures
    [[nodiscard]] MessageResult send(const Endpoint& endpoint, const HttpRequest& request, BodySource* body, const utils::CancellationToken& token, std::chrono::milliseconds timeout);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::network
