#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <openssl/ssl.h>
#include <openssl/types.h>
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
// The ssl context is shared by all workers of a client, the session cache
// is keyed by host and port and guarded by a mutex.
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;
    /// The maximum number of cached sessions
    static constexpr uint64_t cacheSize = 256;
    /// The session cache
    std::unordered_map<std::string, SSL_SESSION*> _sessionCache;
    /// The cache mutex
    std::mutex _mutex;

    public:
    /// The constructor, throws std::runtime_error
    explicit TLSContext(bool verifyPeer = true);
    /// Delete copy
    TLSContext(const TLSContext&) = delete;
    /// Delete copy assignment
    TLSContext& operator=(const TLSContext&) = delete;
    /// The destructor
    ~TLSContext();

    /// Creates a new ssl object for the host, sets SNI and hostname checks
    [[nodiscard]] SSL* create(const std::string& host);
    /// Caches the SSL session
    bool cacheSession(const std::string& key, SSL* ssl);
    /// Drops the SSL session
    bool dropSession(const std::string& key);
    /// Reuses a SSL session
    bool reuseSession(const std::string& key, SSL* ssl);

    /// Init the OpenSSL algos and errors
    static void initOpenSSL();

    friend HttpClient;
};
//---------------------------------------------------------------------------
} // namespace blobcopy::network
