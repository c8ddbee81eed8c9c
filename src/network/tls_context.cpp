#include "network/tls_context.hpp"
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
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
TLSContext::TLSContext(bool verifyPeer) : _ctx(nullptr), _sessionCache()
// Construct the TLS Context
{
    initOpenSSL();

    // Set up the context
    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx)
        throw runtime_error("OpenSSL Error! - cannot create tls context");

    // Enable session cache
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
    // A peer closing without close_notify ends the response
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);

    if (verifyPeer) {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            SSL_CTX_free(_ctx);
            throw runtime_error("OpenSSL Error! - cannot load the default trust store");
        }
    }
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The desturctor
{
    // Remove all sessions
    for (auto& entry : _sessionCache)
        SSL_SESSION_free(entry.second);

    // Destroy context
    if (_ctx)
        SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
void TLSContext::initOpenSSL()
// Inits the openssl algos
{
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}
//---------------------------------------------------------------------------
SSL* TLSContext::create(const string& host)
// Creates a new ssl object
{
    auto ssl = SSL_new(_ctx);
    if (!ssl)
        return nullptr;
    SSL_set_connect_state(ssl);
    // Server name indication and certificate host check
    if (SSL_set_tlsext_host_name(ssl, host.c_str()) != 1 || SSL_set1_host(ssl, host.c_str()) != 1) {
        SSL_free(ssl);
        return nullptr;
    }
    return ssl;
}
//---------------------------------------------------------------------------
bool TLSContext::cacheSession(const string& key, SSL* ssl)
// Caches the SSL session
{
    // Is the session already cached?
    if (SSL_session_reused(ssl))
        return false;

    auto session = SSL_get1_session(ssl);
    if (!session)
        return false;

    lock_guard lock(_mutex);
    auto it = _sessionCache.find(key);
    if (it != _sessionCache.end()) {
        SSL_SESSION_free(it->second);
        it->second = session;
        return true;
    }
    if (_sessionCache.size() >= cacheSize) {
        SSL_SESSION_free(_sessionCache.begin()->second);
        _sessionCache.erase(_sessionCache.begin());
    }
    _sessionCache.emplace(key, session);
    return true;
}
//---------------------------------------------------------------------------
bool TLSContext::dropSession(const string& key)
// Drop the SSL session from cache
{
    lock_guard lock(_mutex);
    auto it = _sessionCache.find(key);
    if (it == _sessionCache.end())
        return false;
    SSL_SESSION_free(it->second);
    _sessionCache.erase(it);
    return true;
}
//---------------------------------------------------------------------------
bool TLSContext::reuseSession(const string& key, SSL* ssl)
// Reuses the SSL session
{
    lock_guard lock(_mutex);
    auto it = _sessionCache.find(key);
    if (it == _sessionCache.end())
        return false;
    return SSL_set_session(ssl, it->second) == 1;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::network
