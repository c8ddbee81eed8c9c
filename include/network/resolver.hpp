#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <netdb.h>
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
/// The addr resolver and cacher, safe to share between threads
class Resolver {
    /// The cache entry
    struct Entry {
        /// The addr info
        std::shared_ptr<const addrinfo> addr;
        /// The remaining uses before resolving again
        int uses;
    };
    /// The cached addresses by host:port
    std::unordered_map<std::string, Entry> _cache;
    /// The cache mutex
    std::mutex _mutex;
    /// The uses of a resolved address
    int _reuse;

    public:
    /// The constructor
    explicit Resolver(int reuse = 12) : _reuse(reuse) {}
    /// The address resolving, throws std::runtime_error
    [[nodiscard]] std::shared_ptr<const addrinfo> resolve(const std::string& hostname, const std::string& port);
    /// Forget the address after a connection failure
    void invalidate(const std::string& hostname, const std::string& port);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::network
