#include "network/resolver.hpp"
#include <cstring>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/types.h>
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
shared_ptr<const addrinfo> Resolver::resolve(const string& hostname, const string& port)
// Resolve the request
{
    auto hostString = hostname + ":" + port;
    {
        lock_guard lock(_mutex);
        auto it = _cache.find(hostString);
        if (it != _cache.end() && it->second.uses-- > 0)
            return it->second.addr;
    }

    struct addrinfo hints = {};
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* temp;
    auto status = getaddrinfo(hostname.c_str(), port.c_str(), &hints, &temp);
    if (status != 0)
        throw runtime_error("hostname getaddrinfo error for " + hostString + ": " + gai_strerror(status));
    shared_ptr<const addrinfo> addr(temp, [](const addrinfo* a) { freeaddrinfo(const_cast<addrinfo*>(a)); });

    lock_guard lock(_mutex);
    _cache[hostString] = {addr, _reuse};
    return addr;
}
//---------------------------------------------------------------------------
void Resolver::invalidate(const string& hostname, const string& port)
// Forget the address
{
    lock_guard lock(_mutex);
    _cache.erase(hostname + ":" + port);
}
//---------------------------------------------------------------------------
} // namespace blobcopy::network
