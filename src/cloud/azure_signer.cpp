#include "cloud/azure_signer.hpp"
#include "utils/utils.hpp"
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string AzureSigner::canonicalRequest(const string& accountName, const network::HttpRequest& request)
// Creates the canonical request
{
    static constexpr const char* standardHeaders[] = {"Content-Encoding", "Content-Language", "Content-Length", "Content-MD5", "Content-Type", "Date", "If-Modified-Since", "If-Match", "If-None-Match", "If-Unmodified-Since", "Range"};

    stringstream requestStream;
    // canonicalize request method
    requestStream << network::HttpRequest::getRequestMethod(request.method) << "\n";

    // the standard headers in fixed order, a zero length is signed as empty string
    for (auto header : standardHeaders) {
        auto it = request.headers.find(header);
        if (it != request.headers.end() && !(it->first == "Content-Length" && it->second == "0"))
            requestStream << it->second;
        requestStream << "\n";
    }

    // canonicalize headers, assume no unnecessary whitespaces in header
    map<string, string> sorted;
    for (auto& header : request.headers) {
        auto key = utils::toLower(header.first);
        if (key.starts_with("x-ms-"))
            sorted.emplace(move(key), header.second);
    }
    for (auto& h : sorted)
        requestStream << h.first << ":" << h.second << "\n";

    requestStream << "/" + accountName + (request.path.empty() ? "/" : request.path);

    // canonicalize query; lowercase keys with decoded values in key order
    map<string, string> queries;
    for (auto& query : request.queries)
        queries.emplace(utils::toLower(query.first), query.second);
    for (auto& query : queries)
        requestStream << "\n" << query.first << ":" << query.second;

    return requestStream.str();
}
//---------------------------------------------------------------------------
void AzureSigner::signRequest(const string& accountName, const string& accountKey, network::HttpRequest& request)
// Signs the request
{
    request.headers.emplace("x-ms-version", version);

    auto decodedKey = utils::base64Decode(reinterpret_cast<const uint8_t*>(accountKey.data()), accountKey.size());
    auto requestString = canonicalRequest(accountName, request);
    auto signature = utils::hmacSign(decodedKey.first.get(), decodedKey.second, reinterpret_cast<const uint8_t*>(requestString.data()), requestString.size());

    request.headers["Authorization"] = "SharedKey " + accountName + ":" + utils::base64Encode(signature.first.get(), signature.second);
}
//---------------------------------------------------------------------------
} // namespace blobcopy::cloud
