#include "cloud/azure.hpp"
#include "cloud/azure_signer.hpp"
#include "utils/utils.hpp"
#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
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
bool Azure::testEnviornment = false;
//---------------------------------------------------------------------------
static string buildXMSTimestamp()
// Creates the X-MS timestamp
{
    stringstream s;
    const auto t = chrono::system_clock::to_time_t(chrono::system_clock::now());
    tm utc;
    gmtime_r(&t, &utc);
    s.imbue(locale::classic());
    s << put_time(&utc, "%a, %d %b %Y %H:%M:%S GMT");
    return s.str();
}
//---------------------------------------------------------------------------
static bool isPathStyleHost(string_view host)
// Emulators and ip endpoints carry the account in the path
{
    if (host == "localhost" || host.find('.') == string_view::npos || host.starts_with('['))
        return true;
    for (auto c : host)
        if (!isdigit(static_cast<unsigned char>(c)) && c != '.')
            return false;
    return true;
}
//---------------------------------------------------------------------------
Azure::Azure(Location location, optional<Secret> secret) : _location(move(location)), _secret(move(secret))
// The constructor
{
    if (_secret) {
        // Keys copied from files may carry line breaks
        erase(_secret->accountKey, '\n');
        erase(_secret->accountKey, '\r');
    }
}
//---------------------------------------------------------------------------
string Azure::decodePath(string_view path)
// Decodes %HEX sequences
{
    string result;
    result.reserve(path.size());
    for (size_t i = 0; i < path.size(); i++) {
        if (path[i] == '%' && i + 2 < path.size()) {
            uint8_t value;
            auto [ptr, ec] = from_chars(path.data() + i + 1, path.data() + i + 3, value, 16);
            if (ec != errc() || ptr != path.data() + i + 3)
                throw runtime_error("Invalid url encoding in " + string(path));
            result.push_back(static_cast<char>(value));
            i += 2;
        } else {
            result.push_back(path[i]);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string Azure::encodePath(string_view path)
// Encodes the segments of a path
{
    string result;
    while (true) {
        auto pos = path.find('/');
        result += utils::encodeUrlParameters(string(path.substr(0, pos)));
        if (pos == string_view::npos)
            break;
        result += '/';
        path = path.substr(pos + 1);
    }
    return result;
}
//---------------------------------------------------------------------------
Azure::Location Azure::parseUrl(string_view url)
// Parse the destination url
{
    Location location;
    auto original = string(url);
    if (url.starts_with("https://")) {
        location.endpoint.https = true;
        location.endpoint.port = 443;
        url = url.substr(8);
    } else if (url.starts_with("http://")) {
        location.endpoint.https = false;
        location.endpoint.port = 80;
        url = url.substr(7);
    } else {
        throw runtime_error("Invalid destination url " + original + ": needs http or https scheme");
    }

    // Split the authority
    auto pathPos = url.find('/');
    if (pathPos == string_view::npos || pathPos == 0)
        throw runtime_error("Invalid destination url " + original + ": missing host or path");
    auto authority = url.substr(0, pathPos);
    url = url.substr(pathPos + 1);
    auto portPos = authority.rfind(':');
    if (portPos != string_view::npos && authority.find(']', portPos) == string_view::npos) {
        auto portString = authority.substr(portPos + 1);
        auto [ptr, ec] = from_chars(portString.data(), portString.data() + portString.size(), location.endpoint.port);
        if (ec != errc() || ptr != portString.data() + portString.size() || !location.endpoint.port)
            throw runtime_error("Invalid destination url " + original + ": invalid port");
        authority = authority.substr(0, portPos);
    }
    location.endpoint.host = string(authority);
    location.pathStyle = isPathStyleHost(authority);

    // Split the query
    auto queryPos = url.find('?');
    auto path = url.substr(0, queryPos);
    if (queryPos != string_view::npos) {
        auto queries = url.substr(queryPos + 1);
        while (!queries.empty()) {
            auto andPos = queries.find('&');
            auto query = queries.substr(0, andPos);
            auto keyPos = query.find('=');
            if (keyPos == string_view::npos)
                location.sas.emplace(decodePath(query), "");
            else
                location.sas.emplace(decodePath(query.substr(0, keyPos)), decodePath(query.substr(keyPos + 1)));
            if (andPos == string_view::npos)
                break;
            queries = queries.substr(andPos + 1);
        }
    }

    // Account, container and blob
    if (location.pathStyle) {
        auto accountPos = path.find('/');
        if (accountPos == string_view::npos)
            throw runtime_error("Invalid destination url " + original + ": missing account");
        location.accountName = decodePath(path.substr(0, accountPos));
        path = path.substr(accountPos + 1);
    } else {
        location.accountName = string(authority.substr(0, authority.find('.')));
    }
    auto containerPos = path.find('/');
    if (containerPos == string_view::npos || containerPos == 0 || containerPos + 1 == path.size())
        throw runtime_error("Invalid destination url " + original + ": needs a container and a blob name");
    location.container = decodePath(path.substr(0, containerPos));
    location.blob = decodePath(path.substr(containerPos + 1));
    return location;
}
//---------------------------------------------------------------------------
string Azure::path() const
// The encoded request path
{
    string result = "/";
    if (_location.pathStyle)
        result += utils::encodeUrlParameters(_location.accountName) + "/";
    return result + utils::encodeUrlParameters(_location.container) + "/" + encodePath(_location.blob);
}
//---------------------------------------------------------------------------
network::HttpRequest Azure::baseRequest() const
// Common request setup
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::PUT;
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.path = path();
    request.queries = _location.sas;
    request.headers.emplace("x-ms-date", testEnviornment ? fakeXMSTimestamp : buildXMSTimestamp());
    request.headers.emplace("x-ms-version", AzureSigner::version);
    return request;
}
//---------------------------------------------------------------------------
void Azure::sign(network::HttpRequest& request) const
// Sign with the shared key
{
    if (_secret && !usesSas())
        AzureSigner::signRequest(_secret->accountName, _secret->accountKey, request);
}
//---------------------------------------------------------------------------
void Azure::addMetadata(network::HttpRequest& request, const Metadata& metadata)
// Adds the metadata headers
{
    for (auto& [key, value] : metadata)
        request.headers.emplace("x-ms-meta-" + key, value);
}
//---------------------------------------------------------------------------
network::HttpRequest Azure::putBlockRequest(const string& blockId, uint64_t length) const
// Builds the http request for staging a block
{
    auto request = baseRequest();
    request.queries.emplace("comp", "block");
    request.queries.emplace("blockid", blockId);
    request.headers.emplace("Content-Length", to_string(length));
    sign(request);
    return request;
}
//---------------------------------------------------------------------------
network::HttpRequest Azure::putBlockListRequest(uint64_t length, const BlobHeaders& headers, const Metadata& metadata) const
// Builds the http request for committing the block list
{
    auto request = baseRequest();
    request.queries.emplace("comp", "blocklist");
    request.headers.emplace("Content-Length", to_string(length));
    if (!headers.contentType.empty())
        request.headers.emplace("x-ms-blob-content-type", headers.contentType);
    if (!headers.contentEncoding.empty())
        request.headers.emplace("x-ms-blob-content-encoding", headers.contentEncoding);
    addMetadata(request, metadata);
    sign(request);
    return request;
}
//---------------------------------------------------------------------------
network::HttpRequest Azure::putBlobRequest(uint64_t length, const BlobHeaders& headers, const Metadata& metadata) const
// Builds the http request for putting objects without the object data itself
{
    auto request = baseRequest();
    request.headers.emplace("x-ms-blob-type", "BlockBlob");
    request.headers.emplace("Content-Length", to_string(length));
    if (!headers.contentType.empty())
        request.headers.emplace("Content-Type", headers.contentType);
    if (!headers.contentEncoding.empty())
        request.headers.emplace("Content-Encoding", headers.contentEncoding);
    addMetadata(request, metadata);
    sign(request);
    return request;
}
//---------------------------------------------------------------------------
string Azure::blockListBody(const vector<string>& blockIds)
// The block list body
{
    string body = "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>";
    for (auto& id : blockIds)
        body += "<Latest>" + id + "</Latest>";
    body += "</BlockList>";
    return body;
}
//---------------------------------------------------------------------------
string Azure::errorCode(string_view body)
// Extracts the error code
{
    static constexpr string_view codeStart = "<Code>";
    static constexpr string_view codeEnd = "</Code>";
    auto start = body.find(codeStart);
    if (start == string_view::npos)
        return {};
    start += codeStart.size();
    auto end = body.find(codeEnd, start);
    if (end == string_view::npos)
        return {};
    return string(body.substr(start, end - start));
}
//---------------------------------------------------------------------------
} // namespace blobcopy::cloud
