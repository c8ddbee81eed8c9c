#include "network/http_request.hpp"
#include "utils/utils.hpp"
#include <cctype>
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
namespace blobcopy::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static string decodeUrl(string_view encoded)
// Decodes %HEX sequences
{
    string result;
    result.reserve(encoded.size());
    auto hexValue = [](char c) -> int {
        if (!isxdigit(static_cast<unsigned char>(c)))
            throw runtime_error("Invalid HttpRequest: Invalid url escape!");
        return isdigit(static_cast<unsigned char>(c)) ? c - '0' : (tolower(static_cast<unsigned char>(c)) - 'a' + 10);
    };
    for (size_t i = 0; i < encoded.size(); i++) {
        if (encoded[i] != '%') {
            result.push_back(encoded[i]);
            continue;
        }
        if (i + 2 >= encoded.size())
            throw runtime_error("Invalid HttpRequest: Incomplete url escape!");
        result.push_back(static_cast<char>((hexValue(encoded[i + 1]) << 4) | hexValue(encoded[i + 2])));
        i += 2;
    }
    return result;
}
//---------------------------------------------------------------------------
HttpRequest HttpRequest::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ": ";
    static constexpr string_view strQuerySeperator = "=";
    static constexpr string_view strQueryStart = "?";
    static constexpr string_view strQueryAnd = "&";
    static constexpr Method methods[] = {Method::GET, Method::PUT, Method::POST, Method::DELETE, Method::HEAD};

    HttpRequest request;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpRequest: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpRequest: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // parse method
            auto found = false;
            for (auto method : methods) {
                string_view name = getRequestMethod(method);
                if (line.starts_with(name) && line.size() > name.size() && line[name.size()] == ' ') {
                    request.method = method;
                    line = line.substr(name.size());
                    found = true;
                    break;
                }
            }
            if (!found)
                throw runtime_error("Invalid HttpRequest: Needs to start with request method!");

            // parse path, requires HTTP type, otherwise invalid
            pos = line.find(" ", 1);
            if (pos == line.npos)
                throw runtime_error("Invalid HttpRequest: Could not find path, or missing HTTP type!");
            auto pathQuery = line.substr(1, pos - 1);
            line = line.substr(pos + 1);

            // split path and query
            auto queriesPos = pathQuery.find(strQueryStart);
            if (queriesPos != pathQuery.npos) {
                request.path = pathQuery.substr(0, queriesPos);
                auto queries = pathQuery.substr(queriesPos + 1);
                while (true) {
                    auto queryPos = queries.find(strQueryAnd);
                    auto query = queryPos == queries.npos ? queries : queries.substr(0, queryPos);

                    // split between key and value (value might be unnecassary)
                    auto keyPos = query.find(strQuerySeperator);
                    string_view key = query, value = "";
                    if (keyPos != query.npos) {
                        key = query.substr(0, keyPos);
                        value = query.substr(keyPos + 1);
                    }
                    if (key.size() > 0)
                        request.queries.emplace(decodeUrl(key), decodeUrl(value));
                    if (queryPos == queries.npos)
                        break;
                    queries = queries.substr(queryPos + 1);
                }
            } else {
                request.path = pathQuery;
            }

            // the http type
            if (line.starts_with(strHttp1_0)) {
                request.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                request.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpRequest: Needs to be a HTTP type 1.0 or 1.1!");
            }
        } else {
            // headers
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpRequest: Headers need key and value!");
            request.headers.emplace(line.substr(0, keyPos), line.substr(keyPos + strHeaderSeperator.size()));
        }
    }

    return request;
}
//---------------------------------------------------------------------------
string HttpRequest::target() const
// The path with queries
{
    string result = path.empty() ? "/" : path;
    if (queries.size())
        result += "?";
    auto it = queries.begin();
    while (it != queries.end()) {
        result += utils::encodeUrlParameters(it->first) + "=" + utils::encodeUrlParameters(it->second);
        if (++it != queries.end())
            result += "&";
    }
    return result;
}
//---------------------------------------------------------------------------
string HttpRequest::serialize(const HttpRequest& request)
// Serialize an http header
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + request.target() + " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    return httpHeader;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::network
