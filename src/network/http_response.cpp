#include "network/http_response.hpp"
#include "utils/utils.hpp"
#include <charconv>
#include <stdexcept>
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
const string* HttpResponse::findHeader(string_view name) const
// Find a header case-insensitively
{
    auto lowerName = utils::toLower(name);
    for (auto& keyValue : headers)
        if (utils::toLower(keyValue.first) == lowerName)
            return &keyValue.second;
    return nullptr;
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ":";

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }

            string_view httpType = getResponseType(response.type);
            if (line.size() < httpType.size() + 4)
                throw runtime_error("Invalid HttpResponse: Missing status code!");
            line = line.substr(httpType.size() + 1);

            // the status code and the optional reason phrase
            auto [ptr, ec] = from_chars(line.data(), line.data() + 3, response.code);
            if (ec != errc() || ptr != line.data() + 3 || response.code < 100)
                throw runtime_error("Invalid HttpResponse: Invalid status code!");
            if (line.size() > 4)
                response.reason = line.substr(4);
        } else {
            // headers
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpResponse: Headers need key and value!");
            auto key = line.substr(0, keyPos);
            auto value = line.substr(keyPos + 1);
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
                value.remove_prefix(1);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
                value.remove_suffix(1);
            response.headers.emplace(key, value);
        }
    }

    return response;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::network
