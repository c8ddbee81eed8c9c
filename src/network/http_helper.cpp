#include "network/http_helper.hpp"
#include "utils/utils.hpp"
#include <charconv>
#include <stdexcept>
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
namespace blobcopy::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static constexpr string_view headerEnd = "\r\n\r\n";
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header)
// Detect the protocol
{
    Info info;
    info.response = HttpResponse::deserialize(header);

    auto end = header.find(headerEnd);
    if (end == string_view::npos)
        throw runtime_error("Invalid HttpResponse: Incomplete header!");
    info.headerLength = static_cast<uint32_t>(end + headerEnd.length());

    if (HttpResponse::withoutContent(info.response.code)) {
        info.encoding = Encoding::NoContent;
        return info;
    }

    auto transferEncoding = info.response.findHeader("Transfer-Encoding");
    if (transferEncoding && utils::toLower(*transferEncoding).find("chunked") != string::npos) {
        info.encoding = Encoding::ChunkedEncoding;
        return info;
    }
    if (auto contentLength = info.response.findHeader("Content-Length")) {
        auto [ptr, ec] = from_chars(contentLength->data(), contentLength->data() + contentLength->size(), info.length);
        if (ec != errc())
            throw runtime_error("Invalid HttpResponse: Content-Length is not a number!");
        info.encoding = Encoding::ContentLength;
        return info;
    }

    info.encoding = Encoding::UntilClose;
    return info;
}
//---------------------------------------------------------------------------
uint64_t HttpHelper::decodeChunked(string_view body, string* content)
// Walks the chunks
{
    uint64_t consumed = 0;
    while (true) {
        auto lineEnd = body.find("\r\n");
        if (lineEnd == string_view::npos)
            return 0;
        uint64_t chunkLength = 0;
        auto [ptr, ec] = from_chars(body.data(), body.data() + lineEnd, chunkLength, 16);
        if (ec != errc())
            throw runtime_error("Invalid HttpResponse: Invalid chunk length!");
        auto chunkStart = lineEnd + 2;
        if (!chunkLength) {
            // Skip the trailers
            auto trailerEnd = body.find("\r\n", chunkStart);
            while (trailerEnd != string_view::npos && trailerEnd != chunkStart) {
                chunkStart = trailerEnd + 2;
                trailerEnd = body.find("\r\n", chunkStart);
            }
            if (trailerEnd == string_view::npos)
                return 0;
            return consumed + trailerEnd + 2;
        }
        if (body.size() < chunkStart + chunkLength + 2)
            return 0;
        if (content)
            content->append(body.substr(chunkStart, chunkLength));
        consumed += chunkStart + chunkLength + 2;
        body = body.substr(chunkStart + chunkLength + 2);
    }
}
//---------------------------------------------------------------------------
bool HttpHelper::headerComplete(string_view data)
// Is the header complete
{
    return data.find(headerEnd) != string_view::npos;
}
//---------------------------------------------------------------------------
string HttpHelper::retrieveContent(string_view data, const Info& info)
// Retrieve the content without http meta info
{
    auto body = data.substr(info.headerLength);
    switch (info.encoding) {
        case Encoding::ContentLength:
            return string(body.substr(0, info.length));
        case Encoding::ChunkedEncoding: {
            string content;
            decodeChunked(body, &content);
            return content;
        }
        case Encoding::UntilClose:
            return string(body);
        default:
            return {};
    }
}
//---------------------------------------------------------------------------
bool HttpHelper::finished(string_view data, unique_ptr<Info>& info, bool closed)
// Detect end / content
{
    if (!info) {
        if (!headerComplete(data))
            return false;
        info = make_unique<Info>(detect(data));
    }
    switch (info->encoding) {
        case Encoding::NoContent:
            return true;
        case Encoding::ContentLength:
            return data.size() >= info->headerLength + info->length;
        case Encoding::ChunkedEncoding: {
            auto consumed = decodeChunked(data.substr(info->headerLength), nullptr);
            if (consumed)
                info->length = consumed;
            return consumed != 0;
        }
        case Encoding::UntilClose:
            if (closed)
                info->length = data.size() - info->headerLength;
            return closed;
        default: {
            info = nullptr;
            throw runtime_error("Unsupported HTTP transfer protocol");
        }
    }
}
//---------------------------------------------------------------------------
} // namespace blobcopy::network
