#include "cloud/content_type.hpp"
#include "utils/utils.hpp"
#include <string_view>
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
static bool validUtf8(string_view text)
// Checks utf-8 sequences, a sequence cut at the end is accepted
{
    for (size_t i = 0; i < text.size();) {
        auto c = static_cast<uint8_t>(text[i]);
        size_t length;
        if (c < 0x80) {
            // Control characters other than whitespace mark binary data
            if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f')
                return false;
            length = 1;
        } else if ((c & 0xE0) == 0xC0) {
            length = 2;
        } else if ((c & 0xF0) == 0xE0) {
            length = 3;
        } else if ((c & 0xF8) == 0xF0) {
            length = 4;
        } else {
            return false;
        }
        for (size_t k = 1; k < length; k++) {
            if (i + k >= text.size())
                return true;
            if ((static_cast<uint8_t>(text[i + k]) & 0xC0) != 0x80)
                return false;
        }
        i += length;
    }
    return true;
}
//---------------------------------------------------------------------------
string ContentType::detect(span<const uint8_t> data)
// Detect the content type
{
    if (data.empty())
        return binary;
    string_view head(reinterpret_cast<const char*>(data.data()), data.size() < sniffLength ? data.size() : sniffLength);

    // Binary signatures
    static constexpr pair<string_view, const char*> signatures[] = {
        {"%PDF-", "application/pdf"},
        {"\x89PNG\r\n\x1a\n", "image/png"},
        {"\xFF\xD8\xFF", "image/jpeg"},
        {"GIF87a", "image/gif"},
        {"GIF89a", "image/gif"},
        {"PK\x03\x04", "application/zip"},
        {"\x1F\x8B\x08", "application/x-gzip"}};
    for (auto& [signature, type] : signatures)
        if (head.starts_with(signature))
            return type;

    // Text signatures after leading whitespace
    auto text = head;
    if (text.starts_with("\xEF\xBB\xBF"))
        text.remove_prefix(3);
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\n' || text.front() == '\r'))
        text.remove_prefix(1);
    auto lower = utils::toLower(text.substr(0, 16));
    if (lower.starts_with("<!doctype html") || lower.starts_with("<html") || lower.starts_with("<head") || lower.starts_with("<body"))
        return "text/html; charset=utf-8";
    if (lower.starts_with("<?xml"))
        return "text/xml; charset=utf-8";
    if (validUtf8(head)) {
        if (!text.empty() && (text.front() == '{' || text.front() == '['))
            return "application/json";
        return "text/plain; charset=utf-8";
    }
    return binary;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::cloud
