#include "cloud/content_type.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <catch2/catch.hpp>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::cloud::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static string detect(string_view data) {
    return ContentType::detect(span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}
//---------------------------------------------------------------------------
TEST_CASE("content_type") {
    REQUIRE(detect("") == ContentType::binary);
    REQUIRE(detect("%PDF-1.7\n") == "application/pdf");
    REQUIRE(detect(string_view("\x89PNG\r\n\x1a\n\0\0", 10)) == "image/png");
    REQUIRE(detect("GIF89a....") == "image/gif");
    REQUIRE(detect(string_view("\x1F\x8B\x08\0", 4)) == "application/x-gzip");
    REQUIRE(detect("  \n<!DOCTYPE HTML><html></html>") == "text/html; charset=utf-8");
    REQUIRE(detect("<?xml version=\"1.0\"?><a/>") == "text/xml; charset=utf-8");
    REQUIRE(detect("{\"key\": 1}") == "application/json");
    REQUIRE(detect("hello world\n") == "text/plain; charset=utf-8");
    REQUIRE(detect("gr\xC3\xBC\xC3\x9F") == "text/plain; charset=utf-8");
    REQUIRE(detect(string_view("\0\1\2\3", 4)) == ContentType::binary);
    REQUIRE(detect("\xFF\xFE\xFD") == ContentType::binary);
}
//---------------------------------------------------------------------------
TEST_CASE("content_type_sniff_length") {
    // Only the leading bytes decide, a cut utf-8 sequence is still text
    string text(ContentType::sniffLength - 1, 'a');
    text += "\xC3\xBC";
    text += string(100, '\0');
    REQUIRE(detect(text) == "text/plain; charset=utf-8");
}
//---------------------------------------------------------------------------
} // namespace blobcopy::cloud::test
