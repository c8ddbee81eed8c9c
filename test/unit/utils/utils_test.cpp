#include "utils/utils.hpp"
#include "utils/cancellation.hpp"
#include <chrono>
#include <cstring>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <catch2/catch.hpp>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("uuid") {
    auto uuid = UUID::generate();
    auto text = uuid.toString();
    REQUIRE(text.size() == 36);
    REQUIRE(text[8] == '-');
    REQUIRE(text[14] == '4');
    REQUIRE(UUID::parse(text) == uuid);
    REQUIRE(!uuid.empty());
    REQUIRE(UUID().empty());

    auto upper = UUID::parse("0F1E2D3C-4B5A-4978-8695-A4B3C2D1E0F9");
    REQUIRE(upper.toString() == "0f1e2d3c-4b5a-4978-8695-a4b3c2d1e0f9");

    REQUIRE_THROWS_AS(UUID::parse("not-a-uuid"), invalid_argument);
    REQUIRE_THROWS_AS(UUID::parse("0f1e2d3c-4b5a-4978-8695-a4b3c2d1e0fz"), invalid_argument);
    REQUIRE_THROWS_AS(UUID::parse("0f1e2d3c04b5a-4978-8695-a4b3c2d1e0f9"), invalid_argument);

    set<string> seen;
    for (auto i = 0u; i < 1000u; i++)
        seen.insert(UUID::generate().toString());
    REQUIRE(seen.size() == 1000);
}
//---------------------------------------------------------------------------
TEST_CASE("base64") {
    string plain = "BlobCopy - Chunked Cloud Blob Transfer Engine";
    auto encoded = base64Encode(reinterpret_cast<const uint8_t*>(plain.data()), plain.size());
    REQUIRE(encoded == "QmxvYkNvcHkgLSBDaHVua2VkIENsb3VkIEJsb2IgVHJhbnNmZXIgRW5naW5l");

    auto decoded = base64Decode(reinterpret_cast<const uint8_t*>(encoded.data()), encoded.size());
    REQUIRE(string_view(reinterpret_cast<const char*>(decoded.first.get()), decoded.second) == plain);

    // Block ids of one blob need equal length
    auto first = UUID::generate().toString();
    auto second = UUID::generate().toString();
    REQUIRE(base64Encode(reinterpret_cast<const uint8_t*>(first.data()), first.size()).size() == base64Encode(reinterpret_cast<const uint8_t*>(second.data()), second.size()).size());
}
//---------------------------------------------------------------------------
TEST_CASE("hex_and_url_encoding") {
    uint8_t bytes[] = {0x00, 0x7f, 0xab, 0xff};
    REQUIRE(hexEncode(bytes, sizeof(bytes)) == "007fabff");
    REQUIRE(hexEncode(bytes, sizeof(bytes), true) == "007FABFF");

    REQUIRE(encodeUrlParameters("abc-_.~XYZ019") == "abc-_.~XYZ019");
    REQUIRE(encodeUrlParameters("a b/c=d&e") == "a%20b%2Fc%3Dd%26e");
    REQUIRE(encodeUrlParameters("QUJD+/==") == "QUJD%2B%2F%3D%3D");
    REQUIRE(toLower("X-Ms-Date") == "x-ms-date");
}
//---------------------------------------------------------------------------
TEST_CASE("hmac") {
    string key = "key";
    string message = "message";
    auto signature = hmacSign(reinterpret_cast<const uint8_t*>(key.data()), key.size(), reinterpret_cast<const uint8_t*>(message.data()), message.size());
    REQUIRE(base64Encode(signature.first.get(), signature.second) == "bp7ym3X//Ft6uuUn1Y/a2y/kLnIZARl2kXNDBl9Y7Uo=");
}
//---------------------------------------------------------------------------
TEST_CASE("cancellation") {
    CancellationSource source;
    auto token = source.token();
    REQUIRE(!token.isCancelled());
    REQUIRE(!token.waitFor(chrono::milliseconds(1)));

    thread canceller([&source] {
        this_thread::sleep_for(chrono::milliseconds(20));
        source.cancel();
    });
    auto start = chrono::steady_clock::now();
    REQUIRE(token.waitFor(chrono::seconds(10)));
    REQUIRE(chrono::steady_clock::now() - start < chrono::seconds(5));
    canceller.join();

    REQUIRE(token.isCancelled());
    REQUIRE(!source.cancel());
}
//---------------------------------------------------------------------------
} // namespace blobcopy::utils::test
