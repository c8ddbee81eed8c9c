#include "network/http_request.hpp"
#include <stdexcept>
#include <string>
#include <catch2/catch.hpp>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::network::test {
//---------------------------------------------------------------------------
TEST_CASE("http_request") {
    HttpRequest request;

    request.method = HttpRequest::Method::PUT;
    request.path = "/container/a/b%20c.bin";
    request.type = HttpRequest::Type::HTTP_1_1;
    request.queries.emplace("comp", "block");
    request.queries.emplace("blockid", "QUJD+/==");
    request.headers.emplace("Authorization", "test");
    request.headers.emplace("x-ms-date", "Fri, 01 Jan 2100 00:00:00 GMT");

    REQUIRE(request.target() == "/container/a/b%20c.bin?blockid=QUJD%2B%2F%3D%3D&comp=block");

    auto serialized = HttpRequest::serialize(request);
    REQUIRE(serialized == "PUT /container/a/b%20c.bin?blockid=QUJD%2B%2F%3D%3D&comp=block HTTP/1.1\r\nAuthorization: test\r\nx-ms-date: Fri, 01 Jan 2100 00:00:00 GMT\r\n\r\n");

    auto deserialized = HttpRequest::deserialize(serialized);
    REQUIRE(deserialized.method == HttpRequest::Method::PUT);
    REQUIRE(deserialized.path == request.path);
    REQUIRE(deserialized.queries == request.queries);
    REQUIRE(deserialized.headers == request.headers);
    REQUIRE(HttpRequest::serialize(deserialized) == serialized);
}
//---------------------------------------------------------------------------
TEST_CASE("http_request_without_query") {
    HttpRequest request;
    REQUIRE(request.target() == "/");
    request.path = "/x";
    REQUIRE(HttpRequest::serialize(request) == "GET /x HTTP/1.1\r\n\r\n");
}
//---------------------------------------------------------------------------
TEST_CASE("http_request_invalid") {
    REQUIRE_THROWS_AS(HttpRequest::deserialize("PUT /x HTTP/1.1\r\n"), std::runtime_error);
    REQUIRE_THROWS_AS(HttpRequest::deserialize("FETCH /x HTTP/1.1\r\n\r\n"), std::runtime_error);
    REQUIRE_THROWS_AS(HttpRequest::deserialize("PUT /x HTTP/2\r\n\r\n"), std::runtime_error);
    REQUIRE_THROWS_AS(HttpRequest::deserialize("PUT /x HTTP/1.1\r\nbroken\r\n\r\n"), std::runtime_error);
    REQUIRE_THROWS_AS(HttpRequest::deserialize("PUT /x?blockid=%zz HTTP/1.1\r\n\r\n"), std::runtime_error);
    REQUIRE_THROWS_AS(HttpRequest::deserialize("PUT /x?blockid=%4g HTTP/1.1\r\n\r\n"), std::runtime_error);
    REQUIRE_THROWS_AS(HttpRequest::deserialize("PUT /x?blockid=QQ%3 HTTP/1.1\r\n\r\n"), std::runtime_error);
    REQUIRE(HttpRequest::deserialize("PUT /x?blockid=QQ%3d%3D HTTP/1.1\r\n\r\n").queries.at("blockid") == "QQ==");
}
//---------------------------------------------------------------------------
} // namespace blobcopy::network::test
