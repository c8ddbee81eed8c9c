#pragma once
#include <cstdint>
#include <map>
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
/// Implements an helper to serialize and deserialize http request headers
struct HttpRequest {
    /// The method class
    enum class Method : uint8_t {
        GET,
        PUT,
        POST,
        DELETE,
        HEAD
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The queries - values are url encoded on serialization
    std::map<std::string, std::string> queries;
    /// The headers - need to be without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The method
    Method method = Method::GET;
    /// The type
    Type type = Type::HTTP_1_1;
    /// The path - needs to be RFC 3986 conform
    std::string path;

    /// Get the request method
    static constexpr auto getRequestMethod(const Method& method) {
        switch (method) {
            case Method::GET: return "GET";
            case Method::PUT: return "PUT";
            case Method::POST: return "POST";
            case Method::DELETE: return "DELETE";
            case Method::HEAD: return "HEAD";
            default: return "";
        }
    }
    /// Get the request type
    static constexpr auto getRequestType(const Type& type) {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "";
        }
    }
    /// The path with the encoded query string
    [[nodiscard]] std::string target() const;
    /// Serialize the request header
    [[nodiscard]] static std::string serialize(const HttpRequest& request);
    /// Deserialize the request header, throws std::runtime_error
    [[nodiscard]] static HttpRequest deserialize(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::network
