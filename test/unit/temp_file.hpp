#pragma once
#include "utils/utils.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::test {
//---------------------------------------------------------------------------
/// A file in the temp directory that is removed again
class TempFile {
    /// The path
    std::filesystem::path _path;

    public:
    /// Creates the file with the content
    explicit TempFile(const std::string& content) : _path(std::filesystem::temp_directory_path() / ("blobcopy-" + utils::UUID::generate().toString())) {
        std::ofstream out(_path, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }
    /// Creates a file of size bytes with a repeating pattern
    static std::string pattern(uint64_t size) {
        std::string content(size, '\0');
        for (uint64_t i = 0; i < size; i++)
            content[i] = static_cast<char>('a' + i % 26);
        return content;
    }
    /// The destructor
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(_path, ec);
    }

    /// The path
    [[nodiscard]] std::string path() const { return _path.string(); }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::test
