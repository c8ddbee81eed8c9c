#pragma once
#include <cstdint>
#include <span>
#include <string>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::utils {
//---------------------------------------------------------------------------
/// A read-only memory mapped view of a source file
/// The mapping and the file descriptor are released separately so that a failing close can be reported
class MappedFile {
    /// The file descriptor
    int _fd;
    /// The mapped region
    const uint8_t* _data;
    /// The mapped length
    uint64_t _length;

    public:
    /// An empty view
    MappedFile() : _fd(-1), _data(nullptr), _length(0) {}
    /// Delete copy
    MappedFile(const MappedFile&) = delete;
    /// Delete copy assignment
    MappedFile& operator=(const MappedFile&) = delete;
    /// Move constructor
    MappedFile(MappedFile&& other) noexcept;
    /// Move assignment
    MappedFile& operator=(MappedFile&& other) noexcept;
    /// The destructor releases whatever is still held
    ~MappedFile();

    /// Open and map `length` bytes of the file, throws std::runtime_error
    [[nodiscard]] static MappedFile open(const std::string& path, uint64_t length);

    /// The mapped bytes
    [[nodiscard]] std::span<const uint8_t> view() const { return {_data, _length}; }
    /// A slice of the mapped bytes
    [[nodiscard]] std::span<const uint8_t> slice(uint64_t offset, uint64_t length) const;
    /// The mapped length
    [[nodiscard]] uint64_t size() const { return _length; }
    /// Is a region mapped
    [[nodiscard]] bool mapped() const { return _data; }
    /// Is the file still open
    [[nodiscard]] bool isOpen() const { return _fd >= 0; }

    /// Unmap the region, no-op if not mapped
    void unmap();
    /// Close the file, returns 0 or the errno of a failing close
    int close();
};
//---------------------------------------------------------------------------
} // namespace blobcopy::utils
