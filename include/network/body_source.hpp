#pragma once
#include <cstdint>
#include <span>
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
/// A rewindable request body that is streamed in pieces
class BodySource {
    public:
    /// The destructor
    virtual ~BodySource() noexcept = default;
    /// The total size of the body
    [[nodiscard]] virtual uint64_t size() const = 0;
    /// The next piece of at most maxLength bytes, empty at the end
    virtual std::span<const uint8_t> next(uint64_t maxLength) = 0;
    /// Start again from the first byte
    virtual void rewind() = 0;
};
//---------------------------------------------------------------------------
/// A body over a fixed memory region
class BufferSource : public BodySource {
    /// The data
    std::span<const uint8_t> _data;
    /// The read offset
    uint64_t _offset;

    public:
    /// The constructor
    explicit BufferSource(std::span<const uint8_t> data) : _data(data), _offset(0) {}

    /// The total size
    [[nodiscard]] uint64_t size() const override { return _data.size(); }
    /// The next piece
    std::span<const uint8_t> next(uint64_t maxLength) override {
        auto length = _data.size() - _offset < maxLength ? _data.size() - _offset : maxLength;
        auto piece = _data.subspan(_offset, length);
        _offset += length;
        return piece;
    }
    /// Rewind
    void rewind() override { _offset = 0; }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::network
