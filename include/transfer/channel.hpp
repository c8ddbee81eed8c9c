#pragma once
#include "utils/ring_buffer.hpp"
#include "utils/utils.hpp"
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::transfer {
//---------------------------------------------------------------------------
/// A bounded blocking channel, senders wait while it is full
template <typename T>
class Channel {
    /// The buffer
    utils::RingBuffer<T> _buffer;
    /// The mutex for the waiters
    std::mutex _mutex;
    /// Wakes receivers
    std::condition_variable _notEmpty;
    /// Wakes senders
    std::condition_variable _notFull;
    /// Is the channel closed
    bool _closed;

    public:
    /// The constructor
    explicit Channel(uint64_t capacity) : _buffer(capacity), _closed(false) {}

    /// Send, blocks while full, returns false if closed
    bool send(T&& value) {
        std::unique_lock lock(_mutex);
        _notFull.wait(lock, [this] { return _closed || !_buffer.full(); });
        if (_closed)
            return false;
        verify(_buffer.insert(std::move(value)) != ~0ull);
        lock.unlock();
        _notEmpty.notify_one();
        return true;
    }
    /// Send without waiting, returns false if full or closed
    bool trySend(T&& value) {
        std::unique_lock lock(_mutex);
        if (_closed || _buffer.insert(std::move(value)) == ~0ull)
            return false;
        lock.unlock();
        _notEmpty.notify_one();
        return true;
    }
    /// Receive, blocks while empty, returns nullopt once closed and drained
    std::optional<T> receive() {
        std::unique_lock lock(_mutex);
        _notEmpty.wait(lock, [this] { return _closed || !_buffer.empty(); });
        auto value = _buffer.consume();
        lock.unlock();
        if (value)
            _notFull.notify_one();
        return value;
    }
    /// Close the channel, pending elements can still be received
    void close() {
        {
            std::lock_guard lock(_mutex);
            _closed = true;
        }
        _notEmpty.notify_all();
        _notFull.notify_all();
    }

    /// The number of queued elements
    [[nodiscard]] uint64_t size() const { return _buffer.size(); }
    /// The capacity
    [[nodiscard]] uint64_t capacity() const { return _buffer.capacity(); }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
