#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
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
namespace blobcopy::utils {
//---------------------------------------------------------------------------
/// A bounded multi-producer multi-consumer ring buffer of movable elements
template <typename T>
class RingBuffer {
    public:
    /// A simple spin mutex
    class SpinMutex {
        std::atomic<bool> bit;

        public:
        /// The constructor
        SpinMutex() : bit() {}

        /// Lock
        void lock() {
            auto expected = false;
            while (!bit.compare_exchange_weak(expected, true, std::memory_order_acq_rel)) {
                expected = false;
            }
        }
        /// Unlock
        void unlock() { bit.store(false, std::memory_order_release); }
    };

    private:
    /// The slots, engaged between commit and consume
    std::unique_ptr<std::optional<T>[]> _buffer;
    /// The buffer size
    uint64_t _size;
    /// The insert side, cache aligned
    struct alignas(64) {
        /// The number of inserted elements
        std::atomic<uint64_t> commited;
        /// The insert lock
        SpinMutex mutex;
    } _insert;
    /// The consume side, cache aligned
    struct alignas(64) {
        /// The number of consumed elements
        std::atomic<uint64_t> commited;
        /// The consume lock
        SpinMutex mutex;
    } _seen;

    public:
    /// The constructor
    explicit RingBuffer(uint64_t size) : _buffer(new std::optional<T>[size]()), _size(size) {}
    /// Delete copy
    RingBuffer(const RingBuffer&) = delete;
    /// Delete copy assignment
    RingBuffer& operator=(const RingBuffer&) = delete;

    /// Insert an element, returns the insert position or ~0ull if full and not waiting
    template <bool wait = false>
    uint64_t insert(T&& element) {
        while (true) {
            std::unique_lock lock(_insert.mutex);
            auto seenHead = _seen.commited.load(std::memory_order_acquire);
            auto curInsert = _insert.commited.load(std::memory_order_relaxed);
            if (curInsert - seenHead < _size) {
                _buffer[curInsert % _size].emplace(std::move(element));
                _insert.commited.store(curInsert + 1, std::memory_order_release);
                return curInsert;
            } else if (!wait) {
                return ~0ull;
            }
        }
    }
    /// Insert a copy
    template <bool wait = false>
    uint64_t insert(const T& element) {
        T copy(element);
        return insert<wait>(std::move(copy));
    }

    /// Consume the oldest element
    template <bool wait = false>
    std::optional<T> consume() {
        while (true) {
            std::unique_lock lock(_seen.mutex);
            auto curInsert = _insert.commited.load(std::memory_order_acquire);
            auto curSeen = _seen.commited.load(std::memory_order_relaxed);
            if (curInsert > curSeen) {
                auto& slot = _buffer[curSeen % _size];
                std::optional<T> value(std::move(slot));
                slot.reset();
                _seen.commited.store(curSeen + 1, std::memory_order_release);
                return value;
            } else if (!wait) {
                return std::nullopt;
            }
        }
    }

    /// Check if empty
    [[nodiscard]] bool empty() const {
        return !size();
    }
    /// Check if full
    [[nodiscard]] bool full() const {
        return size() >= _size;
    }
    /// The number of buffered elements
    [[nodiscard]] uint64_t size() const {
        auto seen = _seen.commited.load(std::memory_order_acquire);
        return _insert.commited.load(std::memory_order_acquire) - seen;
    }
    /// The capacity
    [[nodiscard]] uint64_t capacity() const {
        return _size;
    }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::utils
