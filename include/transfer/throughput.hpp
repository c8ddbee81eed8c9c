#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
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
/// Counts the transferred bytes of a job, incremented by many workers
class ThroughputCounter {
    /// The transferred bytes
    std::atomic<uint64_t> _bytes;
    /// Guards the rate snapshot
    std::mutex _mutex;
    /// The bytes at the last snapshot
    uint64_t _lastBytes;
    /// The time of the last snapshot
    std::chrono::steady_clock::time_point _lastTime;

    public:
    /// The constructor
    ThroughputCounter() : _bytes(0), _lastBytes(0), _lastTime(std::chrono::steady_clock::now()) {}

    /// Add transferred bytes
    void updateCurrentBytes(uint64_t bytes) { _bytes.fetch_add(bytes, std::memory_order_relaxed); }
    /// The transferred bytes
    [[nodiscard]] uint64_t bytes() const { return _bytes.load(std::memory_order_relaxed); }
    /// The rate in Mbit/s since the previous snapshot
    [[nodiscard]] double snapshotMbps() {
        std::lock_guard lock(_mutex);
        auto now = std::chrono::steady_clock::now();
        auto current = bytes();
        auto seconds = std::chrono::duration<double>(now - _lastTime).count();
        auto rate = seconds > 0 ? static_cast<double>(current - _lastBytes) * 8 / seconds / 1000 / 1000 : 0.0;
        _lastBytes = current;
        _lastTime = now;
        return rate;
    }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
