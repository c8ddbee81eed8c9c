#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
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
class CancellationSource;
//---------------------------------------------------------------------------
/// Observes the cancellation of a source, cheap to copy
class CancellationToken {
    /// The shared state
    struct State {
        /// The cancelled flag
        std::atomic<bool> cancelled{false};
        /// Mutex for the sleepers
        std::mutex mutex;
        /// Wakes up sleepers on cancel
        std::condition_variable cv;
    };
    /// The state
    std::shared_ptr<State> _state;

    /// The constructor
    explicit CancellationToken(std::shared_ptr<State> state) : _state(std::move(state)) {}

    public:
    /// A token that is never cancelled
    CancellationToken() : _state(std::make_shared<State>()) {}

    /// Was the source cancelled
    [[nodiscard]] bool isCancelled() const { return _state->cancelled.load(std::memory_order_acquire); }
    /// Sleeps for the duration or until cancelled, returns true if cancelled
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock lock(_state->mutex);
        return _state->cv.wait_for(lock, duration, [this] { return isCancelled(); });
    }

    friend CancellationSource;
};
//---------------------------------------------------------------------------
/// The owner side of a cancellation signal
class CancellationSource {
    /// The token
    CancellationToken _token;

    public:
    /// The constructor
    CancellationSource() : _token() {}
    /// Delete copy
    CancellationSource(const CancellationSource&) = delete;
    /// Delete copy assignment
    CancellationSource& operator=(const CancellationSource&) = delete;

    /// Set the signal, returns true for the call that actually cancelled
    bool cancel() {
        auto& state = *_token._state;
        bool expected = false;
        if (!state.cancelled.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
            return false;
        { std::lock_guard lock(state.mutex); }
        state.cv.notify_all();
        return true;
    }
    /// Was it cancelled
    [[nodiscard]] bool isCancelled() const { return _token.isCancelled(); }
    /// Get a token
    [[nodiscard]] const CancellationToken& token() const { return _token; }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::utils
