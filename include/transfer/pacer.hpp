#pragma once
#include "network/body_source.hpp"
#include "utils/cancellation.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <span>
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
/// A token bucket shared by all body reads of the engine.
/// Readers take their bytes up front and sleep off any deficit, so the budget may go negative
/// and later readers queue behind earlier ones. The bucket holds at most one second of budget.
class Pacer {
    /// The rate in bytes per second, 0 is unlimited
    const uint64_t _bytesPerSecond;
    /// The mutex
    std::mutex _mutex;
    /// The available budget in bytes
    double _available;
    /// The last refill
    std::chrono::steady_clock::time_point _last;

    public:
    /// The constructor
    explicit Pacer(uint64_t bytesPerSecond);

    /// Take bytes from the budget and wait until they are covered, returns early on cancellation
    void acquire(uint64_t bytes, const utils::CancellationToken& token);
    /// The rate
    [[nodiscard]] uint64_t rate() const { return _bytesPerSecond; }
    /// Is the pacer disabled
    [[nodiscard]] bool unlimited() const { return !_bytesPerSecond; }
};
//---------------------------------------------------------------------------
/// A body that meters every piece through the pacer
class PacedReader : public network::BodySource {
    /// The maximum piece metered at once
    static constexpr uint64_t pieceSize = 64ull << 10;

    /// The wrapped body
    network::BodySource& _source;
    /// The pacer
    Pacer& _pacer;
    /// The token
    const utils::CancellationToken& _token;

    public:
    /// The constructor
    PacedReader(network::BodySource& source, Pacer& pacer, const utils::CancellationToken& token) : _source(source), _pacer(pacer), _token(token) {}

    /// The size
    [[nodiscard]] uint64_t size() const override { return _source.size(); }
    /// The next paced piece
    std::span<const uint8_t> next(uint64_t maxLength) override;
    /// Rewind
    void rewind() override { _source.rewind(); }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
