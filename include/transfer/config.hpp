#pragma once
#include "utils/log.hpp"
#include <cstdint>
#include <string>
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
/// Config for the number of workers, the queue and the bandwidth
struct Config {
    /// Default number of chunk workers
    static constexpr unsigned defaultChunkWorkers = 32;
    /// Default number of prologue workers
    static constexpr unsigned defaultTransferWorkers = 2;
    /// Default capacity of the chunk channel
    static constexpr uint64_t defaultChunkChannelCapacity = 1024;
    /// Default block size, 8 MiB
    static constexpr uint64_t defaultBlockSizeBytes = 8ull << 20;

    /// Concurrent chunk executions
    unsigned chunkWorkers = defaultChunkWorkers;
    /// Concurrent prologues
    unsigned transferWorkers = defaultTransferWorkers;
    /// Bounded capacity of the chunk channel
    uint64_t chunkChannelCapacity = defaultChunkChannelCapacity;
    /// The bandwidth ceiling in Mbit/s, 0 is unlimited
    uint64_t bandwidthMbps = 0;
    /// Block size used when a transfer carries none
    uint64_t defaultBlockSize = defaultBlockSizeBytes;
    /// The engine log level
    utils::LogLevel logLevel = utils::LogLevel::Info;
    /// Directory for the job log files, empty disables them
    std::string logDirectory;

    /// The pacer rate in bytes per second, 0 is unlimited
    [[nodiscard]] constexpr uint64_t pacerBytesPerSecond() const { return bandwidthMbps * 1000 * 1000 / 8; }

    /// Validate the values, throws std::invalid_argument
    void validate() const;
    /// The defaults overridden by BLOBCOPY_* variables, throws std::invalid_argument
    [[nodiscard]] static Config fromEnvironment();
    /// Parse an unsigned value named by variable, throws std::invalid_argument
    [[nodiscard]] static uint64_t parseUnsigned(const std::string& variable, const std::string& value);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
