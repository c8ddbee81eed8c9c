#include "transfer/config.hpp"
#include <charconv>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
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
using namespace std;
//---------------------------------------------------------------------------
uint64_t Config::parseUnsigned(const string& variable, const string& value)
// Parse an unsigned value
{
    uint64_t result = 0;
    auto [ptr, ec] = from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != errc() || ptr != value.data() + value.size())
        throw invalid_argument(variable + " needs an unsigned number, got '" + value + "'");
    return result;
}
//---------------------------------------------------------------------------
void Config::validate() const
// Validate the values
{
    if (!chunkWorkers)
        throw invalid_argument("BLOBCOPY_CONCURRENCY needs at least one chunk worker");
    if (!transferWorkers)
        throw invalid_argument("BLOBCOPY_TRANSFER_WORKERS needs at least one transfer worker");
    if (!chunkChannelCapacity)
        throw invalid_argument("BLOBCOPY_CHUNK_QUEUE needs a capacity of at least one");
    if (!defaultBlockSize)
        throw invalid_argument("BLOBCOPY_BLOCK_SIZE needs a block size of at least one byte");
    if (bandwidthMbps > numeric_limits<uint64_t>::max() / (1000 * 1000))
        throw invalid_argument("BLOBCOPY_BANDWIDTH_MBPS is out of range");
}
//---------------------------------------------------------------------------
Config Config::fromEnvironment()
// The defaults overridden by the environment
{
    Config config;
    auto read = [](const char* variable, auto& target) {
        auto value = getenv(variable);
        if (!value)
            return;
        auto parsed = parseUnsigned(variable, value);
        if (parsed > numeric_limits<remove_reference_t<decltype(target)>>::max())
            throw invalid_argument(string(variable) + " is out of range");
        target = static_cast<remove_reference_t<decltype(target)>>(parsed);
    };
    read("BLOBCOPY_CONCURRENCY", config.chunkWorkers);
    read("BLOBCOPY_TRANSFER_WORKERS", config.transferWorkers);
    read("BLOBCOPY_CHUNK_QUEUE", config.chunkChannelCapacity);
    read("BLOBCOPY_BANDWIDTH_MBPS", config.bandwidthMbps);
    read("BLOBCOPY_BLOCK_SIZE", config.defaultBlockSize);

    if (auto level = getenv("BLOBCOPY_LOG_LEVEL")) {
        try {
            config.logLevel = utils::Log::parseLevel(level);
        } catch (const invalid_argument& error) {
            throw invalid_argument(string("BLOBCOPY_LOG_LEVEL: ") + error.what());
        }
    }
    if (auto directory = getenv("BLOBCOPY_LOG_DIR"))
        config.logDirectory = directory;

    config.validate();
    return config;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer
