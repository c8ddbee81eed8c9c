#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <spdlog/common.h>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace spdlog {
class logger;
} // namespace spdlog
//---------------------------------------------------------------------------
namespace blobcopy::utils {
//---------------------------------------------------------------------------
/// The log levels, ordered by verbosity
enum class LogLevel : uint8_t {
    None = 0,
    Error = 1,
    Warning = 2,
    Info = 3,
    Debug = 4
};
//---------------------------------------------------------------------------
/// Logging helpers on top of spdlog
class Log {
    public:
    /// The engine logger name
    static constexpr std::string_view engineLoggerName = "blobcopy";

    /// Parse a level, throws std::invalid_argument
    [[nodiscard]] static LogLevel parseLevel(std::string_view level);
    /// The level name
    [[nodiscard]] static constexpr std::string_view levelName(LogLevel level) {
        switch (level) {
            case LogLevel::None: return "NONE";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Info: return "INFO";
            case LogLevel::Debug: return "DEBUG";
            default: return "UNKNOWN";
        }
    }
    /// Is a message of level `message` emitted for a minimum of `minimum`
    [[nodiscard]] static constexpr bool enabled(LogLevel message, LogLevel minimum) {
        return message != LogLevel::None && static_cast<uint8_t>(message) <= static_cast<uint8_t>(minimum);
    }
    /// Convert to the spdlog level
    [[nodiscard]] static spdlog::level::level_enum toSpdlog(LogLevel level);

    /// The shared engine logger (stderr)
    [[nodiscard]] static std::shared_ptr<spdlog::logger> engine();
    /// Creates a job logger sharing the engine sinks plus an optional file in logDirectory
    [[nodiscard]] static std::shared_ptr<spdlog::logger> makeJobLogger(const std::string& jobId, const std::string& logDirectory, LogLevel level);
    /// Creates a logger on explicit sinks
    [[nodiscard]] static std::shared_ptr<spdlog::logger> makeLogger(const std::string& name, std::vector<spdlog::sink_ptr> sinks, LogLevel level);
};
//---------------------------------------------------------------------------
} // namespace blobcopy::utils
