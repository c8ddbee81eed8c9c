#include "utils/log.hpp"
#include "utils/utils.hpp"
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
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
using namespace std;
//---------------------------------------------------------------------------
LogLevel Log::parseLevel(string_view level)
// Parses a log level name
{
    auto lower = toLower(level);
    if (lower == "none")
        return LogLevel::None;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "warning" || lower == "warn")
        return LogLevel::Warning;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "debug")
        return LogLevel::Debug;
    throw invalid_argument("unknown log level: " + string(level));
}
//---------------------------------------------------------------------------
spdlog::level::level_enum Log::toSpdlog(LogLevel level)
// Maps to spdlog
{
    switch (level) {
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Debug: return spdlog::level::debug;
        default: return spdlog::level::off;
    }
}
//---------------------------------------------------------------------------
shared_ptr<spdlog::logger> Log::engine()
// The engine logger
{
    static once_flag created;
    static shared_ptr<spdlog::logger> logger;
    call_once(created, [] {
        auto sink = make_shared<spdlog::sinks::stderr_color_sink_mt>();
        logger = make_shared<spdlog::logger>(string(engineLoggerName), sink);
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%l%$ [%n] %v");
        logger->set_level(spdlog::level::info);
    });
    return logger;
}
//---------------------------------------------------------------------------
shared_ptr<spdlog::logger> Log::makeJobLogger(const string& jobId, const string& logDirectory, LogLevel level)
// Creates a job logger
{
    auto sinks = engine()->sinks();
    if (!logDirectory.empty()) {
        auto path = filesystem::path(logDirectory) / (jobId + ".log");
        sinks.push_back(make_shared<spdlog::sinks::basic_file_sink_mt>(path.string()));
    }
    return makeLogger(jobId, move(sinks), level);
}
//---------------------------------------------------------------------------
shared_ptr<spdlog::logger> Log::makeLogger(const string& name, vector<spdlog::sink_ptr> sinks, LogLevel level)
// Creates a logger on explicit sinks
{
    auto logger = make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%l%$ [%n] %v");
    logger->set_level(toSpdlog(level));
    logger->flush_on(spdlog::level::err);
    return logger;
}
//---------------------------------------------------------------------------
} // namespace blobcopy::utils
