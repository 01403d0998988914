#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <array>
#include <fmt/format.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace preflight
{

enum class LogPartition : size_t
{
#define LOG_PARTITION(name) name,
#include "util/LogPartitions.def"
#undef LOG_PARTITION
    NumPartitions
};

using LogLevel = spdlog::level::level_enum;

class Logging
{
    static std::array<std::shared_ptr<spdlog::logger>,
                      static_cast<size_t>(LogPartition::NumPartitions)>
        mLoggers;

    static void init();

  public:
    static std::array<char const*,
                      static_cast<size_t>(LogPartition::NumPartitions)> const
        kPartitionNames;

    // Loggers are created lazily, once per process, and are safe to use from
    // any thread.
    static spdlog::logger& getLogger(LogPartition partition);

    // Sets the level of a single partition, or of every partition when
    // `partition` is null. Returns false if the partition name is unknown.
    static bool setLogLevel(LogLevel level, char const* partition);
    static LogLevel getLogLevel(LogPartition partition);

    // Throws std::invalid_argument on unknown names.
    static LogLevel getLLfromString(std::string const& levelName);
    static std::string getStringFromLL(LogLevel level);
};
}

#define PLOG_LEVEL(lvl, partition, f, ...)                                     \
    do                                                                         \
    {                                                                          \
        auto& _plogger =                                                       \
            preflight::Logging::getLogger(preflight::LogPartition::partition); \
        if (_plogger.should_log(lvl))                                          \
        {                                                                      \
            _plogger.log(lvl, FMT_STRING(f), ##__VA_ARGS__);                   \
        }                                                                      \
    } while (false)

#define PLOG_TRACE(partition, f, ...)                                          \
    PLOG_LEVEL(spdlog::level::trace, partition, f, ##__VA_ARGS__)
#define PLOG_DEBUG(partition, f, ...)                                          \
    PLOG_LEVEL(spdlog::level::debug, partition, f, ##__VA_ARGS__)
#define PLOG_INFO(partition, f, ...)                                           \
    PLOG_LEVEL(spdlog::level::info, partition, f, ##__VA_ARGS__)
#define PLOG_WARNING(partition, f, ...)                                        \
    PLOG_LEVEL(spdlog::level::warn, partition, f, ##__VA_ARGS__)
#define PLOG_ERROR(partition, f, ...)                                          \
    PLOG_LEVEL(spdlog::level::err, partition, f, ##__VA_ARGS__)
#define PLOG_FATAL(partition, f, ...)                                          \
    PLOG_LEVEL(spdlog::level::critical, partition, f, ##__VA_ARGS__)
