// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Logging.h"
#include <cstring>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace preflight
{

std::array<std::shared_ptr<spdlog::logger>,
           static_cast<size_t>(LogPartition::NumPartitions)>
    Logging::mLoggers;

std::array<char const*, static_cast<size_t>(LogPartition::NumPartitions)> const
    Logging::kPartitionNames = {
#define LOG_PARTITION(name) #name,
#include "util/LogPartitions.def"
#undef LOG_PARTITION
};

namespace
{
std::once_flag gLoggingInit;
LogLevel const kDefaultLogLevel = spdlog::level::info;
}

void
Logging::init()
{
    // The host process may run several preflight calls at once, so every
    // partition shares one thread-safe sink. Loggers are kept out of the
    // spdlog registry to avoid clashing with names the host registers.
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    for (size_t i = 0; i < mLoggers.size(); ++i)
    {
        auto logger =
            std::make_shared<spdlog::logger>(kPartitionNames.at(i), sink);
        logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e [%n %l] %v");
        logger->set_level(kDefaultLogLevel);
        logger->flush_on(spdlog::level::err);
        mLoggers.at(i) = logger;
    }
}

spdlog::logger&
Logging::getLogger(LogPartition partition)
{
    std::call_once(gLoggingInit, &Logging::init);
    return *mLoggers.at(static_cast<size_t>(partition));
}

bool
Logging::setLogLevel(LogLevel level, char const* partition)
{
    std::call_once(gLoggingInit, &Logging::init);
    if (partition == nullptr)
    {
        for (auto& logger : mLoggers)
        {
            logger->set_level(level);
        }
        return true;
    }
    for (size_t i = 0; i < kPartitionNames.size(); ++i)
    {
        if (std::strcmp(kPartitionNames.at(i), partition) == 0)
        {
            mLoggers.at(i)->set_level(level);
            return true;
        }
    }
    return false;
}

LogLevel
Logging::getLogLevel(LogPartition partition)
{
    return getLogger(partition).level();
}

LogLevel
Logging::getLLfromString(std::string const& levelName)
{
    if (levelName == "trace")
    {
        return spdlog::level::trace;
    }
    if (levelName == "debug")
    {
        return spdlog::level::debug;
    }
    if (levelName == "info")
    {
        return spdlog::level::info;
    }
    if (levelName == "warning")
    {
        return spdlog::level::warn;
    }
    if (levelName == "error")
    {
        return spdlog::level::err;
    }
    if (levelName == "fatal")
    {
        return spdlog::level::critical;
    }
    if (levelName == "none")
    {
        return spdlog::level::off;
    }
    throw std::invalid_argument("unknown log level: " + levelName);
}

std::string
Logging::getStringFromLL(LogLevel level)
{
    switch (level)
    {
    case spdlog::level::trace:
        return "trace";
    case spdlog::level::debug:
        return "debug";
    case spdlog::level::info:
        return "info";
    case spdlog::level::warn:
        return "warning";
    case spdlog::level::err:
        return "error";
    case spdlog::level::critical:
        return "fatal";
    default:
        return "none";
    }
}
}
