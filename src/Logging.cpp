/**
 * @file Logging.cpp
 * @brief Log level state and the stderr sink.
 */

#include "utils/Logging.hpp"
#include "binform/Errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace binform
{
namespace
{
    LogLevel initialLevel()
    {
        const char* env = std::getenv("BINFORM_LOG_LEVEL");
        if (env == nullptr || *env == '\0') return LogLevel::Warn;

        try
        {
            return parseLogLevel(env);
        }
        catch (const InvalidConfiguration& e)
        {
            fmt::print(stderr, "[binform] ignoring BINFORM_LOG_LEVEL: {}\n", e.what());
            return LogLevel::Warn;
        }
    }

    std::atomic<LogLevel>& levelState()
    {
        static std::atomic<LogLevel> level{initialLevel()};
        return level;
    }

    std::mutex& sinkMutex()
    {
        static std::mutex m;
        return m;
    }

} // namespace

void setLogLevel(LogLevel level)
{
    levelState().store(level, std::memory_order_relaxed);
}

LogLevel logLevel()
{
    return levelState().load(std::memory_order_relaxed);
}

LogLevel parseLogLevel(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;

    throw InvalidConfiguration("unknown log level '" + std::string(name) + "'");
}

std::string_view toString(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

namespace utils
{
    void writeLog(LogLevel level, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(sinkMutex());
        fmt::print(stderr, "[binform] [{}] {}\n", toString(level), message);
    }
} // namespace utils

} // namespace binform
