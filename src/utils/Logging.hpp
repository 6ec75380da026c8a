/**
 * @file Logging.hpp
 * @brief Internal logging macros built on {fmt}.
 *
 * The format string is only evaluated when the level is enabled.
 * Do not pass side-effecting expressions as arguments.
 */

#pragma once

#include "binform/Logging.hpp"
#include <fmt/format.h>
#include <string>

namespace binform
{
namespace utils
{
    /**
     * @brief Writes one formatted line to stderr.
     */
    void writeLog(LogLevel level, const std::string& message);

} // namespace utils
} // namespace binform

#define BINFORM_LOG(_level, ...)                                                      \
    do                                                                                \
    {                                                                                 \
        if (::binform::shouldLog(_level))                                             \
        {                                                                             \
            ::binform::utils::writeLog(_level, fmt::format(__VA_ARGS__));             \
        }                                                                             \
    } while (0)

#define BINFORM_LOG_TRACE(...) BINFORM_LOG(::binform::LogLevel::Trace, __VA_ARGS__)
#define BINFORM_LOG_DEBUG(...) BINFORM_LOG(::binform::LogLevel::Debug, __VA_ARGS__)
#define BINFORM_LOG_INFO(...)  BINFORM_LOG(::binform::LogLevel::Info, __VA_ARGS__)
#define BINFORM_LOG_WARN(...)  BINFORM_LOG(::binform::LogLevel::Warn, __VA_ARGS__)
#define BINFORM_LOG_ERROR(...) BINFORM_LOG(::binform::LogLevel::Error, __VA_ARGS__)
