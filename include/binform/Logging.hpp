/**
 * @file Logging.hpp
 * @brief Runtime control of the library's diagnostic output.
 *
 * Messages go to stderr. The initial level is taken from the
 * BINFORM_LOG_LEVEL environment variable (trace, debug, info, warn,
 * error, off) and defaults to warn.
 */

#pragma once

#include <string_view>

namespace binform
{
    enum class LogLevel
    {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    void setLogLevel(LogLevel level);
    LogLevel logLevel();

    /**
     * @brief Parses a level name, case-insensitively.
     * @throws InvalidConfiguration for unknown names.
     */
    LogLevel parseLogLevel(std::string_view name);

    std::string_view toString(LogLevel level);

    inline bool shouldLog(LogLevel level)
    {
        return level != LogLevel::Off && level >= logLevel();
    }

} // namespace binform
