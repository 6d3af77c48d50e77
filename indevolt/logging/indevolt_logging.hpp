#pragma once

#include <iostream>
#include <sstream>

namespace indevolt
{
namespace logging
{

enum class LogLevel
{
    Error   = 0,
    Warning = 1,
    Info    = 2,
    Debug   = 3,
    Trace   = 4
};

// Global log level, Info unless changed with INDEVOLT_SET_LOG_LEVEL
extern LogLevel current_log_level;

inline bool should_log(LogLevel level)
{
    return static_cast<int>(level) <= static_cast<int>(current_log_level);
}

inline const char* get_log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Trace:
        return "TRACE";
    default:
        return "UNKNOWN";
    }
}

} // namespace logging
} // namespace indevolt

#define INDEVOLT_SET_LOG_LEVEL(level) indevolt::logging::current_log_level = indevolt::logging::LogLevel::level

// Writes "[LEVEL] function: message" as one line; message may be a stream expression
#define INDEVOLT_LOG_AT(level, message)                                                                                           \
    do                                                                                                                            \
    {                                                                                                                             \
        if (indevolt::logging::should_log(indevolt::logging::LogLevel::level))                                                    \
        {                                                                                                                         \
            std::ostringstream oss;                                                                                               \
            oss << "[" << indevolt::logging::get_log_level_name(indevolt::logging::LogLevel::level) << "] " << __func__ << ": "   \
                << message << "\n";                                                                                               \
            std::cout << oss.str();                                                                                               \
        }                                                                                                                         \
    } while (0)

#define INDEVOLT_LOG_ERROR(message)   INDEVOLT_LOG_AT(Error, message)
#define INDEVOLT_LOG_WARNING(message) INDEVOLT_LOG_AT(Warning, message)
#define INDEVOLT_LOG_INFO(message)    INDEVOLT_LOG_AT(Info, message)
#define INDEVOLT_LOG_DEBUG(message)   INDEVOLT_LOG_AT(Debug, message)
#define INDEVOLT_LOG_TRACE(message)   INDEVOLT_LOG_AT(Trace, message)
