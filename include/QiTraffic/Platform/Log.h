#pragma once

/**
 * @file Log.h
 * @brief Leveled diagnostic output
 *
 * Messages are printf-formatted and handed to a sink. The default sink writes
 * "[QiTraffic][LEVEL] message" lines to stderr. Hosts and tests may install
 * their own sink; the sink is called under a mutex, one message at a time.
 *
 * Usage:
 * @code
 * LogInfo("created %zu events for %zu tracks", events.size(), tracks.size());
 * @endcode
 */

#include <QiTraffic/Core/Export.h>

#include <functional>
#include <string>

namespace Qi::Traffic::Platform {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off     ///< Suppress all output
};

/// Receives (level, formatted message without trailing newline)
using LogSink = std::function<void(LogLevel, const std::string&)>;

/// Upper-case name ("DEBUG", "INFO", ...)
QITRAFFIC_API const char* LogLevelName(LogLevel level);

/// Messages below this level are discarded (default: Info)
QITRAFFIC_API void SetLogLevel(LogLevel level);
QITRAFFIC_API LogLevel GetLogLevel();

/// Replace the sink; an empty function restores the stderr sink
QITRAFFIC_API void SetLogSink(LogSink sink);

QITRAFFIC_API bool IsLogEnabled(LogLevel level);

QITRAFFIC_API void Log(LogLevel level, const char* format, ...);

// Convenience wrappers
QITRAFFIC_API void LogDebug(const char* format, ...);
QITRAFFIC_API void LogInfo(const char* format, ...);
QITRAFFIC_API void LogWarning(const char* format, ...);
QITRAFFIC_API void LogError(const char* format, ...);

} // namespace Qi::Traffic::Platform
