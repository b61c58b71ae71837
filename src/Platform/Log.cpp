/**
 * @file Log.cpp
 * @brief Leveled diagnostic output implementation
 */

#include <QiTraffic/Platform/Log.h>

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>
#include <vector>

namespace Qi::Traffic::Platform {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_sinkMutex;
LogSink g_sink;

void WriteToStderr(LogLevel level, const std::string& message) {
    std::fprintf(stderr, "[QiTraffic][%s] %s\n", LogLevelName(level), message.c_str());
}

std::string FormatMessage(const char* format, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int length = std::vsnprintf(nullptr, 0, format, copy);
    va_end(copy);

    if (length <= 0) {
        return std::string();
    }

    std::vector<char> buffer(static_cast<size_t>(length) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), format, args);
    return std::string(buffer.data(), static_cast<size_t>(length));
}

void Dispatch(LogLevel level, const char* format, va_list args) {
    if (!IsLogEnabled(level)) {
        return;
    }
    std::string message = FormatMessage(format, args);

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    if (g_sink) {
        g_sink(level, message);
    } else {
        WriteToStderr(level, message);
    }
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

void SetLogLevel(LogLevel level) {
    g_level = level;
}

LogLevel GetLogLevel() {
    return g_level;
}

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink = std::move(sink);
}

bool IsLogEnabled(LogLevel level) {
    LogLevel threshold = g_level;
    return level != LogLevel::Off && threshold != LogLevel::Off &&
           static_cast<int>(level) >= static_cast<int>(threshold);
}

void Log(LogLevel level, const char* format, ...) {
    va_list args;
    va_start(args, format);
    Dispatch(level, format, args);
    va_end(args);
}

void LogDebug(const char* format, ...) {
    va_list args;
    va_start(args, format);
    Dispatch(LogLevel::Debug, format, args);
    va_end(args);
}

void LogInfo(const char* format, ...) {
    va_list args;
    va_start(args, format);
    Dispatch(LogLevel::Info, format, args);
    va_end(args);
}

void LogWarning(const char* format, ...) {
    va_list args;
    va_start(args, format);
    Dispatch(LogLevel::Warning, format, args);
    va_end(args);
}

void LogError(const char* format, ...) {
    va_list args;
    va_start(args, format);
    Dispatch(LogLevel::Error, format, args);
    va_end(args);
}

} // namespace Qi::Traffic::Platform
