#pragma once

/**
 * @file Timer.h
 * @brief Monotonic timing of engine runs
 *
 * Provides:
 * - Timer: accumulating stopwatch
 * - ScopedLogTimer: logs the lifetime of a scope through Platform/Log
 *
 * Usage:
 * @code
 * Timer timer(true);
 * RunPass();
 * LogInfo("pass took %.1f ms", timer.ElapsedMs());
 *
 * {
 *     ScopedLogTimer scope("cut tracks");
 *     CutAll();
 * }   // Debug: "cut tracks: 3.2 ms"
 * @endcode
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Platform/Log.h>

#include <chrono>
#include <string>

namespace Qi::Traffic::Platform {

/**
 * @brief Stopwatch on std::chrono::steady_clock
 *
 * Intervals between Start() and Stop() add up until Reset().
 */
class QITRAFFIC_API Timer {
public:
    using Clock = std::chrono::steady_clock;

    explicit Timer(bool autoStart = false);

    void Start();
    void Stop();
    void Reset();

    bool IsRunning() const { return running_; }

    /// Accumulated time, including the running interval
    std::chrono::nanoseconds Elapsed() const;

    double ElapsedSeconds() const;
    double ElapsedMs() const;

    /// Elapsed milliseconds, then restart from zero
    double Lap();

private:
    Clock::time_point startedAt_;
    std::chrono::nanoseconds total_{0};
    bool running_ = false;
};

/**
 * @brief Logs "<label>: <ms> ms" when the scope ends
 *
 * Nothing is measured or logged if the level is disabled at construction.
 */
class QITRAFFIC_API ScopedLogTimer {
public:
    explicit ScopedLogTimer(std::string label, LogLevel level = LogLevel::Debug);
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

private:
    std::string label_;
    LogLevel level_;
    bool enabled_;
    Timer timer_;
};

} // namespace Qi::Traffic::Platform
