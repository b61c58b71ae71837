/**
 * @file Timer.cpp
 * @brief Timer and ScopedLogTimer implementation
 */

#include <QiTraffic/Platform/Timer.h>

#include <utility>

namespace Qi::Traffic::Platform {

// ============================================================================
// Timer
// ============================================================================

Timer::Timer(bool autoStart) {
    if (autoStart) {
        Start();
    }
}

void Timer::Start() {
    if (running_) {
        return;
    }
    startedAt_ = Clock::now();
    running_ = true;
}

void Timer::Stop() {
    if (!running_) {
        return;
    }
    total_ += std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - startedAt_);
    running_ = false;
}

void Timer::Reset() {
    total_ = std::chrono::nanoseconds(0);
    running_ = false;
}

std::chrono::nanoseconds Timer::Elapsed() const {
    if (!running_) {
        return total_;
    }
    return total_ + std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - startedAt_);
}

double Timer::ElapsedSeconds() const {
    return std::chrono::duration<double>(Elapsed()).count();
}

double Timer::ElapsedMs() const {
    return std::chrono::duration<double, std::milli>(Elapsed()).count();
}

double Timer::Lap() {
    double ms = ElapsedMs();
    Reset();
    Start();
    return ms;
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::ScopedLogTimer(std::string label, LogLevel level)
    : label_(std::move(label)), level_(level), enabled_(IsLogEnabled(level)), timer_(enabled_) {}

ScopedLogTimer::~ScopedLogTimer() {
    if (enabled_) {
        Log(level_, "%s: %.1f ms", label_.c_str(), timer_.ElapsedMs());
    }
}

} // namespace Qi::Traffic::Platform
