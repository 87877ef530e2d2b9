#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>

namespace FontGrep {

inline long long getTimestampMs() {
    static auto startTime = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();
}

// DEBUG_LOG output is only produced once verbose logging has been switched on
inline std::atomic<bool>& verboseLogging() {
    static std::atomic<bool> enabled{false};
    return enabled;
}

inline void setVerboseLogging(bool enabled) {
    verboseLogging().store(enabled, std::memory_order_relaxed);
}

// Serializes log lines coming from worker threads
inline std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace FontGrep

#define DEBUG_LOG(msg) do { \
    if (::FontGrep::verboseLogging().load(std::memory_order_relaxed)) { \
        std::lock_guard<std::mutex> _logLock(::FontGrep::logMutex()); \
        std::cerr << "[" << ::FontGrep::getTimestampMs() << "ms] " << msg << std::endl; \
    } \
} while(0)

#define WARN_LOG(msg) do { \
    std::lock_guard<std::mutex> _logLock(::FontGrep::logMutex()); \
    std::cerr << "[" << ::FontGrep::getTimestampMs() << "ms] warning: " << msg << std::endl; \
} while(0)

namespace FontGrep {

// Scoped timer that logs if operation exceeds threshold
class ScopedTimer {
public:
    ScopedTimer(const char* name, int thresholdMs = 50)
        : m_name(name), m_thresholdMs(thresholdMs), m_start(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_start).count();
        if (elapsed >= m_thresholdMs) {
            DEBUG_LOG("SLOW: " << m_name << " took " << elapsed << "ms");
        }
    }

private:
    const char* m_name;
    int m_thresholdMs;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace FontGrep

#define FONTGREP_CONCAT_INNER(a, b) a##b
#define FONTGREP_CONCAT(a, b) FONTGREP_CONCAT_INNER(a, b)
#define SCOPED_TIMER(name) ::FontGrep::ScopedTimer FONTGREP_CONCAT(_timer_, __LINE__)(name)
#define SCOPED_TIMER_THRESHOLD(name, ms) ::FontGrep::ScopedTimer FONTGREP_CONCAT(_timer_, __LINE__)(name, ms)
