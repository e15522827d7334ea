#pragma once

#include <atomic>
#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace deckmix {

struct LogEntry {
    char message[512];
    int level;
};

enum class LogLevel : int { off = 0, warn = 1, info = 2, debug = 3, trace = 4 };

/// Parse "off", "warn", "info", "debug", "trace" (or "0".."4").
/// Returns false and leaves `out` untouched for anything else.
bool parseLogLevel(const char* text, LogLevel& out);

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    /// Apply DECKMIX_LOG_LEVEL from the environment if it is set and valid.
    static bool applyEnvironmentLevel();

    // Control/timer threads: formatted straight to stderr (or callback)
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Audio device callback: lock-free push into a ring buffer, no I/O.
    static void logRT(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Flush entries queued by logRT (never call from the audio callback)
    static int drain();

    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static long elapsedMs();
    static void emit(int level, const char* message);

    static std::atomic<int> level_;

    static constexpr int kRingCapacity = 512;
    static std::array<LogEntry, kRingCapacity + 1> ringBuffer_;
    static std::atomic<int> readPos_;
    static std::atomic<int> writePos_;
    static std::atomic<int> dropped_;

    static std::chrono::steady_clock::time_point startTime_;
    static std::atomic<LogCallback> callback_;
    static std::atomic<void*> callbackUserData_;
};

} // namespace deckmix

// --- Macros ---

#define DM_LOG_AT(lvl, fn, fmt, ...) \
    do { if (deckmix::Logger::getLevel() >= deckmix::LogLevel::lvl) \
        deckmix::Logger::fn(deckmix::LogLevel::lvl, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define DM_WARN(fmt, ...)     DM_LOG_AT(warn, log, fmt, ##__VA_ARGS__)
#define DM_WARN_RT(fmt, ...)  DM_LOG_AT(warn, logRT, fmt, ##__VA_ARGS__)
#define DM_INFO(fmt, ...)     DM_LOG_AT(info, log, fmt, ##__VA_ARGS__)
#define DM_INFO_RT(fmt, ...)  DM_LOG_AT(info, logRT, fmt, ##__VA_ARGS__)
#define DM_DEBUG(fmt, ...)    DM_LOG_AT(debug, log, fmt, ##__VA_ARGS__)
#define DM_DEBUG_RT(fmt, ...) DM_LOG_AT(debug, logRT, fmt, ##__VA_ARGS__)
#define DM_TRACE(fmt, ...)    DM_LOG_AT(trace, log, fmt, ##__VA_ARGS__)
#define DM_TRACE_RT(fmt, ...) DM_LOG_AT(trace, logRT, fmt, ##__VA_ARGS__)
