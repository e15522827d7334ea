#include "core/Logger.h"

#include <cstdlib>
#include <cstring>
#include <mutex>

namespace deckmix {

// --- Static storage ---

std::atomic<int> Logger::level_{static_cast<int>(LogLevel::warn)};

std::array<LogEntry, Logger::kRingCapacity + 1> Logger::ringBuffer_;
std::atomic<int> Logger::readPos_{0};
std::atomic<int> Logger::writePos_{0};
std::atomic<int> Logger::dropped_{0};

std::chrono::steady_clock::time_point Logger::startTime_ = std::chrono::steady_clock::now();

std::atomic<Logger::LogCallback> Logger::callback_{nullptr};
std::atomic<void*> Logger::callbackUserData_{nullptr};

// Several control threads (host + timer worker) may drain
static std::mutex drainMutex;

// --- Helpers ---

static const char* basename(const char* path)
{
    const char* last = path;
    for (const char* p = path; *p; ++p)
    {
        if (*p == '/' || *p == '\\')
            last = p + 1;
    }
    return last;
}

static const char* levelTag(LogLevel level)
{
    switch (level)
    {
        case LogLevel::warn:  return "warn";
        case LogLevel::info:  return "info";
        case LogLevel::debug: return "debug";
        case LogLevel::trace: return "trace";
        default:              return "???";
    }
}

bool parseLogLevel(const char* text, LogLevel& out)
{
    if (!text || !*text)
        return false;

    static const struct { const char* name; LogLevel level; } kNames[] = {
        {"off", LogLevel::off},     {"warn", LogLevel::warn},
        {"info", LogLevel::info},   {"debug", LogLevel::debug},
        {"trace", LogLevel::trace},
    };
    for (const auto& entry : kNames)
    {
        if (std::strcmp(text, entry.name) == 0)
        {
            out = entry.level;
            return true;
        }
    }

    if (text[1] == '\0' && text[0] >= '0' && text[0] <= '4')
    {
        out = static_cast<LogLevel>(text[0] - '0');
        return true;
    }
    return false;
}

long Logger::elapsedMs()
{
    auto now = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_);
    return static_cast<long>(ms.count());
}

void Logger::emit(int level, const char* message)
{
    auto cb = callback_.load(std::memory_order_acquire);
    if (cb)
        cb(level, message, callbackUserData_.load(std::memory_order_acquire));
    else
        fprintf(stderr, "%s\n", message);
}

// --- Public API ---

void Logger::setLevel(LogLevel level)
{
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::getLevel()
{
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

bool Logger::applyEnvironmentLevel()
{
    LogLevel level;
    if (!parseLogLevel(std::getenv("DECKMIX_LOG_LEVEL"), level))
        return false;
    setLevel(level);
    return true;
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    char userMsg[384];
    va_list args;
    va_start(args, fmt);
    vsnprintf(userMsg, sizeof(userMsg), fmt, args);
    va_end(args);

    char fullMsg[512];
    snprintf(fullMsg, sizeof(fullMsg), "[%06ld][CT][%s] %s:%d %s",
             elapsedMs(), levelTag(level), basename(file), line, userMsg);

    emit(static_cast<int>(level), fullMsg);
}

void Logger::logRT(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    int w = writePos_.load(std::memory_order_relaxed);
    int nextW = (w + 1) % (kRingCapacity + 1);
    if (nextW == readPos_.load(std::memory_order_acquire))
    {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    char userMsg[384];
    va_list args;
    va_start(args, fmt);
    vsnprintf(userMsg, sizeof(userMsg), fmt, args);
    va_end(args);

    snprintf(ringBuffer_[w].message, sizeof(LogEntry::message),
             "[%06ld][RT][%s] %s:%d %s",
             elapsedMs(), levelTag(level), basename(file), line, userMsg);
    ringBuffer_[w].level = static_cast<int>(level);

    writePos_.store(nextW, std::memory_order_release);
}

int Logger::drain()
{
    std::lock_guard<std::mutex> lock(drainMutex);

    int count = 0;
    while (true)
    {
        int r = readPos_.load(std::memory_order_relaxed);
        if (r == writePos_.load(std::memory_order_acquire))
            break;

        emit(ringBuffer_[r].level, ringBuffer_[r].message);
        readPos_.store((r + 1) % (kRingCapacity + 1), std::memory_order_release);
        ++count;
    }

    int dropped = dropped_.exchange(0, std::memory_order_relaxed);
    if (dropped > 0 && getLevel() >= LogLevel::warn)
    {
        char msg[96];
        snprintf(msg, sizeof(msg), "[%06ld][CT][warn] Logger: %d audio-thread entries dropped",
                 elapsedMs(), dropped);
        emit(static_cast<int>(LogLevel::warn), msg);
    }
    return count;
}

void Logger::setCallback(LogCallback callback, void* userData)
{
    callbackUserData_.store(userData, std::memory_order_release);
    callback_.store(callback, std::memory_order_release);
}

} // namespace deckmix
