#pragma once

#include <atomic>
#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <string>

namespace spindeck {

struct LogEntry {
    char message[512];
    int level;
};

enum class LogLevel : int { off = 0, error = 1, warn = 2, info = 3, debug = 4, trace = 5 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    /// Parses "off", "error", "warn", "info", "debug" or "trace".
    /// Returns false and leaves `level` untouched for anything else.
    static bool parseLevel(const std::string& name, LogLevel& level);

    // Control-timeline logging: direct fprintf to stderr (or callback)
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Audio-thread logging: lock-free push to internal ring buffer.
    // vsnprintf is allocation-free for %d, %s, %x, %p on mainstream libcs;
    // keep RT format strings to those plus plain %.Nf.
    static void logRT(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Drain RT queue (control timeline only)
    static void drain();

    // Optional sink for embedding hosts and tests
    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static long elapsedMs();

    static std::atomic<int> level_;

    static constexpr int kRingCapacity = 1024;
    static std::array<LogEntry, kRingCapacity + 1> ringBuffer_;
    static std::atomic<int> readPos_;
    static std::atomic<int> writePos_;

    static std::chrono::steady_clock::time_point startTime_;
    static LogCallback callback_;
    static void* callbackUserData_;
};

} // namespace spindeck

// --- Macros ---

#define SD_LOG_AT_(lvl, fn, fmt, ...) \
    do { if (spindeck::Logger::getLevel() >= spindeck::LogLevel::lvl) \
        spindeck::Logger::fn(spindeck::LogLevel::lvl, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define SD_ERROR(fmt, ...)    SD_LOG_AT_(error, log, fmt, ##__VA_ARGS__)
#define SD_WARN(fmt, ...)     SD_LOG_AT_(warn, log, fmt, ##__VA_ARGS__)
#define SD_WARN_RT(fmt, ...)  SD_LOG_AT_(warn, logRT, fmt, ##__VA_ARGS__)
#define SD_INFO(fmt, ...)     SD_LOG_AT_(info, log, fmt, ##__VA_ARGS__)
#define SD_DEBUG(fmt, ...)    SD_LOG_AT_(debug, log, fmt, ##__VA_ARGS__)
#define SD_DEBUG_RT(fmt, ...) SD_LOG_AT_(debug, logRT, fmt, ##__VA_ARGS__)
#define SD_TRACE(fmt, ...)    SD_LOG_AT_(trace, log, fmt, ##__VA_ARGS__)
#define SD_TRACE_RT(fmt, ...) SD_LOG_AT_(trace, logRT, fmt, ##__VA_ARGS__)
