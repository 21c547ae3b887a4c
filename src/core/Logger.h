#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace addsynth {

enum class LogLevel : int { off = 0, warn = 1, info = 2, debug = 3, trace = 4 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Formats and writes one line to stderr (or the callback, if set)
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Optional callback for host language log capture
    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static long elapsedMs();

    static std::atomic<int> level_;
    static std::chrono::steady_clock::time_point startTime_;
    static LogCallback callback_;
    static void* callbackUserData_;
};

} // namespace addsynth

// --- Macros ---

#define AS_WARN(fmt, ...) \
    do { if (addsynth::Logger::getLevel() >= addsynth::LogLevel::warn) \
        addsynth::Logger::log(addsynth::LogLevel::warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define AS_INFO(fmt, ...) \
    do { if (addsynth::Logger::getLevel() >= addsynth::LogLevel::info) \
        addsynth::Logger::log(addsynth::LogLevel::info, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define AS_DEBUG(fmt, ...) \
    do { if (addsynth::Logger::getLevel() >= addsynth::LogLevel::debug) \
        addsynth::Logger::log(addsynth::LogLevel::debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define AS_TRACE(fmt, ...) \
    do { if (addsynth::Logger::getLevel() >= addsynth::LogLevel::trace) \
        addsynth::Logger::log(addsynth::LogLevel::trace, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)
