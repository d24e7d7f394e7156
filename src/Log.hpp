#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class LogLevel : int32_t
{
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

bool logLevelEnabled(LogLevel level);
void logMessage(LogLevel level, const char* format, ...) __attribute__((format(printf, 2, 3)));

// While deferred, lines are queued instead of written, so the progress display can print them
// above its own output without the two interleaving.
void setLogDeferred(bool deferred);
std::vector<std::string> takeDeferredLogLines();

#define log_error(...) logMessage(LogLevel::Error, __VA_ARGS__)
#define log_warn(...) logMessage(LogLevel::Warn, __VA_ARGS__)
#define log_info(...) logMessage(LogLevel::Info, __VA_ARGS__)
#define log_debug(...) logMessage(LogLevel::Debug, __VA_ARGS__)
