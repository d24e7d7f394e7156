#include "Log.hpp"
#include <pthread.h>
#include <cstdarg>
#include <cstdio>
#include "Config.hpp"

namespace
{
    pthread_mutex_t logMutex = PTHREAD_MUTEX_INITIALIZER;
    bool logDeferred = false;
    std::vector<std::string> deferredLines;

    const char* levelPrefix(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::Error:
                return "error: ";
            case LogLevel::Warn:
                return "warning: ";
            case LogLevel::Info:
                return "";
            case LogLevel::Debug:
                return "debug: ";
        }

        return "";
    }
}

bool logLevelEnabled(LogLevel level)
{
    return int32_t(level) <= Config::LOG_LEVEL;
}

void logMessage(LogLevel level, const char* format, ...)
{
    if (!logLevelEnabled(level))
        return;

    std::string line = levelPrefix(level);
    {
        va_list args;
        va_start(args, format);
        va_list argsCopy;
        va_copy(argsCopy, args);

        int length = vsnprintf(nullptr, 0, format, args);
        if (length > 0)
        {
            size_t prefixLength = line.size();
            line.resize(prefixLength + size_t(length) + 1);
            vsnprintf(line.data() + prefixLength, size_t(length) + 1, format, argsCopy);
            line.resize(prefixLength + size_t(length));
        }

        va_end(argsCopy);
        va_end(args);
    }

    pthread_mutex_lock(&logMutex);
    {
        if (logDeferred)
            deferredLines.emplace_back(std::move(line));
        else
            fprintf(stderr, "%s\n", line.c_str());
    }
    pthread_mutex_unlock(&logMutex);
}

void setLogDeferred(bool deferred)
{
    std::vector<std::string> toFlush;

    pthread_mutex_lock(&logMutex);
    {
        logDeferred = deferred;
        if (!deferred)
            deferredLines.swap(toFlush);
    }
    pthread_mutex_unlock(&logMutex);

    for (const auto& line : toFlush)
        fprintf(stderr, "%s\n", line.c_str());
}

std::vector<std::string> takeDeferredLogLines()
{
    std::vector<std::string> lines;

    pthread_mutex_lock(&logMutex);
    deferredLines.swap(lines);
    pthread_mutex_unlock(&logMutex);

    return lines;
}
