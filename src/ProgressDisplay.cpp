#include "ProgressDisplay.hpp"
#include <sys/ioctl.h>
#include <unistd.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include "Assert.hpp"
#include "Config.hpp"
#include "Log.hpp"
#include "Util.hpp"

namespace
{
    std::string leftPad(const std::string& str, int32_t targetLength, char padChar = ' ')
    {
        std::string pad;
        for (int32_t i = 0; i < targetLength - int32_t(str.length()); i++)
            pad += padChar;
        return pad + str;
    }

    std::string rightPad(const std::string& str, int32_t targetLength)
    {
        std::string padded(str);
        for (int32_t i = int32_t(str.length()); i < targetLength; i++)
            padded += ' ';
        return padded;
    }

    std::string humanFriendlyTime(double seconds)
    {
        double minute = 60;
        double hour = 60 * 60;

        uint32_t hours = uint32_t(floor(seconds / hour));
        seconds -= hours * hour;

        uint32_t minutes = uint32_t(floor(seconds / minute));
        seconds -= minutes * minute;

        if (hours > 0)
            return std::to_string(hours) + "h" + std::to_string(minutes) + "m";
        if (minutes > 0)
            return std::to_string(minutes) + "m" + leftPad(std::to_string(uint32_t(floor(seconds))), 2, '0') + "s";

        return leftPad(std::to_string(uint32_t(floor(seconds))), 2, '0') + "s";
    }
}

ProgressDisplay::ProgressDisplay(CopyScheduler& scheduler, SizeEstimate estimate)
    : scheduler(scheduler)
    , estimate(estimate)
{
}

ProgressDisplay::~ProgressDisplay()
{
    if (this->running)
        this->stop();

    [[maybe_unused]] int ret = pthread_mutex_destroy(&this->progressEndMutex);
    debug_assert(ret == 0);
}

bool ProgressDisplay::canShow()
{
    return isatty(STDERR_FILENO) && getenv("TERM") && logLevelEnabled(LogLevel::Error);
}

void ProgressDisplay::start()
{
    release_assert(!this->running);

    this->started = Clock::now();
    this->startQueue.clear();
    this->startQueue.push_back(SpeedMeasurementStartPoint { this->started, this->scheduler.getProgress().get() });
    this->linesDrawn = 0;

    setLogDeferred(true);

    // The loop sleeps by trying to take this mutex with a timeout, stop() releases it to wake it early
    pthread_mutex_lock(&this->progressEndMutex);
    int err = pthread_create(&this->showProgressThread, nullptr, ProgressDisplay::staticCallShowProgressLoop, this);
    if (err != 0)
    {
        pthread_mutex_unlock(&this->progressEndMutex);
        setLogDeferred(false);
        log_warn("Couldn't start progress display: \"%s\"", strerror(err));
        return;
    }

    this->running = true;
}

void ProgressDisplay::stop()
{
    if (!this->running)
        return;

    pthread_mutex_unlock(&this->progressEndMutex);
    pthread_join(this->showProgressThread, nullptr);
    this->running = false;

    setLogDeferred(false);
}

std::vector<std::string> ProgressDisplay::renderLines(int32_t termWidth, double secondsSinceStart, double bytesPerSecond,
                                                      const std::vector<CopyScheduler::ActiveTask>& activeTasks) const
{
    std::vector<std::string> lines;

    // read once so our calculations are consistent with eachother
    uint64_t copied = this->scheduler.getProgress().get();
    uint64_t toCopy = this->estimate.totalBytes;

    // The estimate is advisory, a source that grew while we copied can overshoot it
    if (copied > toCopy)
        toCopy = copied;

    // status line
    {
        std::string left = " Elapsed: " + humanFriendlyTime(secondsSinceStart);
        std::string centre = leftPad(humanFriendlyFileSize(copied), 10) + " / " + humanFriendlyFileSize(toCopy);

        std::string right = leftPad(humanFriendlyFileSize(uint64_t(bytesPerSecond)), 10) + "/s   ETA: ";
        if (bytesPerSecond > 0)
            right += "~" + humanFriendlyTime(double(toCopy - copied) / bytesPerSecond);
        else
            right += "???";
        right += " ";

        std::string statusLine = left;
        int32_t centreStart = termWidth / 2 - int32_t(centre.length()) / 2;
        statusLine = rightPad(statusLine, centreStart) + centre;
        statusLine += leftPad(right, termWidth - int32_t(statusLine.length()));

        lines.emplace_back(std::move(statusLine));
    }

    // progress bar
    {
        float ratio = toCopy > 0 ? float(copied) / float(toCopy) : 0;
        int percentDone = int(ratio * 100.0f);

        int32_t width = std::max(termWidth - 6, 0);

        std::string progressBarLine = leftPad(std::to_string(percentDone), 3) + "% ";

        int doneChars = int(ratio * float(width));
        for (int32_t i = 0; i < width; i++)
            progressBarLine += i < doneChars ? "█" : "▒";

        lines.emplace_back(std::move(progressBarLine));
    }

    for (const CopyScheduler::ActiveTask& task : activeTasks)
    {
        std::string size = " " + humanFriendlyFileSize(task.bytesCopied);
        int32_t nameWidth = std::max(termWidth - int32_t(size.length()) - 2, 0);
        lines.emplace_back("  " + rightPad(truncateFilename(task.label, size_t(nameWidth)), nameWidth) + size);
    }

    return lines;
}

void ProgressDisplay::showProgress()
{
    int32_t termWidth = 100;
    {
        winsize winsize = {};
        if (ioctl(STDERR_FILENO, TIOCGWINSZ, &winsize) == 0 && winsize.ws_col > 0)
            termWidth = winsize.ws_col;
    }

    uint64_t copied = this->scheduler.getProgress().get();
    Clock::time_point now = Clock::now();

    double secondsSinceStart = std::chrono::duration<double>(now - this->started).count();

    // Speed over a sliding window of the last 45 seconds
    double bytesPerSecond = 0;
    {
        SpeedMeasurementStartPoint& currentStart = this->startQueue.front();
        double windowSeconds = std::chrono::duration<double>(now - currentStart.start).count();
        if (windowSeconds > 0)
            bytesPerSecond = double(copied - currentStart.size) / windowSeconds;

        this->startQueue.push_back(SpeedMeasurementStartPoint { now, copied });
        if (windowSeconds > 45.0)
            this->startQueue.pop_front();
    }

    // return to start of line, and move up to the top left of our previous draw area
    if (this->linesDrawn > 0)
        fprintf(stderr, "\r\033[%dA", this->linesDrawn);

    for (const std::string& message : takeDeferredLogLines())
        fprintf(stderr, "%s\033[K\n", message.c_str());

    std::vector<std::string> lines = this->renderLines(termWidth, secondsSinceStart, bytesPerSecond,
                                                       this->scheduler.snapshotActiveTasks());
    for (const std::string& line : lines)
        fprintf(stderr, "%s\033[K\n", line.c_str());

    // Clear whatever is left over from a previous, taller block
    if (int32_t(lines.size()) < this->linesDrawn)
        fputs("\033[J", stderr);

    this->linesDrawn = int32_t(lines.size());
}

void ProgressDisplay::showProgressLoop()
{
    pthread_setname_np(pthread_self(), "show progress");

    fputs("\n", stderr);

    while (true)
    {
        this->showProgress();

        // wait for the specified time, but allow fast exit when we're done (by calling thread unlocking the mutex)
        timespec timeoutTime = {};
        clock_gettime(CLOCK_REALTIME, &timeoutTime);
        float interval = Config::PROGRESS_UPDATE_INTERVAL_SECONDS;
        timeoutTime.tv_sec += time_t(std::floor(interval));
        timeoutTime.tv_nsec += long((interval - std::floor(interval)) * 1000000000.0f);
        if (timeoutTime.tv_nsec >= 1000000000L)
        {
            timeoutTime.tv_sec += 1;
            timeoutTime.tv_nsec -= 1000000000L;
        }

        int err = pthread_mutex_timedlock(&this->progressEndMutex, &timeoutTime);
        release_assert(err == 0 || err == ETIMEDOUT);
        if (err == 0)
        {
            pthread_mutex_unlock(&this->progressEndMutex);
            break;
        }
    }

    // final state
    this->showProgress();
}
