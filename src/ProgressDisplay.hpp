#pragma once
#include <pthread.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <string>
#include <vector>
#include "CopyScheduler.hpp"
#include "SizeEstimator.hpp"

// Redraws a status block on stderr a few times a second while a CopyScheduler runs: elapsed time,
// bytes copied against the prescanned estimate, speed, a bar, and one line per running copy.
// Log output is held back while the display is up and printed above the block instead.
class ProgressDisplay
{
public:
    ProgressDisplay(CopyScheduler& scheduler, SizeEstimate estimate);
    ~ProgressDisplay();

    ProgressDisplay(const ProgressDisplay&) = delete;
    ProgressDisplay& operator=(const ProgressDisplay&) = delete;

    void start();
    void stop();

    // Don't try to show a progress bar if we're not outputting to a terminal
    static bool canShow();

    // Lines for one redraw, without cursor movement. Exposed so the layout can be checked without a terminal.
    std::vector<std::string> renderLines(int32_t termWidth, double secondsSinceStart, double bytesPerSecond,
                                         const std::vector<CopyScheduler::ActiveTask>& activeTasks) const;

private:
    void showProgressLoop();
    void showProgress();

    static void* staticCallShowProgressLoop(void* instance) { reinterpret_cast<ProgressDisplay*>(instance)->showProgressLoop(); return nullptr; }

private:
    using Clock = std::chrono::steady_clock;
    struct SpeedMeasurementStartPoint { Clock::time_point start; uint64_t size; };

    CopyScheduler& scheduler;
    SizeEstimate estimate;

    Clock::time_point started;
    std::deque<SpeedMeasurementStartPoint> startQueue;
    int32_t linesDrawn = 0;

    pthread_t showProgressThread = {};
    pthread_mutex_t progressEndMutex = PTHREAD_MUTEX_INITIALIZER;
    bool running = false;
};
