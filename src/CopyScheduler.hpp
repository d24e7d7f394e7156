#pragma once
#include <pthread.h>
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "FileCopier.hpp"
#include "Heap.hpp"
#include "ProgressCounter.hpp"
#include "Util.hpp"

// Copies a list of top level sources into one destination directory. Each source is a unit of work
// handled start to finish by one of a fixed number of worker threads, so at most getConcurrency()
// copies run at once. Every unit writes only under its own destination.join(basename(source)). When two
// sources share a basename the first one listed gets the target and the rest fail before they start.
class CopyScheduler
{
public:
    explicit CopyScheduler(size_t requestedConcurrency, size_t chunkSize = Config::CHUNK_SIZE);
    ~CopyScheduler();

    CopyScheduler(const CopyScheduler&) = delete;
    CopyScheduler& operator=(const CopyScheduler&) = delete;

    // Blocks until every source has been copied or has failed. destination must already exist and be a
    // directory. Returns true if any source failed.
    bool run(const std::vector<std::string>& sources, const std::string& destination, bool recursive);

    void setFileCopiedHook(FileCopiedHook hook) { this->fileCopiedHook = std::move(hook); }

    size_t getConcurrency() const { return this->concurrency; }
    const ProgressCounter& getProgress() const { return this->runProgress; }
    uint32_t getSucceededCount() const { return this->succeededCount; }
    uint32_t getFailedCount() const { return this->failedCount; }

    struct ActiveTask
    {
        std::string label;
        uint64_t bytesCopied;
    };
    std::vector<ActiveTask> snapshotActiveTasks();

    // Clamps to [1, number of online cpus]
    static size_t clampConcurrency(size_t requested);

    // Name a top level source gets inside the destination directory
    static std::string targetName(const std::string& source);

private:
    struct CopyTask
    {
        std::string source;
        std::string dest;
        bool isDirectory = false;
        ProgressCounter progress;
    };

    void onError(Error&& error);
    void workerLoop();
    Result runTask(FileCopier& copier, CopyTask& task);

    static void* staticCallWorkerLoop(void* instance) { reinterpret_cast<CopyScheduler*>(instance)->workerLoop(); return nullptr; }

private:
    size_t concurrency;
    Heap copyBufferHeap;
    FileCopiedHook fileCopiedHook;

    std::deque<std::unique_ptr<CopyTask>> pendingTasks;
    std::vector<CopyTask*> activeTasks;
    pthread_mutex_t tasksMutex = PTHREAD_MUTEX_INITIALIZER;

    ProgressCounter runProgress;
    std::atomic_bool errored = false;
    std::atomic_uint32_t succeededCount = 0;
    std::atomic_uint32_t failedCount = 0;
};

// One-shot form of CopyScheduler::run()
bool runCopy(const std::vector<std::string>& sources, const std::string& destination, bool recursive, size_t concurrency);
