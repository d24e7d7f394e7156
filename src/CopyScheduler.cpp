#include "CopyScheduler.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>
#include <set>
#include "Assert.hpp"
#include "Log.hpp"
#include "TreeWalker.hpp"

CopyScheduler::CopyScheduler(size_t requestedConcurrency, size_t chunkSize)
    : concurrency(CopyScheduler::clampConcurrency(requestedConcurrency))
    , copyBufferHeap(this->concurrency * 2, chunkSize)
{
}

CopyScheduler::~CopyScheduler()
{
    [[maybe_unused]] int ret = pthread_mutex_destroy(&this->tasksMutex);
    debug_assert(ret == 0);
}

size_t CopyScheduler::clampConcurrency(size_t requested)
{
    long cpus = sysconf(_SC_NPROCESSORS_ONLN);
    size_t max = cpus > 0 ? size_t(cpus) : 1;
    return std::clamp<size_t>(requested, 1, max);
}

std::string CopyScheduler::targetName(const std::string& source)
{
    std::string name = pathBasename(source);

    // "..", "." and "/" don't name anything, so use what they resolve to instead
    if (name.empty() || name == "." || name == "..")
    {
        GetCwdResult cwd = myGetCwd();
        if (std::holds_alternative<std::string>(cwd))
            name = pathBasename(normalizePath(source, std::get<std::string>(cwd)));
    }

    return name;
}

void CopyScheduler::onError(Error&& error)
{
    this->errored = true;
    this->failedCount++;

    log_error("%s", error.humanFriendlyErrorMessage->c_str());
}

std::vector<CopyScheduler::ActiveTask> CopyScheduler::snapshotActiveTasks()
{
    std::vector<ActiveTask> snapshot;

    pthread_mutex_lock(&this->tasksMutex);
    {
        snapshot.reserve(this->activeTasks.size());
        for (const CopyTask* task : this->activeTasks)
            snapshot.push_back(ActiveTask { task->source, task->progress.get() });
    }
    pthread_mutex_unlock(&this->tasksMutex);

    return snapshot;
}

bool CopyScheduler::run(const std::vector<std::string>& sources, const std::string& destination, bool recursive)
{
    using namespace std::string_literals;

    this->errored = false;
    this->succeededCount = 0;
    this->failedCount = 0;
    this->runProgress.reset();

    // Relative sources are normalized against the cwd. If it can't be read, targets are compared as given,
    // which is still exact for the common case of one destination string.
    std::string workingDirectory;
    {
        GetCwdResult cwdResult = myGetCwd();
        if (std::string* cwd = std::get_if<std::string>(&cwdResult))
            workingDirectory = std::move(*cwd);
        else
            log_debug("Comparing copy targets without a working directory: %s",
                      std::get<Error>(cwdResult).humanFriendlyErrorMessage->c_str());
    }
    std::set<std::string> claimedTargets;

    // Entries that fail here never take up a worker
    for (const std::string& source : sources)
    {
        struct statx sourceStat = {};
        int err = retrySyscall([&]()
        {
            statx(AT_FDCWD, source.c_str(), 0, STATX_TYPE, &sourceStat);
        });

        if (err == ENOENT || err == ENOTDIR)
        {
            this->onError(Error(Error::Kind::SourceNotFound, "Source path does not exist: \""s + source + "\""s));
            continue;
        }
        if (err != 0)
        {
            this->onError(Error("Failed to stat \""s + source + "\": \""s + strerror(err) + "\""s));
            continue;
        }

        bool isDirectory = S_ISDIR(sourceStat.stx_mode);
        if (isDirectory && !recursive)
        {
            this->onError(Error(Error::Kind::SourceIsDirectoryWithoutRecursion,
                                "Source path is a directory, but recursive flag is not set: \""s + source + "\""s));
            continue;
        }
        if (!isDirectory && !S_ISREG(sourceStat.stx_mode))
        {
            this->onError(Error("Source path is not a regular file or directory: \""s + source + "\""s));
            continue;
        }

        auto task = std::make_unique<CopyTask>();
        task->source = source;
        task->dest = joinPath(destination, CopyScheduler::targetName(source));
        task->isDirectory = isDirectory;

        // First source listed keeps the target, later ones with the same basename fail
        if (!claimedTargets.insert(normalizePath(task->dest, workingDirectory)).second)
        {
            this->onError(Error(Error::Kind::DuplicateTarget,
                                "Another source is already being copied to \""s + task->dest + "\": \""s + source + "\""s));
            continue;
        }

        pthread_mutex_lock(&this->tasksMutex);
        this->pendingTasks.emplace_back(std::move(task));
        pthread_mutex_unlock(&this->tasksMutex);
    }

    size_t threadCount = std::min(this->concurrency, this->pendingTasks.size());
    log_debug("Scheduling %zu copies on %zu workers", this->pendingTasks.size(), threadCount);

    std::vector<pthread_t> workers;
    workers.reserve(threadCount);
    for (size_t i = 0; i < threadCount; i++)
    {
        pthread_t worker;
        int err = pthread_create(&worker, nullptr, CopyScheduler::staticCallWorkerLoop, this);
        if (err != 0)
        {
            // Whoever did start will drain the queue. If nothing started, the loop below cleans up.
            log_warn("Couldn't start copy worker: \"%s\"", strerror(err));
            break;
        }
        workers.push_back(worker);
    }

    for (pthread_t worker : workers)
        pthread_join(worker, nullptr);

    while (!this->pendingTasks.empty())
    {
        std::unique_ptr<CopyTask> task = std::move(this->pendingTasks.front());
        this->pendingTasks.pop_front();
        this->onError(Error("Couldn't start a worker to copy \""s + task->source + "\""s));
    }

    debug_assert(this->activeTasks.empty());
    debug_assert(this->copyBufferHeap.getFreeBlocksCount() == this->copyBufferHeap.getBlockCount());

    return this->errored;
}

void CopyScheduler::workerLoop()
{
    pthread_setname_np(pthread_self(), "copy worker");

    FileCopier copier(this->copyBufferHeap);
    copier.setFileCopiedHook(this->fileCopiedHook);

    while (true)
    {
        std::unique_ptr<CopyTask> task;

        pthread_mutex_lock(&this->tasksMutex);
        {
            if (!this->pendingTasks.empty())
            {
                task = std::move(this->pendingTasks.front());
                this->pendingTasks.pop_front();
                this->activeTasks.push_back(task.get());
            }
        }
        pthread_mutex_unlock(&this->tasksMutex);

        if (!task)
            return;

        Result result = this->runTask(copier, *task);

        pthread_mutex_lock(&this->tasksMutex);
        this->activeTasks.erase(std::find(this->activeTasks.begin(), this->activeTasks.end(), task.get()));
        pthread_mutex_unlock(&this->tasksMutex);

        if (std::holds_alternative<Error>(result))
        {
            this->onError(std::move(std::get<Error>(result)));
        }
        else
        {
            this->succeededCount++;
            log_info("Copied \"%s\" -> \"%s\"", task->source.c_str(), task->dest.c_str());
        }
    }
}

Result CopyScheduler::runTask(FileCopier& copier, CopyTask& task)
{
    if (task.isDirectory)
        return copyDirectoryTree(copier, task.source, task.dest, &task.progress, &this->runProgress);

    CopyFileResult result = copier.copyFile(task.source, task.dest, &task.progress, &this->runProgress);
    if (std::holds_alternative<Error>(result))
        return std::move(std::get<Error>(result));

    return Success();
}

bool runCopy(const std::vector<std::string>& sources, const std::string& destination, bool recursive, size_t concurrency)
{
    CopyScheduler scheduler(concurrency);
    return scheduler.run(sources, destination, recursive);
}
