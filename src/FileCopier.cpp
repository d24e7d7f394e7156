#include "FileCopier.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>
#include "Assert.hpp"
#include "ScopedFileDescriptor.hpp"

FileCopier::FileCopier(Heap& bufferHeap, size_t syncThreshold)
    : bufferHeap(bufferHeap)
    , syncThreshold(syncThreshold)
{
    // The owner sizes the heap at two blocks per copier, so running out here is a bug
    for (uint8_t*& buffer : this->buffers)
    {
        buffer = this->bufferHeap.getBlock();
        release_assert(buffer != nullptr);
    }

    int ret = io_uring_queue_init(Config::RING_SIZE, &this->ring, 0);
    if (ret < 0)
        this->ringInitError = -ret;
}

FileCopier::~FileCopier()
{
    if (this->ringInitError == 0)
        io_uring_queue_exit(&this->ring);

    for (uint8_t* buffer : this->buffers)
        this->bufferHeap.returnBlock(buffer);
}

Result FileCopier::ringError() const
{
    if (this->ringInitError != 0)
        return Error(std::string("Couldn't set up io_uring: \"") + strerror(this->ringInitError) + "\"");
    if (this->ringBroken)
        return Error("io_uring instance is unusable after an earlier failure");

    return Success();
}

io_uring_sqe* FileCopier::getSqe()
{
    // We always submit before queueing more than the ring can hold
    io_uring_sqe* sqe = io_uring_get_sqe(&this->ring);
    release_assert(sqe != nullptr);
    return sqe;
}

void FileCopier::prepRead(int fd, uint8_t* buffer, off_t offset)
{
    unsigned int bytesToRead = unsigned(this->getChunkSize());

    // Never force a read of zero, as that would look like EOF
    if (Config::DEBUG_FORCE_PARTIAL_READS)
        bytesToRead = unsigned(rand() % bytesToRead) + 1;

    io_uring_sqe* sqe = this->getSqe();
    io_uring_prep_read(sqe, fd, buffer, bytesToRead, __u64(offset));
    sqe->user_data = EventTag::Read;
}

void FileCopier::prepWrite(int fd, const uint8_t* buffer, size_t size, off_t offset)
{
    debug_assert(size > 0);
    unsigned int bytesToWrite = unsigned(size);

    if (Config::DEBUG_FORCE_PARTIAL_WRITES)
        bytesToWrite = unsigned(rand() % bytesToWrite) + 1;

    io_uring_sqe* sqe = this->getSqe();
    io_uring_prep_write(sqe, fd, buffer, bytesToWrite, __u64(offset));
    sqe->user_data = EventTag::Write;
}

Result FileCopier::submitAndWait(int32_t expected, __s32 (&results)[EventTagCount])
{
    int ret = 0;
    do
    {
        ret = io_uring_submit(&this->ring);
    }
    while (ret == -EAGAIN || ret == -EINTR);

    if (ret != expected)
    {
        // Whatever is left in the submission queue would be picked up by the next copy, so stop using this ring
        this->ringBroken = true;
        if (ret < 0)
            return Error(std::string("io_uring submission failed: \"") + strerror(-ret) + "\"");
        return Error("io_uring accepted only " + std::to_string(ret) + " of " + std::to_string(expected) + " submissions");
    }

    for (int32_t i = 0; i < expected; i++)
    {
        io_uring_cqe* cqe = nullptr;
        int err = 0;
        do
        {
            err = io_uring_wait_cqe(&this->ring, &cqe);
        }
        while (err == -EINTR || err == -EAGAIN);

        if (err < 0)
        {
            this->ringBroken = true;
            return Error(std::string("Waiting on io_uring failed: \"") + strerror(-err) + "\"");
        }

        debug_assert(cqe->user_data < EventTagCount);
        results[cqe->user_data] = cqe->res;
        io_uring_cqe_seen(&this->ring, cqe);
    }

    return Success();
}

Result FileCopier::readChunk(int fd, const std::string& path, uint8_t* buffer, off_t offset, size_t& bytesRead)
{
    for (int32_t tries = 0; ; tries++)
    {
        __s32 results[EventTagCount] = {};
        this->prepRead(fd, buffer, offset);

        Result result = this->submitAndWait(1, results);
        if (std::holds_alternative<Error>(result))
            return result;

        __s32 readResult = results[EventTag::Read];
        if ((readResult == -EINTR || readResult == -EAGAIN) && tries < 5)
            continue;

        if (readResult < 0)
            return Error("Error reading file \"" + path + "\": \"" + strerror(-readResult) + "\"");

        bytesRead = size_t(readResult);
        return Success();
    }
}

Result FileCopier::writeRemainder(int fd, const std::string& path, const uint8_t* buffer, size_t size, off_t offset)
{
    int32_t stalledTries = 0;

    while (size > 0)
    {
        __s32 results[EventTagCount] = {};
        this->prepWrite(fd, buffer, size, offset);

        Result result = this->submitAndWait(1, results);
        if (std::holds_alternative<Error>(result))
            return result;

        __s32 written = results[EventTag::Write];
        if (written < 0 && written != -EINTR && written != -EAGAIN)
            return Error("Error writing file \"" + path + "\": \"" + strerror(-written) + "\"");

        if (written <= 0)
        {
            if (++stalledTries >= 5)
                return Error("Error writing file \"" + path + "\": no progress after repeated attempts");
            continue;
        }

        stalledTries = 0;
        buffer += written;
        offset += written;
        size -= size_t(written);
    }

    return Success();
}

Result FileCopier::sync(int fd, const std::string& path, bool dataOnly)
{
    for (int32_t tries = 0; ; tries++)
    {
        __s32 results[EventTagCount] = {};

        io_uring_sqe* sqe = this->getSqe();
        io_uring_prep_fsync(sqe, fd, dataOnly ? IORING_FSYNC_DATASYNC : 0);
        sqe->user_data = EventTag::Sync;

        Result result = this->submitAndWait(1, results);
        if (std::holds_alternative<Error>(result))
            return result;

        __s32 syncResult = results[EventTag::Sync];
        if ((syncResult == -EINTR || syncResult == -EAGAIN) && tries < 5)
            continue;

        if (syncResult < 0)
            return Error("Error syncing file \"" + path + "\": \"" + strerror(-syncResult) + "\"");

        if (dataOnly)
            this->dataSyncCount++;

        return Success();
    }
}

Result FileCopier::copyContents(int sourceFd, int destFd, const std::string& source, const std::string& dest,
                                uint64_t& bytesCopied, ProgressCounter* taskProgress, ProgressCounter* runProgress)
{
    uint8_t* current = this->buffers[0];
    uint8_t* next = this->buffers[1];

    size_t pending = 0;
    {
        Result result = this->readChunk(sourceFd, source, current, 0, pending);
        if (std::holds_alternative<Error>(result))
            return result;
    }

    off_t readOffset = off_t(pending);
    off_t writeOffset = 0;
    uint64_t bytesSinceSync = 0;

    // Each pass writes the chunk we have while reading the one after it into the other buffer
    while (pending > 0)
    {
        __s32 results[EventTagCount] = {};
        this->prepWrite(destFd, current, pending, writeOffset);
        this->prepRead(sourceFd, next, readOffset);

        {
            Result result = this->submitAndWait(2, results);
            if (std::holds_alternative<Error>(result))
                return result;
        }

        if (Config::DEBUG_COPY_OPS)
            printf("WT %s %ld RES: %d, RD %s %ld RES: %d\n", dest.c_str(), writeOffset, results[EventTag::Write],
                   source.c_str(), readOffset, results[EventTag::Read]);

        __s32 written = results[EventTag::Write];
        if (written < 0 && written != -EINTR && written != -EAGAIN)
            return Error("Error writing file \"" + dest + "\": \"" + strerror(-written) + "\"");
        if (written < 0)
            written = 0;

        if (size_t(written) < pending)
        {
            Result result = this->writeRemainder(destFd, dest, current + written, pending - size_t(written), writeOffset + written);
            if (std::holds_alternative<Error>(result))
                return result;
        }

        writeOffset += off_t(pending);
        bytesCopied += pending;
        bytesSinceSync += pending;

        if (taskProgress)
            taskProgress->add(pending);
        if (runProgress)
            runProgress->add(pending);

        size_t nextPending = 0;
        __s32 readResult = results[EventTag::Read];
        if (readResult == -EINTR || readResult == -EAGAIN)
        {
            Result result = this->readChunk(sourceFd, source, next, readOffset, nextPending);
            if (std::holds_alternative<Error>(result))
                return result;
        }
        else if (readResult < 0)
        {
            return Error("Error reading file \"" + source + "\": \"" + strerror(-readResult) + "\"");
        }
        else
        {
            nextPending = size_t(readResult);
        }

        if (bytesSinceSync >= this->syncThreshold)
        {
            Result result = this->sync(destFd, dest, true);
            if (std::holds_alternative<Error>(result))
                return result;
            bytesSinceSync = 0;
        }

        readOffset += off_t(nextPending);
        pending = nextPending;
        std::swap(current, next);
    }

    return this->sync(destFd, dest, false);
}

CopyFileResult FileCopier::copyFile(const std::string& source,
                                    const std::string& dest,
                                    ProgressCounter* taskProgress,
                                    ProgressCounter* runProgress)
{
    using namespace std::string_literals;

    {
        Result result = this->ringError();
        if (std::holds_alternative<Error>(result))
            return std::move(std::get<Error>(result));
    }

    ScopedFileDescriptor sourceFd;
    {
        Result result = sourceFd.open(source, O_RDONLY | O_CLOEXEC, 0);
        if (std::holds_alternative<Error>(result))
            return std::move(std::get<Error>(result));
    }

    struct statx sourceStat = {};
    {
        int err = retrySyscall([&]()
        {
            statx(sourceFd.getFd(), "", AT_EMPTY_PATH, STATX_BASIC_STATS, &sourceStat);
        });

        if (err != 0)
            return Error("Failed to stat \""s + source + "\": \""s + strerror(err) + "\""s);

        if (!S_ISREG(sourceStat.stx_mode))
            return Error("\""s + source + "\" is not a regular file"s);
    }

    // Opening dest with O_TRUNC would wipe the source if they are the same file
    {
        struct statx destStat = {};
        int err = retrySyscall([&]()
        {
            statx(AT_FDCWD, dest.c_str(), 0, STATX_INO, &destStat);
        });

        if (err == 0 &&
            destStat.stx_ino == sourceStat.stx_ino &&
            destStat.stx_dev_major == sourceStat.stx_dev_major &&
            destStat.stx_dev_minor == sourceStat.stx_dev_minor)
        {
            return Error("\""s + source + "\" and \""s + dest + "\" are the same file"s);
        }
    }

    ScopedFileDescriptor destFd;
    {
        Result result = destFd.open(dest, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, sourceStat.stx_mode & 07777);
        if (std::holds_alternative<Error>(result))
            return std::move(std::get<Error>(result));
    }

    if (Config::DEBUG_COPY_OPS)
        printf("START %d->%d %s\n", sourceFd.getFd(), destFd.getFd(), source.c_str());

    uint64_t bytesCopied = 0;
    {
        Result result = this->copyContents(sourceFd.getFd(), destFd.getFd(), source, dest, bytesCopied, taskProgress, runProgress);
        if (std::holds_alternative<Error>(result))
            return std::move(std::get<Error>(result));
    }

    {
        Result result = destFd.close();
        if (std::holds_alternative<Error>(result))
            return std::move(std::get<Error>(result));
    }

    if (this->fileCopiedHook)
    {
        Result result = this->fileCopiedHook(source, dest, bytesCopied);
        if (std::holds_alternative<Error>(result))
            return std::move(std::get<Error>(result));
    }

    return bytesCopied;
}

CopyFileResult copyFile(const std::string& source,
                        const std::string& dest,
                        ProgressCounter* taskProgress,
                        ProgressCounter* runProgress)
{
    Heap heap(2, Config::CHUNK_SIZE);
    FileCopier copier(heap);
    return copier.copyFile(source, dest, taskProgress, runProgress);
}
