#pragma once
#include <liburing.h>
#include <cstdint>
#include <functional>
#include <string>
#include "Config.hpp"
#include "Heap.hpp"
#include "ProgressCounter.hpp"
#include "Util.hpp"

// Called after a file has been fully copied and synced. This is where integrity verification would
// go; returning an Error fails the copy.
using FileCopiedHook = std::function<Result(const std::string& source, const std::string& dest, uint64_t bytesCopied)>;

using CopyFileResult = std::variant<Error, uint64_t>;

// Copies single files through its own io_uring instance, reading the next chunk while the previous
// one is being written. Not thread safe: every worker thread owns one.
class FileCopier
{
public:
    explicit FileCopier(Heap& bufferHeap, size_t syncThreshold = Config::SYNC_THRESHOLD);
    ~FileCopier();

    FileCopier(const FileCopier&) = delete;
    FileCopier& operator=(const FileCopier&) = delete;

    // Creates or truncates dest. A partially written dest is left behind on failure.
    [[nodiscard]] CopyFileResult copyFile(const std::string& source,
                                          const std::string& dest,
                                          ProgressCounter* taskProgress = nullptr,
                                          ProgressCounter* runProgress = nullptr);

    void setFileCopiedHook(FileCopiedHook hook) { this->fileCopiedHook = std::move(hook); }

    size_t getChunkSize() const { return this->bufferHeap.getBlockSize(); }
    uint64_t getDataSyncCount() const { return this->dataSyncCount; }

private:
    enum EventTag : __u64
    {
        Read = 0,
        Write = 1,
        Sync = 2,
        EventTagCount = 3,
    };

    [[nodiscard]] Result copyContents(int sourceFd, int destFd, const std::string& source, const std::string& dest,
                                      uint64_t& bytesCopied, ProgressCounter* taskProgress, ProgressCounter* runProgress);

    io_uring_sqe* getSqe();
    void prepRead(int fd, uint8_t* buffer, off_t offset);
    void prepWrite(int fd, const uint8_t* buffer, size_t size, off_t offset);
    [[nodiscard]] Result submitAndWait(int32_t expected, __s32 (&results)[EventTagCount]);

    [[nodiscard]] Result readChunk(int fd, const std::string& path, uint8_t* buffer, off_t offset, size_t& bytesRead);
    [[nodiscard]] Result writeRemainder(int fd, const std::string& path, const uint8_t* buffer, size_t size, off_t offset);
    [[nodiscard]] Result sync(int fd, const std::string& path, bool dataOnly);

    Result ringError() const;

private:
    Heap& bufferHeap;
    size_t syncThreshold;

    io_uring ring = {};
    int ringInitError = 0;
    bool ringBroken = false;

    uint8_t* buffers[2] = {nullptr, nullptr};

    uint64_t dataSyncCount = 0;
    FileCopiedHook fileCopiedHook;
};

// Convenience entry point for one-off copies. Sets up its own buffers and ring.
[[nodiscard]] CopyFileResult copyFile(const std::string& source,
                                      const std::string& dest,
                                      ProgressCounter* taskProgress = nullptr,
                                      ProgressCounter* runProgress = nullptr);
