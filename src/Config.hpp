#pragma once
#include <cstddef>
#include <cstdint>

namespace Config
{
    static constexpr size_t CHUNK_SIZE = 8 * 1024 * 1024; // 8M
    static constexpr size_t SYNC_THRESHOLD = 64 * 1024 * 1024; // 64M, data-only sync after this many unsynced bytes
    static constexpr size_t DEFAULT_PARALLELISM = 4;
    static constexpr unsigned int RING_SIZE = 4; // a copier never has more than one read and one write in flight
    static constexpr size_t DIRENT_BUFFER_SIZE = 1024 * 1024;
    static constexpr float PROGRESS_UPDATE_INTERVAL_SECONDS = 0.25f;

    static constexpr bool DEBUG_COPY_OPS = false;
    extern bool DEBUG_FORCE_PARTIAL_READS;
    extern bool DEBUG_FORCE_PARTIAL_WRITES;

    // One of the LogLevel values, or -1 for no output at all
    extern int32_t LOG_LEVEL;
}
