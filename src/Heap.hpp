#pragma once
#include <cstdlib>
#include <cstdint>
#include <atomic>

// Thread safe slab allocator for copy buffers. Allocated once up front so that peak memory use is
// fixed by the worker count, no matter how large the files being copied are.
class Heap
{
public:
    explicit Heap(size_t blocks, size_t blockSize, size_t alignment = 4096);
    ~Heap();

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    // Returns nullptr when every block is in use
    uint8_t* getBlock();
    void returnBlock(const uint8_t* block);

    size_t getBlockSize() const { return this->blockSize; }
    size_t getBlockCount() const { return this->blocks; }
    size_t getFreeBlocksCount() const;

private:
    std::atomic_bool* usedList = nullptr;
    uint8_t* data = nullptr;
    size_t blocks = 0;
    size_t blockSize = 0;
    size_t alignment = 0;
};
