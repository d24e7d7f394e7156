#pragma once
#include <atomic>
#include <cstdint>

// Add-only byte counter that any number of copy workers can bump concurrently. Increments commute,
// so the final value does not depend on how the workers interleave.
class ProgressCounter
{
public:
    void add(uint64_t bytes) { this->bytes.fetch_add(bytes, std::memory_order_relaxed); }
    void reset() { this->bytes.store(0, std::memory_order_relaxed); }
    uint64_t get() const { return this->bytes.load(std::memory_order_relaxed); }

private:
    std::atomic_uint64_t bytes = 0;
};
