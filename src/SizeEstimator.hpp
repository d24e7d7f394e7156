#pragma once
#include <cstdint>
#include <string>

struct SizeEstimate
{
    uint64_t fileCount = 0;
    uint64_t totalBytes = 0;
};

// Counts the regular files under path and adds up their sizes, without recursing on the call stack.
// Best effort only: anything that vanishes or can't be read is left out, and a missing path
// gives {0, 0}. Symlinks below the top level are not followed, same as when copying.
SizeEstimate estimateSize(const std::string& path);
