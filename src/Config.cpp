#include "Config.hpp"
#include "Log.hpp"

namespace Config
{
    bool DEBUG_FORCE_PARTIAL_READS = false;
    bool DEBUG_FORCE_PARTIAL_WRITES = false;

    int32_t LOG_LEVEL = int32_t(LogLevel::Warn);
}
