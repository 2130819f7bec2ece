// ============================================================================
// WALL CLOCK HELPERS
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>

namespace RpcExtractor {

class Clock {
public:
    // Wall-clock time since the unix epoch, used for event timestamps
    static inline uint64_t unix_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }
};

} // namespace RpcExtractor
