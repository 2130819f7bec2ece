#pragma once
#include <cstdint>

namespace RpcExtractor {

/**
 * Scheduler lifecycle
 *
 * IDLE -> DISPATCHING on a tick with at least one dispatched fetch
 * DISPATCHING -> IDLE once every dispatched fetch has resolved
 * IDLE | DISPATCHING -> DRAINING when the shutdown signal is observed
 * DRAINING -> STOPPED once in-flight fetches have resolved (terminal)
 */
enum class SchedulerState : uint8_t {
    IDLE = 0,
    DISPATCHING = 1,
    DRAINING = 2,
    STOPPED = 3
};

inline const char* toString(SchedulerState state) {
    switch (state) {
        case SchedulerState::IDLE:        return "IDLE";
        case SchedulerState::DISPATCHING: return "DISPATCHING";
        case SchedulerState::DRAINING:    return "DRAINING";
        case SchedulerState::STOPPED:     return "STOPPED";
        default:                          return "UNKNOWN";
    }
}

} // namespace RpcExtractor
