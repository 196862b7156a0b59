/**
 * @file sampler_state.hpp
 * @brief Delta-measurement state carried from one collection cycle to the next.
 *
 * Owned by the CollectionCycle and mutated only from inside a cycle; cycles
 * never overlap, so there is exactly one writer and no concurrent reader.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <unordered_map>

namespace container_pulse {

struct ProcessTicks {
    int64_t jiffies{0};                   ///< utime + stime, in clock ticks
    TimestampMs timestamp_ms{0};
};

struct SamplerState {
    int64_t last_container_usage_ns{0};
    TimestampMs last_container_timestamp_ms{0};   ///< 0 until the first cycle ran
    std::unordered_map<Pid, ProcessTicks> per_process;
};

/**
 * @brief Container CPU utilization since the previous call, as a percentage
 *        of the CPU limit.
 *
 * Returns 0 when no baseline exists yet or no wall time elapsed. The stored
 * baseline is always replaced by (usage_ns, now).
 */
double update_container_cpu_percent(SamplerState& state,
                                    int64_t usage_ns,
                                    TimestampMs now,
                                    double cpu_limit_cores);

}  // namespace container_pulse
