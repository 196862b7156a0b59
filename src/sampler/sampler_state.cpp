/**
 * @file sampler_state.cpp
 * @brief Container CPU delta computation.
 */

#include "sampler/sampler_state.hpp"

#include <algorithm>

namespace container_pulse {

double update_container_cpu_percent(SamplerState& state,
                                    int64_t usage_ns,
                                    TimestampMs now,
                                    double cpu_limit_cores) {
    double percent = 0.0;

    if (state.last_container_timestamp_ms > 0 && state.last_container_usage_ns > 0) {
        auto delta_usage_ns = static_cast<double>(usage_ns - state.last_container_usage_ns);
        auto delta_wall_ns = static_cast<double>(now - state.last_container_timestamp_ms) * 1e6;
        if (delta_wall_ns > 0.0) {
            percent = (delta_usage_ns / delta_wall_ns) * 100.0
                      / std::max(cpu_limit_cores, 1e-6);
        }
    }

    state.last_container_usage_ns = usage_ns;
    state.last_container_timestamp_ms = now;
    return clamp_percent(percent);
}

}  // namespace container_pulse
