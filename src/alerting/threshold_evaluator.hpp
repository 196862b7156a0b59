/**
 * @file threshold_evaluator.hpp
 * @brief Decides which resources crossed their threshold and are due a notification.
 *
 * A resource fires when its usage percent reaches the configured threshold
 * and it has not fired within the last kAlertCooldown. Cooldowns are
 * tracked per resource, so a CPU alert never suppresses a memory one.
 * The cooldown is measured from the last notification, not from the last
 * breach: a resource that stays hot is re-notified every five minutes.
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace container_pulse {

inline constexpr std::chrono::milliseconds kAlertCooldown{5 * 60 * 1000};

/**
 * @brief One threshold breach that should be delivered to the webhooks.
 */
struct AlertEvent {
    TimestampMs timestamp_ms{0};
    Resource resource{Resource::Cpu};
    double current_value{0.0};
    double threshold{0.0};

    /// "CPU threshold exceeded"
    [[nodiscard]] std::string alert() const;

    /// "CPU usage (85.0%) has exceeded the threshold of 80%"
    [[nodiscard]] std::string message() const;

    /// "CPU threshold exceeded: 85.0%"
    [[nodiscard]] std::string reason() const;

    bool operator==(const AlertEvent&) const = default;
};

class ThresholdEvaluator {
public:
    ThresholdEvaluator() = default;

    /**
     * @brief Evaluate one cycle's usage and record notification times.
     *
     * Returns nothing when alerting is disabled. Events come back in
     * Cpu, Memory, Storage order.
     */
    [[nodiscard]] std::vector<AlertEvent> evaluate(const ThresholdConfig& config,
                                                   const ContainerUsage& usage,
                                                   TimestampMs now);

    [[nodiscard]] std::optional<TimestampMs> last_notified(Resource resource) const noexcept;

    void reset() noexcept;

private:
    std::array<std::optional<TimestampMs>, kAllResources.size()> last_notified_{};
};

[[nodiscard]] double usage_for(const ContainerUsage& usage, Resource resource) noexcept;

/// Shortest decimal that round-trips; integral values print without a fraction.
[[nodiscard]] std::string format_number(double value);

}  // namespace container_pulse
