/**
 * @file threshold_evaluator.cpp
 * @brief ThresholdEvaluator and AlertEvent text formatting.
 */

#include "alerting/threshold_evaluator.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace container_pulse {

namespace {

constexpr size_t index_of(Resource resource) noexcept {
    return static_cast<size_t>(resource);
}

std::string one_decimal(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

}  // anonymous namespace

std::string format_number(double value) {
    if (!std::isfinite(value)) return "0";

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) return one_decimal(value);
    return std::string(buf, end);
}

// ── AlertEvent ───────────────────────────────

std::string AlertEvent::alert() const {
    return std::string{to_label(resource)} + " threshold exceeded";
}

std::string AlertEvent::message() const {
    return std::string{to_label(resource)} + " usage (" + one_decimal(current_value) +
           "%) has exceeded the threshold of " + format_number(threshold) + "%";
}

std::string AlertEvent::reason() const {
    return alert() + ": " + one_decimal(current_value) + "%";
}

// ── ThresholdEvaluator ───────────────────────

double usage_for(const ContainerUsage& usage, Resource resource) noexcept {
    switch (resource) {
        case Resource::Cpu:     return usage.cpu_usage_percent;
        case Resource::Memory:  return usage.memory_usage_percent;
        case Resource::Storage: return usage.storage_usage_percent;
    }
    return 0.0;
}

std::vector<AlertEvent> ThresholdEvaluator::evaluate(const ThresholdConfig& config,
                                                     const ContainerUsage& usage,
                                                     TimestampMs now) {
    std::vector<AlertEvent> events;
    if (!config.enabled) return events;

    for (auto resource : kAllResources) {
        const double value = usage_for(usage, resource);
        const double threshold = config.for_resource(resource);
        if (!(value >= threshold)) continue;

        auto& last = last_notified_[index_of(resource)];
        if (last && now - *last < kAlertCooldown.count()) continue;

        last = now;
        events.push_back(AlertEvent{now, resource, value, threshold});
    }
    return events;
}

std::optional<TimestampMs> ThresholdEvaluator::last_notified(Resource resource) const noexcept {
    return last_notified_[index_of(resource)];
}

void ThresholdEvaluator::reset() noexcept {
    last_notified_.fill(std::nullopt);
}

}  // namespace container_pulse
