/**
 * @file types.hpp
 * @brief Fundamental types used throughout ContainerPulse.
 *
 * Defines the metrics data model (limits, container usage, process samples,
 * snapshots) and the alerting vocabulary (thresholds, webhooks, history).
 * All types are plain values; snapshots are immutable once assembled.
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace container_pulse {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TimestampMs = int64_t;   ///< Milliseconds since the Unix epoch
using Pid = int32_t;
using Uid = int32_t;

/// Percentages are always reported inside [0, 100].
[[nodiscard]] constexpr double clamp_percent(double value) noexcept {
    if (!(value == value)) return 0.0;  // NaN
    return std::clamp(value, 0.0, 100.0);
}

// ─────────────────────────────────────────────
// Cgroup
// ─────────────────────────────────────────────

enum class CgroupVersion : uint8_t {
    V1,
    V2
};

[[nodiscard]] constexpr std::string_view to_string(CgroupVersion version) noexcept {
    switch (version) {
        case CgroupVersion::V1: return "v1";
        case CgroupVersion::V2: return "v2";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

/**
 * @brief Resource entitlement of the container (or the host when unconfined).
 */
struct ResourceLimits {
    double cpu_limit_cores{1.0};          ///< Fractional vCPU entitlement
    int64_t memory_limit_bytes{0};

    bool operator==(const ResourceLimits&) const = default;
};

/**
 * @brief Container-level utilization computed once per collection cycle.
 */
struct ContainerUsage {
    double cpu_usage_percent{0.0};        ///< [0, 100] of the CPU limit
    int64_t memory_usage_bytes{0};
    double memory_usage_percent{0.0};
    int64_t storage_total_bytes{0};
    int64_t storage_used_bytes{0};
    double storage_usage_percent{0.0};

    bool operator==(const ContainerUsage&) const = default;
};

/**
 * @brief One process as observed during a collection cycle.
 *
 * cpu_percent is empty on the first observation of a PID: there is no
 * previous tick count to measure against, and 0% would be a lie.
 */
struct ProcessSample {
    Pid pid{0};
    Pid ppid{0};
    std::optional<Uid> uid;
    std::string command;
    std::optional<double> cpu_percent;
    int64_t memory_bytes{0};
    std::optional<double> memory_percent;

    bool operator==(const ProcessSample&) const = default;
};

/**
 * @brief Everything one collection cycle produced.
 *
 * processes is ordered by (cpu_percent desc, memory_bytes desc) and never
 * longer than the configured process cap.
 */
struct MetricsSnapshot {
    TimestampMs timestamp_ms{0};
    ResourceLimits limits;
    ContainerUsage usage;
    std::map<std::string, std::string> uid_names;
    std::vector<ProcessSample> processes;

    bool operator==(const MetricsSnapshot&) const = default;
};

// ─────────────────────────────────────────────
// Alerting
// ─────────────────────────────────────────────

enum class Resource : uint8_t {
    Cpu,
    Memory,
    Storage
};

inline constexpr std::array<Resource, 3> kAllResources{
    Resource::Cpu, Resource::Memory, Resource::Storage};

[[nodiscard]] constexpr std::string_view to_string(Resource resource) noexcept {
    switch (resource) {
        case Resource::Cpu:     return "cpu";
        case Resource::Memory:  return "memory";
        case Resource::Storage: return "storage";
    }
    return "unknown";
}

/// Upper-case label used in alert texts ("CPU", "MEMORY", "STORAGE").
[[nodiscard]] constexpr std::string_view to_label(Resource resource) noexcept {
    switch (resource) {
        case Resource::Cpu:     return "CPU";
        case Resource::Memory:  return "MEMORY";
        case Resource::Storage: return "STORAGE";
    }
    return "UNKNOWN";
}

struct ThresholdConfig {
    double cpu_percent{80.0};
    double memory_percent{80.0};
    double storage_percent{80.0};
    bool enabled{false};

    [[nodiscard]] constexpr double for_resource(Resource resource) const noexcept {
        switch (resource) {
            case Resource::Cpu:     return cpu_percent;
            case Resource::Memory:  return memory_percent;
            case Resource::Storage: return storage_percent;
        }
        return 100.0;
    }

    bool operator==(const ThresholdConfig&) const = default;
};

enum class HttpMethod : uint8_t {
    Get,
    Post,
    Put,
    Patch
};

[[nodiscard]] constexpr std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get:   return "GET";
        case HttpMethod::Post:  return "POST";
        case HttpMethod::Put:   return "PUT";
        case HttpMethod::Patch: return "PATCH";
    }
    return "GET";
}

/// Case-insensitive; empty for anything outside GET/POST/PUT/PATCH.
[[nodiscard]] std::optional<HttpMethod> parse_http_method(std::string_view text);

[[nodiscard]] constexpr bool allows_body(HttpMethod method) noexcept {
    return method != HttpMethod::Get;
}

struct WebhookConfig {
    std::string id;
    std::string name;
    std::string url;
    HttpMethod method{HttpMethod::Post};
    std::map<std::string, std::string> headers;
    std::string body_template;
    bool enabled{true};

    bool operator==(const WebhookConfig&) const = default;
};

/**
 * @brief Outcome of one webhook attempt, handed to the history sink.
 */
struct WebhookHistoryEntry {
    std::string id;
    TimestampMs timestamp_ms{0};
    std::string webhook_name;
    std::string webhook_url;
    std::string method;
    std::optional<int> status_code;       ///< Empty on transport failure
    bool success{false};
    std::optional<std::string> error;
    std::string reason;
    int64_t response_time_ms{0};

    bool operator==(const WebhookHistoryEntry&) const = default;
};

/// Wall-clock now, in epoch milliseconds.
[[nodiscard]] TimestampMs now_ms();

}  // namespace container_pulse
