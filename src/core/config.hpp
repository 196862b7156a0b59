/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization and environment overrides.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace container_pulse {

inline constexpr uint32_t kMinIntervalSeconds = 1;
inline constexpr uint32_t kMaxIntervalSeconds = 3600;

struct CollectorConfig {
    uint32_t interval_seconds = 5;
    uint32_t proc_max = 8192;
    std::string proc_mode = "all";      ///< "all", "user", "user+root"
    std::string proc_uids;              ///< Comma-separated; overrides proc_mode
    std::filesystem::path storage_path = "/config";
};

/// Roots of the pseudo-filesystems the probes read from.
struct PathsConfig {
    std::filesystem::path proc_root = "/proc";
    std::filesystem::path cgroup_root = "/sys/fs/cgroup";
    std::filesystem::path mounts_file = "/proc/mounts";
    std::filesystem::path passwd_file = "/etc/passwd";
};

struct StoreConfig {
    uint32_t snapshot_ttl_seconds = 7 * 24 * 60 * 60;
    uint32_t max_snapshots = 1440;  ///< Oldest snapshots are pruned past this count
};

/// Seeds the settings collaborator at startup.
struct AlertsConfig {
    ThresholdConfig thresholds;
    std::vector<WebhookConfig> webhooks;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    CollectorConfig collector;
    PathsConfig paths;
    StoreConfig store;
    AlertsConfig alerts;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply PROC_MAX, PROC_MODE, PROC_UIDS, COLLECTION_INTERVAL_SECONDS
 *        and LOG_LEVEL from the process environment.
 *
 * Unparsable numeric values leave the current setting untouched.
 */
void apply_env_overrides(Config& config);

/// Clamp a requested collection interval into [1, 3600] seconds.
[[nodiscard]] uint32_t clamp_interval_seconds(int64_t seconds) noexcept;

/// Leading-integer parse ("12abc" -> 12); empty when no digits lead.
[[nodiscard]] std::optional<int64_t> parse_leading_int(std::string_view text) noexcept;

[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

}  // namespace container_pulse
