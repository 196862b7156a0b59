/**
 * @file settings_repository.hpp
 * @brief Admin-editable thresholds, webhooks and collection interval.
 *
 * Settings live under one JSON document (key "admin:settings"):
 *   { "thresholds": { "cpu", "memory", "storage", "enabled" },
 *     "webhooks":   { "configs": [ { "id", "name", "url", "method",
 *                                    "headers", "body", "enabled" } ] },
 *     "collection": { "intervalSeconds" } }
 *
 * A missing or unreadable document yields the defaults; the engine keeps
 * running on defaults rather than stopping on bad settings.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/kv_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace container_pulse {

inline constexpr const char* kSettingsKey = "admin:settings";

struct AdminSettings {
    ThresholdConfig thresholds;
    std::vector<WebhookConfig> webhooks;
    uint32_t collection_interval_seconds{5};

    bool operator==(const AdminSettings&) const = default;
};

[[nodiscard]] nlohmann::json settings_to_json(const AdminSettings& settings);

/// Lenient: absent or mistyped fields keep their defaults.
[[nodiscard]] AdminSettings settings_from_json(const nlohmann::json& doc);

class SettingsRepository {
public:
    explicit SettingsRepository(IKeyValueStore& store);

    /// Current settings; defaults when the store has none or they do not parse.
    [[nodiscard]] Result<AdminSettings> load();

    Result<void> save(const AdminSettings& settings);

    [[nodiscard]] Result<ThresholdConfig> threshold_config();
    [[nodiscard]] Result<std::vector<WebhookConfig>> webhook_configs();

    /// Clamped into [1, 3600]; falls back to the default on store failure.
    [[nodiscard]] uint32_t collection_interval_seconds();

private:
    IKeyValueStore& store_;
};

}  // namespace container_pulse
