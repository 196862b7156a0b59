/**
 * @file settings_repository.cpp
 * @brief SettingsRepository implementation.
 */

#include "storage/settings_repository.hpp"

#include "core/config.hpp"
#include "telemetry/snapshot_codec.hpp"

#include <cstdint>
#include <limits>
#include <type_traits>

namespace container_pulse {

namespace {

template <typename T>
T field_or(const nlohmann::json& obj, const char* key, T fallback) {
    if (!obj.is_object()) return fallback;
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if constexpr (std::is_same_v<T, bool>) {
        return it->is_boolean() ? it->template get<bool>() : fallback;
    } else if constexpr (std::is_integral_v<T>) {
        constexpr T lo = std::numeric_limits<T>::min();
        constexpr T hi = std::numeric_limits<T>::max();
        if (it->is_number_unsigned()) {
            auto value = it->template get<uint64_t>();
            return value > static_cast<uint64_t>(hi) ? hi : static_cast<T>(value);
        }
        if (it->is_number_integer()) return it->template get<T>();
        if (!it->is_number_float()) return fallback;
        // Saturate before converting; an out-of-range float-to-int cast is undefined
        const double value = it->template get<double>();
        if (value >= static_cast<double>(hi)) return hi;
        if (value <= static_cast<double>(lo)) return lo;
        return static_cast<T>(value);
    } else if constexpr (std::is_arithmetic_v<T>) {
        return it->is_number() ? it->template get<T>() : fallback;
    } else {
        return it->is_string() ? it->template get<T>() : fallback;
    }
}

WebhookConfig webhook_from_json(const nlohmann::json& obj) {
    WebhookConfig hook;
    hook.id = field_or<std::string>(obj, "id", "");
    hook.name = field_or<std::string>(obj, "name", hook.id);
    hook.url = field_or<std::string>(obj, "url", "");
    hook.method = parse_http_method(field_or<std::string>(obj, "method", "POST"))
                      .value_or(HttpMethod::Post);
    hook.body_template = field_or<std::string>(obj, "body", "");
    hook.enabled = field_or<bool>(obj, "enabled", true);

    if (auto it = obj.find("headers"); it != obj.end() && it->is_object()) {
        for (const auto& [name, value] : it->items()) {
            if (value.is_string()) hook.headers[name] = value.get<std::string>();
        }
    }
    return hook;
}

}  // anonymous namespace

nlohmann::json settings_to_json(const AdminSettings& settings) {
    nlohmann::json configs = nlohmann::json::array();
    for (const auto& hook : settings.webhooks) {
        configs.push_back({
            {"id", hook.id},
            {"name", hook.name},
            {"url", hook.url},
            {"method", std::string{to_string(hook.method)}},
            {"headers", hook.headers},
            {"body", hook.body_template},
            {"enabled", hook.enabled},
        });
    }

    return {
        {"thresholds", {
            {"cpu", settings.thresholds.cpu_percent},
            {"memory", settings.thresholds.memory_percent},
            {"storage", settings.thresholds.storage_percent},
            {"enabled", settings.thresholds.enabled},
        }},
        {"webhooks", {{"configs", std::move(configs)}}},
        {"collection", {{"intervalSeconds", settings.collection_interval_seconds}}},
    };
}

AdminSettings settings_from_json(const nlohmann::json& doc) {
    AdminSettings settings;
    if (!doc.is_object()) return settings;

    if (auto it = doc.find("thresholds"); it != doc.end()) {
        auto& t = settings.thresholds;
        t.cpu_percent = field_or<double>(*it, "cpu", t.cpu_percent);
        t.memory_percent = field_or<double>(*it, "memory", t.memory_percent);
        t.storage_percent = field_or<double>(*it, "storage", t.storage_percent);
        t.enabled = field_or<bool>(*it, "enabled", t.enabled);
    }

    if (auto it = doc.find("webhooks"); it != doc.end() && it->is_object()) {
        if (auto configs = it->find("configs"); configs != it->end() && configs->is_array()) {
            for (const auto& entry : *configs) {
                if (entry.is_object()) settings.webhooks.push_back(webhook_from_json(entry));
            }
        }
    }

    if (auto it = doc.find("collection"); it != doc.end()) {
        auto seconds = field_or<int64_t>(*it, "intervalSeconds",
                                         settings.collection_interval_seconds);
        settings.collection_interval_seconds = clamp_interval_seconds(seconds);
    }
    return settings;
}

// ── SettingsRepository ───────────────────────

SettingsRepository::SettingsRepository(IKeyValueStore& store) : store_(store) {}

Result<AdminSettings> SettingsRepository::load() {
    auto raw = store_.get(kSettingsKey);
    if (!raw) return raw.error();
    if (!raw->has_value()) return AdminSettings{};

    auto doc = nlohmann::json::parse(**raw, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) return AdminSettings{};
    return settings_from_json(doc);
}

Result<void> SettingsRepository::save(const AdminSettings& settings) {
    return store_.put(kSettingsKey, dump_json(settings_to_json(settings)), std::nullopt);
}

Result<ThresholdConfig> SettingsRepository::threshold_config() {
    auto settings = load();
    if (!settings) return settings.error();
    return settings->thresholds;
}

Result<std::vector<WebhookConfig>> SettingsRepository::webhook_configs() {
    auto settings = load();
    if (!settings) return settings.error();
    return settings->webhooks;
}

uint32_t SettingsRepository::collection_interval_seconds() {
    auto settings = load();
    if (!settings) return AdminSettings{}.collection_interval_seconds;
    return clamp_interval_seconds(settings->collection_interval_seconds);
}

}  // namespace container_pulse
