/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>

#include <toml++/toml.hpp>

namespace container_pulse {

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) return std::nullopt;
    return std::string{value};
}

/// Clamp a TOML integer into [lo, UINT32_MAX].
uint32_t to_u32(int64_t value, int64_t lo) {
    return static_cast<uint32_t>(std::clamp<int64_t>(value, lo, UINT32_MAX));
}

std::vector<WebhookConfig> parse_webhooks(const toml::array& entries) {
    std::vector<WebhookConfig> hooks;
    size_t index = 0;
    for (const auto& node : entries) {
        ++index;
        const auto* entry = node.as_table();
        if (entry == nullptr) continue;

        WebhookConfig hook;
        hook.id = (*entry)["id"].value_or(std::string{"webhook-"} + std::to_string(index));
        hook.name = (*entry)["name"].value_or(std::string{hook.id});
        hook.url = (*entry)["url"].value_or(std::string{});
        hook.method = parse_http_method((*entry)["method"].value_or(std::string{"POST"}))
                          .value_or(HttpMethod::Post);
        hook.body_template = (*entry)["body"].value_or(std::string{});
        hook.enabled = (*entry)["enabled"].value_or(true);

        if (const auto* headers = (*entry)["headers"].as_table()) {
            for (const auto& [key, value] : *headers) {
                if (auto text = value.value<std::string>()) {
                    hook.headers[std::string{key.str()}] = *text;
                }
            }
        }
        hooks.push_back(std::move(hook));
    }
    return hooks;
}

}  // anonymous namespace

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<int64_t> parse_leading_int(std::string_view text) noexcept {
    text = trim(text);
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr == text.data()) return std::nullopt;
    return value;
}

uint32_t clamp_interval_seconds(int64_t seconds) noexcept {
    return static_cast<uint32_t>(std::clamp<int64_t>(
        seconds, kMinIntervalSeconds, kMaxIntervalSeconds));
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [collector]
        if (auto collector = tbl["collector"]; collector.is_table()) {
            config.collector.interval_seconds = clamp_interval_seconds(
                collector["interval_seconds"].value_or(int64_t{5}));
            config.collector.proc_max =
                to_u32(collector["proc_max"].value_or(int64_t{8192}), 1);
            config.collector.proc_mode = lower(trim(
                collector["proc_mode"].value_or(std::string{"all"})));
            config.collector.proc_uids = collector["proc_uids"].value_or(std::string{});
            config.collector.storage_path =
                collector["storage_path"].value_or(std::string{"/config"});
        }

        // [paths]
        if (auto paths = tbl["paths"]; paths.is_table()) {
            config.paths.proc_root = paths["proc_root"].value_or(std::string{"/proc"});
            config.paths.cgroup_root = paths["cgroup_root"].value_or(std::string{"/sys/fs/cgroup"});
            config.paths.mounts_file = paths["mounts_file"].value_or(std::string{"/proc/mounts"});
            config.paths.passwd_file = paths["passwd_file"].value_or(std::string{"/etc/passwd"});
        }

        // [store]
        if (auto store = tbl["store"]; store.is_table()) {
            config.store.snapshot_ttl_seconds =
                to_u32(store["snapshot_ttl_seconds"].value_or(int64_t{7 * 24 * 60 * 60}), 1);
            config.store.max_snapshots =
                to_u32(store["max_snapshots"].value_or(int64_t{1440}), 1);
        }

        // [alerts]
        if (auto alerts = tbl["alerts"]; alerts.is_table()) {
            auto& thresholds = config.alerts.thresholds;
            thresholds.enabled = alerts["enabled"].value_or(false);
            thresholds.cpu_percent = alerts["cpu_percent"].value_or(80.0);
            thresholds.memory_percent = alerts["memory_percent"].value_or(80.0);
            thresholds.storage_percent = alerts["storage_percent"].value_or(80.0);
        }

        // [[webhooks]]
        if (const auto* webhooks = tbl["webhooks"].as_array()) {
            config.alerts.webhooks = parse_webhooks(*webhooks);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb =
                to_u32(telemetry["max_file_size_mb"].value_or(int64_t{50}), 1);
            config.telemetry.rotate_count =
                to_u32(telemetry["rotate_count"].value_or(int64_t{5}), 0);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

void apply_env_overrides(Config& config) {
    if (auto value = env("PROC_MAX")) {
        if (auto n = parse_leading_int(*value); n && *n >= 1) {
            config.collector.proc_max = static_cast<uint32_t>(
                std::min<int64_t>(*n, UINT32_MAX));
        }
    }
    if (auto value = env("PROC_MODE")) {
        config.collector.proc_mode = lower(trim(*value));
    }
    if (auto value = env("PROC_UIDS")) {
        config.collector.proc_uids = std::string{trim(*value)};
    }
    if (auto value = env("COLLECTION_INTERVAL_SECONDS")) {
        if (auto n = parse_leading_int(*value)) {
            config.collector.interval_seconds = clamp_interval_seconds(*n);
        }
    }
    if (auto value = env("LOG_LEVEL")) {
        config.telemetry.log_level = lower(trim(*value));
    }
}

}  // namespace container_pulse
