/**
 * @file history_sink.cpp
 * @brief StoreHistorySink implementation.
 */

#include "storage/history_sink.hpp"

#include "telemetry/snapshot_codec.hpp"

namespace container_pulse {

nlohmann::json history_entry_to_json(const WebhookHistoryEntry& entry) {
    nlohmann::json doc = {
        {"id", entry.id},
        {"timestamp", entry.timestamp_ms},
        {"webhookName", entry.webhook_name},
        {"webhookUrl", entry.webhook_url},
        {"method", entry.method},
        {"statusCode", entry.status_code ? nlohmann::json(*entry.status_code)
                                         : nlohmann::json(nullptr)},
        {"success", entry.success},
        {"reason", entry.reason},
        {"responseTime", entry.response_time_ms},
    };
    if (entry.error) {
        doc["error"] = *entry.error;
    }
    return doc;
}

Result<WebhookHistoryEntry> history_entry_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return Error{"history entry is not an object"};
    }

    try {
        WebhookHistoryEntry entry;
        entry.id = doc.at("id").get<std::string>();
        entry.timestamp_ms = doc.at("timestamp").get<TimestampMs>();
        entry.webhook_name = doc.at("webhookName").get<std::string>();
        entry.webhook_url = doc.at("webhookUrl").get<std::string>();
        entry.method = doc.at("method").get<std::string>();
        if (auto it = doc.find("statusCode"); it != doc.end() && !it->is_null()) {
            entry.status_code = it->get<int>();
        }
        entry.success = doc.at("success").get<bool>();
        if (auto it = doc.find("error"); it != doc.end() && it->is_string()) {
            entry.error = it->get<std::string>();
        }
        entry.reason = doc.value("reason", std::string{});
        entry.response_time_ms = doc.value("responseTime", int64_t{0});
        return entry;

    } catch (const nlohmann::json::exception& ex) {
        return Error{std::string{"malformed history entry: "} + ex.what()};
    }
}

// ── StoreHistorySink ─────────────────────────

StoreHistorySink::StoreHistorySink(IKeyValueStore& store, size_t capacity)
    : store_(store), capacity_(capacity == 0 ? 1 : capacity) {}

Result<nlohmann::json> StoreHistorySink::load_array() {
    auto raw = store_.get(kHistoryKey);
    if (!raw) return raw.error();
    if (!raw->has_value()) return nlohmann::json::array();

    auto doc = nlohmann::json::parse(**raw, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_array()) return nlohmann::json::array();
    return doc;
}

Result<void> StoreHistorySink::append(const WebhookHistoryEntry& entry) {
    std::lock_guard lock(mutex_);

    auto current = load_array();
    if (!current) return current.error();

    nlohmann::json updated = nlohmann::json::array();
    updated.push_back(history_entry_to_json(entry));
    for (auto& item : *current) {
        if (updated.size() >= capacity_) break;
        updated.push_back(std::move(item));
    }
    return store_.put(kHistoryKey, dump_json(updated), std::nullopt);
}

Result<std::vector<WebhookHistoryEntry>> StoreHistorySink::entries() {
    std::lock_guard lock(mutex_);

    auto current = load_array();
    if (!current) return current.error();

    std::vector<WebhookHistoryEntry> out;
    out.reserve(current->size());
    for (const auto& item : *current) {
        if (auto entry = history_entry_from_json(item)) {
            out.push_back(std::move(*entry));
        }
    }
    return out;
}

Result<void> StoreHistorySink::clear() {
    std::lock_guard lock(mutex_);
    return store_.remove(kHistoryKey);
}

}  // namespace container_pulse
