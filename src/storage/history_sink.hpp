/**
 * @file history_sink.hpp
 * @brief Bounded record of webhook attempts.
 *
 * The history is one JSON array under "webhook:history", most recent
 * first, capped at kHistoryCapacity entries. Entry fields are camelCase to
 * match what the admin panel reads: id, timestamp, webhookName, webhookUrl,
 * method, statusCode (null on transport failure), success, error,
 * reason, responseTime.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/kv_store.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

namespace container_pulse {

inline constexpr const char* kHistoryKey = "webhook:history";
inline constexpr size_t kHistoryCapacity = 100;

class IHistorySink {
public:
    virtual ~IHistorySink() = default;

    virtual Result<void> append(const WebhookHistoryEntry& entry) = 0;
};

[[nodiscard]] nlohmann::json history_entry_to_json(const WebhookHistoryEntry& entry);
[[nodiscard]] Result<WebhookHistoryEntry> history_entry_from_json(const nlohmann::json& doc);

class StoreHistorySink : public IHistorySink {
public:
    explicit StoreHistorySink(IKeyValueStore& store, size_t capacity = kHistoryCapacity);

    /// Read-modify-write; serialized so concurrent deliveries do not lose entries.
    Result<void> append(const WebhookHistoryEntry& entry) override;

    /// Most recent first. Entries that fail to decode are skipped.
    [[nodiscard]] Result<std::vector<WebhookHistoryEntry>> entries();

    Result<void> clear();

private:
    Result<nlohmann::json> load_array();

    IKeyValueStore& store_;
    size_t capacity_;
    std::mutex mutex_;
};

}  // namespace container_pulse
