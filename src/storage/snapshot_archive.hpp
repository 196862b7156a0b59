/**
 * @file snapshot_archive.hpp
 * @brief Persists MetricsSnapshots as "metrics:<timestamp>" with a TTL.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/kv_store.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace container_pulse {

inline constexpr const char* kSnapshotKeyPrefix = "metrics:";
inline constexpr std::chrono::seconds kDefaultSnapshotTtl{7 * 24 * 60 * 60};
inline constexpr size_t kDefaultMaxSnapshots = 1440;

struct SnapshotStoreInfo {
    size_t count{0};
    size_t estimated_size_bytes{0};
    std::optional<TimestampMs> oldest;
    std::optional<TimestampMs> newest;
};

[[nodiscard]] std::string snapshot_key(TimestampMs timestamp_ms);

class SnapshotArchive {
public:
    explicit SnapshotArchive(IKeyValueStore& store,
                             std::chrono::seconds ttl = kDefaultSnapshotTtl,
                             size_t max_snapshots = kDefaultMaxSnapshots);

    /// Stores the snapshot, then removes the oldest ones beyond max_snapshots.
    Result<void> put(const MetricsSnapshot& snapshot);

    [[nodiscard]] Result<std::optional<MetricsSnapshot>> get(TimestampMs timestamp_ms);

    /// Stored timestamps, ascending.
    [[nodiscard]] Result<std::vector<TimestampMs>> timestamps();

    [[nodiscard]] Result<SnapshotStoreInfo> info();

    /// Returns how many snapshots were removed.
    Result<size_t> clear();

private:
    IKeyValueStore& store_;
    std::chrono::seconds ttl_;
    size_t max_snapshots_;
};

}  // namespace container_pulse
