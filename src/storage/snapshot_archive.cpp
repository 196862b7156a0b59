/**
 * @file snapshot_archive.cpp
 * @brief SnapshotArchive implementation.
 */

#include "storage/snapshot_archive.hpp"

#include "core/config.hpp"
#include "telemetry/snapshot_codec.hpp"

#include <algorithm>
#include <string_view>

namespace container_pulse {

std::string snapshot_key(TimestampMs timestamp_ms) {
    return kSnapshotKeyPrefix + std::to_string(timestamp_ms);
}

SnapshotArchive::SnapshotArchive(IKeyValueStore& store,
                                 std::chrono::seconds ttl,
                                 size_t max_snapshots)
    : store_(store), ttl_(ttl), max_snapshots_(std::max<size_t>(max_snapshots, 1)) {}

Result<void> SnapshotArchive::put(const MetricsSnapshot& snapshot) {
    auto stored = store_.put(snapshot_key(snapshot.timestamp_ms),
                             encode_snapshot(snapshot), ttl_);
    if (!stored) return stored;

    auto stamps = timestamps();
    if (!stamps) return stamps.error();
    if (stamps->size() <= max_snapshots_) return {};

    const size_t excess = stamps->size() - max_snapshots_;
    for (size_t i = 0; i < excess; ++i) {
        if (auto removed = store_.remove(snapshot_key((*stamps)[i])); !removed) {
            return removed.error();
        }
    }
    return {};
}

Result<std::optional<MetricsSnapshot>> SnapshotArchive::get(TimestampMs timestamp_ms) {
    auto raw = store_.get(snapshot_key(timestamp_ms));
    if (!raw) return raw.error();
    if (!raw->has_value()) return std::optional<MetricsSnapshot>{};

    auto decoded = decode_snapshot(**raw);
    if (!decoded) return decoded.error();
    return std::optional<MetricsSnapshot>{std::move(*decoded)};
}

Result<std::vector<TimestampMs>> SnapshotArchive::timestamps() {
    auto keys = store_.scan(kSnapshotKeyPrefix);
    if (!keys) return keys.error();

    const std::string_view prefix{kSnapshotKeyPrefix};
    std::vector<TimestampMs> out;
    out.reserve(keys->size());
    for (const auto& key : *keys) {
        if (auto ts = parse_leading_int(std::string_view{key}.substr(prefix.size()))) {
            out.push_back(*ts);
        }
    }
    // Keys sort lexically; timestamps of different digit counts need a numeric sort.
    std::sort(out.begin(), out.end());
    return out;
}

Result<SnapshotStoreInfo> SnapshotArchive::info() {
    auto stamps = timestamps();
    if (!stamps) return stamps.error();

    SnapshotStoreInfo info;
    for (auto ts : *stamps) {
        auto raw = store_.get(snapshot_key(ts));
        if (!raw) return raw.error();
        if (!raw->has_value()) continue;  // expired between scan and get

        ++info.count;
        info.estimated_size_bytes += (*raw)->size();
        if (!info.oldest) info.oldest = ts;
        info.newest = ts;
    }
    return info;
}

Result<size_t> SnapshotArchive::clear() {
    auto keys = store_.scan(kSnapshotKeyPrefix);
    if (!keys) return keys.error();

    for (const auto& key : *keys) {
        if (auto removed = store_.remove(key); !removed) return removed.error();
    }
    return keys->size();
}

}  // namespace container_pulse
