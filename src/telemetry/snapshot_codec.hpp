/**
 * @file snapshot_codec.hpp
 * @brief JSON encoding of MetricsSnapshot for the persistence collaborator.
 *
 * Wire shape (field names kept stable for the dashboard):
 *   { "timestamp", "cpu_limit", "cpu_usage_percent",
 *     "memory_limit_bytes", "memory_usage_bytes", "memory_usage_percent",
 *     "storage_total_bytes", "storage_used_bytes", "storage_usage_percent",
 *     "uid_name_map": { "<uid>": "<name>" },
 *     "processes": [ { "pid", "uid"|null, "ppid", "command",
 *                      "cpu_usage_percent"|null, "memory_usage_bytes",
 *                      "memory_usage_percent"|null } ] }
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace container_pulse {

/// Serializes doc; bytes that are not valid UTF-8 become U+FFFD instead of throwing.
[[nodiscard]] std::string dump_json(const nlohmann::json& doc, int indent = -1);

[[nodiscard]] nlohmann::json snapshot_to_json(const MetricsSnapshot& snapshot);
[[nodiscard]] Result<MetricsSnapshot> snapshot_from_json(const nlohmann::json& doc);

[[nodiscard]] std::string encode_snapshot(const MetricsSnapshot& snapshot);
[[nodiscard]] Result<MetricsSnapshot> decode_snapshot(std::string_view text);

}  // namespace container_pulse
