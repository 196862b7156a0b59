/**
 * @file snapshot_codec.cpp
 * @brief MetricsSnapshot <-> JSON using nlohmann::json.
 */

#include "telemetry/snapshot_codec.hpp"

namespace container_pulse {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optional_from_json(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

}  // anonymous namespace

std::string dump_json(const nlohmann::json& doc, int indent) {
    return doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json snapshot_to_json(const MetricsSnapshot& snapshot) {
    nlohmann::json processes = nlohmann::json::array();
    for (const auto& p : snapshot.processes) {
        processes.push_back({
            {"pid", p.pid},
            {"uid", optional_to_json(p.uid)},
            {"ppid", p.ppid},
            {"command", p.command},
            {"cpu_usage_percent", optional_to_json(p.cpu_percent)},
            {"memory_usage_bytes", p.memory_bytes},
            {"memory_usage_percent", optional_to_json(p.memory_percent)},
        });
    }

    return {
        {"timestamp", snapshot.timestamp_ms},
        {"cpu_limit", snapshot.limits.cpu_limit_cores},
        {"cpu_usage_percent", snapshot.usage.cpu_usage_percent},
        {"memory_limit_bytes", snapshot.limits.memory_limit_bytes},
        {"memory_usage_bytes", snapshot.usage.memory_usage_bytes},
        {"memory_usage_percent", snapshot.usage.memory_usage_percent},
        {"storage_total_bytes", snapshot.usage.storage_total_bytes},
        {"storage_used_bytes", snapshot.usage.storage_used_bytes},
        {"storage_usage_percent", snapshot.usage.storage_usage_percent},
        {"uid_name_map", snapshot.uid_names},
        {"processes", std::move(processes)},
    };
}

Result<MetricsSnapshot> snapshot_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return Error{"snapshot JSON is not an object"};
    }

    try {
        MetricsSnapshot snapshot;
        snapshot.timestamp_ms = doc.at("timestamp").get<TimestampMs>();
        snapshot.limits.cpu_limit_cores = doc.at("cpu_limit").get<double>();
        snapshot.limits.memory_limit_bytes = doc.at("memory_limit_bytes").get<int64_t>();
        snapshot.usage.cpu_usage_percent = doc.at("cpu_usage_percent").get<double>();
        snapshot.usage.memory_usage_bytes = doc.at("memory_usage_bytes").get<int64_t>();
        snapshot.usage.memory_usage_percent = doc.at("memory_usage_percent").get<double>();
        snapshot.usage.storage_total_bytes = doc.at("storage_total_bytes").get<int64_t>();
        snapshot.usage.storage_used_bytes = doc.at("storage_used_bytes").get<int64_t>();
        snapshot.usage.storage_usage_percent = doc.at("storage_usage_percent").get<double>();

        if (auto it = doc.find("uid_name_map"); it != doc.end() && it->is_object()) {
            snapshot.uid_names = it->get<std::map<std::string, std::string>>();
        }

        if (auto it = doc.find("processes"); it != doc.end() && it->is_array()) {
            snapshot.processes.reserve(it->size());
            for (const auto& entry : *it) {
                ProcessSample p;
                p.pid = entry.at("pid").get<Pid>();
                p.uid = optional_from_json<Uid>(entry, "uid");
                p.ppid = entry.at("ppid").get<Pid>();
                p.command = entry.at("command").get<std::string>();
                p.cpu_percent = optional_from_json<double>(entry, "cpu_usage_percent");
                p.memory_bytes = entry.at("memory_usage_bytes").get<int64_t>();
                p.memory_percent = optional_from_json<double>(entry, "memory_usage_percent");
                snapshot.processes.push_back(std::move(p));
            }
        }
        return snapshot;

    } catch (const nlohmann::json::exception& ex) {
        return Error{std::string{"malformed snapshot: "} + ex.what()};
    }
}

std::string encode_snapshot(const MetricsSnapshot& snapshot) {
    return dump_json(snapshot_to_json(snapshot));
}

Result<MetricsSnapshot> decode_snapshot(std::string_view text) {
    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Error{"snapshot is not valid JSON"};
    }
    return snapshot_from_json(doc);
}

}  // namespace container_pulse
