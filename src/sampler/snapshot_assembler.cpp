/**
 * @file snapshot_assembler.cpp
 * @brief UID name resolution and snapshot assembly.
 */

#include "sampler/snapshot_assembler.hpp"

#include "core/config.hpp"
#include "sampler/uid_policy.hpp"

#include <fstream>

namespace container_pulse {

std::map<std::string, std::string> resolve_uid_names(const std::set<Uid>& uids,
                                                     const std::filesystem::path& passwd_file) {
    std::map<std::string, std::string> names;
    if (uids.empty()) return names;

    // name:password:uid:gid:gecos:home:shell
    std::ifstream ifs(passwd_file);
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.empty() || line.front() == '#') continue;

        auto first = line.find(':');
        if (first == std::string::npos) continue;
        auto second = line.find(':', first + 1);
        if (second == std::string::npos) continue;
        auto third = line.find(':', second + 1);

        auto uid_field = std::string_view{line}.substr(second + 1, third == std::string::npos
                                                                       ? std::string::npos
                                                                       : third - second - 1);
        auto uid = parse_uid(uid_field);
        if (!uid || !uids.contains(*uid)) continue;

        // First entry wins, as with getpwuid()
        names.emplace(std::to_string(*uid), line.substr(0, first));
    }

    for (Uid uid : uids) {
        auto key = std::to_string(uid);
        names.try_emplace(key, key);
    }
    return names;
}

SnapshotAssembler::SnapshotAssembler(std::filesystem::path passwd_file)
    : passwd_file_(std::move(passwd_file)) {}

MetricsSnapshot SnapshotAssembler::assemble(TimestampMs timestamp_ms,
                                            const ResourceLimits& limits,
                                            const ContainerUsage& usage,
                                            std::vector<ProcessSample> processes) const {
    std::set<Uid> uids;
    for (const auto& process : processes) {
        if (process.uid) uids.insert(*process.uid);
    }

    MetricsSnapshot snapshot;
    snapshot.timestamp_ms = timestamp_ms;
    snapshot.limits = limits;
    snapshot.usage = usage;
    snapshot.uid_names = resolve_uid_names(uids, passwd_file_);
    snapshot.processes = std::move(processes);
    return snapshot;
}

}  // namespace container_pulse
