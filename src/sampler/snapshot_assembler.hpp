/**
 * @file snapshot_assembler.hpp
 * @brief Combines probe and enumerator output into an immutable MetricsSnapshot.
 */

#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace container_pulse {

/**
 * @brief Map each UID to its account name by scanning a passwd-format file once.
 *
 * UIDs without an entry (or all of them, when the file is unreadable) map
 * to their decimal string.
 */
std::map<std::string, std::string> resolve_uid_names(const std::set<Uid>& uids,
                                                     const std::filesystem::path& passwd_file);

class SnapshotAssembler {
public:
    explicit SnapshotAssembler(std::filesystem::path passwd_file = "/etc/passwd");

    [[nodiscard]] MetricsSnapshot assemble(TimestampMs timestamp_ms,
                                           const ResourceLimits& limits,
                                           const ContainerUsage& usage,
                                           std::vector<ProcessSample> processes) const;

private:
    std::filesystem::path passwd_file_;
};

}  // namespace container_pulse
