/**
 * @file system_probe.hpp
 * @brief One-shot readers for cgroup limits, container usage counters and
 *        filesystem capacity.
 *
 * Every read tolerates missing files: a container without cgroup limits or
 * a bare host is a supported degraded mode, so absent values are replaced
 * by host-wide figures instead of being reported as errors.
 *
 * Data sources (relative to the configured roots):
 *   <mounts_file>                         : cgroup version detection
 *   <cgroup>/cpu.max, cpu.stat            : v2 CPU quota and usage_usec
 *   <cgroup>/memory.max, memory.current   : v2 memory limit and usage
 *   <cgroup>/cpu/cpu.cfs_{quota,period}_us, cpuacct/cpuacct.usage,
 *   <cgroup>/memory/memory.{limit,usage}_in_bytes : v1 equivalents
 *   <proc>/meminfo                        : host total memory fallback
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace container_pulse {

struct ProbePaths {
    std::filesystem::path proc_root = "/proc";
    std::filesystem::path cgroup_root = "/sys/fs/cgroup";
    std::filesystem::path mounts_file = "/proc/mounts";
};

struct FilesystemCapacity {
    int64_t total_bytes{0};
    int64_t used_bytes{0};
};

/// Values at or above this are the cgroup v1 "no limit" sentinel.
inline constexpr int64_t kCgroupV1UnlimitedFloor = int64_t{1} << 60;

class SystemProbe {
public:
    explicit SystemProbe(ProbePaths paths = {});

    /// V2 when the mount table lists a cgroup2 filesystem; V1 on any failure.
    [[nodiscard]] CgroupVersion detect_cgroup_version() const;

    [[nodiscard]] ResourceLimits read_resource_limits(CgroupVersion version) const;
    [[nodiscard]] double read_cpu_limit_cores(CgroupVersion version) const;
    [[nodiscard]] int64_t read_memory_limit_bytes(CgroupVersion version) const;

    /// Current container memory usage; 0 when the counter is unavailable.
    [[nodiscard]] int64_t read_memory_usage_bytes(CgroupVersion version) const;

    /// Cumulative container CPU time in nanoseconds; 0 when unavailable.
    [[nodiscard]] int64_t read_container_cpu_usage_ns(CgroupVersion version) const;

    /// Block usage of the filesystem holding path; empty on failure.
    [[nodiscard]] std::optional<FilesystemCapacity>
    read_filesystem_capacity(const std::filesystem::path& path) const;

    /// Capacity of preferred, falling back to "/" when it cannot be probed.
    [[nodiscard]] std::optional<FilesystemCapacity>
    read_storage_capacity(const std::filesystem::path& preferred) const;

    [[nodiscard]] double host_cpu_count() const;
    [[nodiscard]] int64_t host_total_memory_bytes() const;

    [[nodiscard]] const ProbePaths& paths() const noexcept { return paths_; }

private:
    ProbePaths paths_;
};

/// sysconf(_SC_CLK_TCK), or 100 when unavailable.
[[nodiscard]] int64_t system_clock_ticks() noexcept;

/// sysconf(_SC_PAGESIZE), or 4096 when unavailable.
[[nodiscard]] int64_t system_page_size() noexcept;

}  // namespace container_pulse
