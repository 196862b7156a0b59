/**
 * @file system_probe.cpp
 * @brief SystemProbe: reads cgroup v1/v2 control files, /proc/meminfo and
 *        statvfs() capacity.
 */

#include "resource_monitor/system_probe.hpp"

#include "core/config.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include <sys/statvfs.h>
#include <unistd.h>

namespace container_pulse {

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) return std::nullopt;
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

/// Parses a single integer control file; "max" and garbage yield empty.
std::optional<int64_t> read_number(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) return std::nullopt;
    return parse_leading_int(*content);
}

}  // anonymous namespace

SystemProbe::SystemProbe(ProbePaths paths) : paths_(std::move(paths)) {}

CgroupVersion SystemProbe::detect_cgroup_version() const {
    auto mounts = read_file(paths_.mounts_file);
    if (!mounts) return CgroupVersion::V1;
    return mounts->find("cgroup2") != std::string::npos ? CgroupVersion::V2
                                                         : CgroupVersion::V1;
}

ResourceLimits SystemProbe::read_resource_limits(CgroupVersion version) const {
    return ResourceLimits{
        .cpu_limit_cores = read_cpu_limit_cores(version),
        .memory_limit_bytes = read_memory_limit_bytes(version),
    };
}

double SystemProbe::read_cpu_limit_cores(CgroupVersion version) const {
    std::optional<int64_t> quota;
    std::optional<int64_t> period;

    if (version == CgroupVersion::V2) {
        // "<quota> <period>" or "max <period>"
        if (auto cpu_max = read_file(paths_.cgroup_root / "cpu.max")) {
            std::istringstream iss(*cpu_max);
            std::string quota_str, period_str;
            iss >> quota_str >> period_str;
            quota = parse_leading_int(quota_str);
            period = parse_leading_int(period_str);
        }
    } else {
        quota = read_number(paths_.cgroup_root / "cpu" / "cpu.cfs_quota_us");
        period = read_number(paths_.cgroup_root / "cpu" / "cpu.cfs_period_us")
                     .value_or(100000);
    }

    if (quota && period && *quota > 0 && *period > 0) {
        return static_cast<double>(*quota) / static_cast<double>(*period);
    }
    return host_cpu_count();
}

int64_t SystemProbe::read_memory_limit_bytes(CgroupVersion version) const {
    std::optional<int64_t> limit;
    if (version == CgroupVersion::V2) {
        limit = read_number(paths_.cgroup_root / "memory.max");
    } else {
        limit = read_number(paths_.cgroup_root / "memory" / "memory.limit_in_bytes");
    }

    if (!limit || *limit <= 0 || *limit >= kCgroupV1UnlimitedFloor) {
        return host_total_memory_bytes();
    }
    return *limit;
}

int64_t SystemProbe::read_memory_usage_bytes(CgroupVersion version) const {
    auto path = version == CgroupVersion::V2
        ? paths_.cgroup_root / "memory.current"
        : paths_.cgroup_root / "memory" / "memory.usage_in_bytes";
    return read_number(path).value_or(0);
}

int64_t SystemProbe::read_container_cpu_usage_ns(CgroupVersion version) const {
    if (version == CgroupVersion::V1) {
        return read_number(paths_.cgroup_root / "cpuacct" / "cpuacct.usage").value_or(0);
    }

    auto stat = read_file(paths_.cgroup_root / "cpu.stat");
    if (!stat) return 0;

    std::istringstream iss(*stat);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.starts_with("usage_usec")) {
            auto usec = parse_leading_int(std::string_view{line}.substr(10));
            return usec ? *usec * 1000 : 0;
        }
    }
    return 0;
}

std::optional<FilesystemCapacity>
SystemProbe::read_filesystem_capacity(const std::filesystem::path& path) const {
    struct statvfs vfs {};
    if (::statvfs(path.c_str(), &vfs) != 0) return std::nullopt;

    auto fragment = static_cast<int64_t>(vfs.f_frsize ? vfs.f_frsize : vfs.f_bsize);
    auto total = static_cast<int64_t>(vfs.f_blocks) * fragment;
    auto free_blocks = static_cast<int64_t>(vfs.f_bfree) * fragment;
    return FilesystemCapacity{
        .total_bytes = total,
        .used_bytes = total - free_blocks,
    };
}

std::optional<FilesystemCapacity>
SystemProbe::read_storage_capacity(const std::filesystem::path& preferred) const {
    if (!preferred.empty()) {
        if (auto capacity = read_filesystem_capacity(preferred)) return capacity;
    }
    return read_filesystem_capacity("/");
}

double SystemProbe::host_cpu_count() const {
    auto n = std::thread::hardware_concurrency();
    return n == 0 ? 1.0 : static_cast<double>(n);
}

int64_t SystemProbe::host_total_memory_bytes() const {
    std::ifstream ifs(paths_.proc_root / "meminfo");
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.starts_with("MemTotal:")) {
            auto kb = parse_leading_int(std::string_view{line}.substr(9));
            return kb ? *kb * 1024 : 0;
        }
    }
    return 0;
}

int64_t system_clock_ticks() noexcept {
    long ticks = ::sysconf(_SC_CLK_TCK);
    return ticks > 0 ? ticks : 100;
}

int64_t system_page_size() noexcept {
    long size = ::sysconf(_SC_PAGESIZE);
    return size > 0 ? size : 4096;
}

}  // namespace container_pulse
