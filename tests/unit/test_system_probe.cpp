/**
 * @file test_system_probe.cpp
 * @brief Unit tests for cgroup limit/usage probing against a fake tree.
 */

#include "resource_monitor/system_probe.hpp"

#include "support/fake_host.hpp"

#include <gtest/gtest.h>

using namespace container_pulse;
using namespace container_pulse::test_support;

namespace {

SystemProbe make_probe(const FakeHost& host) {
    return SystemProbe(ProbePaths{host.proc_root(), host.cgroup_root(), host.mounts_file()});
}

constexpr int64_t kHostMemTotalKb = 8 * 1024 * 1024;
constexpr int64_t kHostMemTotalBytes = kHostMemTotalKb * 1024;

}  // namespace

TEST(SystemProbeTest, DetectsCgroupVersionFromMounts) {
    FakeHost host("probe_version");
    auto probe = make_probe(host);

    host.use_cgroup_v2();
    EXPECT_EQ(probe.detect_cgroup_version(), CgroupVersion::V2);

    host.use_cgroup_v1();
    EXPECT_EQ(probe.detect_cgroup_version(), CgroupVersion::V1);
}

TEST(SystemProbeTest, MissingMountsFileMeansV1) {
    FakeHost host("probe_nomounts");
    EXPECT_EQ(make_probe(host).detect_cgroup_version(), CgroupVersion::V1);
}

// ═══════════════════════════════════════════════
// cgroup v2
// ═══════════════════════════════════════════════

TEST(SystemProbeTest, V2QuotaAndMemoryLimit) {
    FakeHost host("probe_v2");
    host.use_cgroup_v2();
    host.set_v2_cpu_max("150000 100000\n");
    host.set_v2_memory("536870912\n", 268435456);
    host.set_v2_cpu_usage_usec(2500);

    auto probe = make_probe(host);
    auto limits = probe.read_resource_limits(CgroupVersion::V2);
    EXPECT_DOUBLE_EQ(limits.cpu_limit_cores, 1.5);
    EXPECT_EQ(limits.memory_limit_bytes, 536870912);
    EXPECT_EQ(probe.read_memory_usage_bytes(CgroupVersion::V2), 268435456);
    EXPECT_EQ(probe.read_container_cpu_usage_ns(CgroupVersion::V2), 2'500'000);
}

TEST(SystemProbeTest, V2UnlimitedFallsBackToHost) {
    FakeHost host("probe_v2_max");
    host.use_cgroup_v2();
    host.set_v2_cpu_max("max 100000\n");
    host.set_v2_memory("max\n", 1024);

    auto probe = make_probe(host);
    auto limits = probe.read_resource_limits(CgroupVersion::V2);
    EXPECT_DOUBLE_EQ(limits.cpu_limit_cores, probe.host_cpu_count());
    EXPECT_EQ(limits.memory_limit_bytes, kHostMemTotalBytes);
}

// ═══════════════════════════════════════════════
// cgroup v1
// ═══════════════════════════════════════════════

TEST(SystemProbeTest, V1QuotaAndMemoryLimit) {
    FakeHost host("probe_v1");
    host.use_cgroup_v1();
    host.set_v1_cpu(50000, 100000);
    host.set_v1_memory(1073741824, 104857600);
    host.set_v1_cpu_usage_ns(123456789);

    auto probe = make_probe(host);
    auto limits = probe.read_resource_limits(CgroupVersion::V1);
    EXPECT_DOUBLE_EQ(limits.cpu_limit_cores, 0.5);
    EXPECT_EQ(limits.memory_limit_bytes, 1073741824);
    EXPECT_EQ(probe.read_memory_usage_bytes(CgroupVersion::V1), 104857600);
    EXPECT_EQ(probe.read_container_cpu_usage_ns(CgroupVersion::V1), 123456789);
}

TEST(SystemProbeTest, V1UnlimitedSentinelFallsBackToHost) {
    FakeHost host("probe_v1_unlimited");
    host.use_cgroup_v1();
    host.set_v1_cpu(-1, 100000);
    host.set_v1_memory(9223372036854771712, 4096);

    auto probe = make_probe(host);
    auto limits = probe.read_resource_limits(CgroupVersion::V1);
    EXPECT_DOUBLE_EQ(limits.cpu_limit_cores, probe.host_cpu_count());
    EXPECT_EQ(limits.memory_limit_bytes, kHostMemTotalBytes);
}

// ═══════════════════════════════════════════════
// Bare host
// ═══════════════════════════════════════════════

TEST(SystemProbeTest, BareHostFallsBackWithoutThrowing) {
    FakeHost host("probe_bare");
    auto probe = make_probe(host);

    ResourceLimits limits;
    ASSERT_NO_THROW(limits = probe.read_resource_limits(CgroupVersion::V2));
    EXPECT_GE(limits.cpu_limit_cores, 1.0);
    EXPECT_EQ(limits.memory_limit_bytes, kHostMemTotalBytes);
    EXPECT_EQ(probe.read_memory_usage_bytes(CgroupVersion::V2), 0);
    EXPECT_EQ(probe.read_container_cpu_usage_ns(CgroupVersion::V2), 0);
    EXPECT_EQ(probe.read_container_cpu_usage_ns(CgroupVersion::V1), 0);
}

TEST(SystemProbeTest, StorageFallsBackToRoot) {
    FakeHost host("probe_storage");
    auto probe = make_probe(host);

    auto direct = probe.read_filesystem_capacity(host.root());
    ASSERT_TRUE(direct.has_value());
    EXPECT_GT(direct->total_bytes, 0);
    EXPECT_GE(direct->used_bytes, 0);
    EXPECT_LE(direct->used_bytes, direct->total_bytes);

    EXPECT_FALSE(probe.read_filesystem_capacity(host.root() / "missing").has_value());
    auto fallback = probe.read_storage_capacity(host.root() / "missing");
    ASSERT_TRUE(fallback.has_value());
    EXPECT_GT(fallback->total_bytes, 0);
}

TEST(SystemProbeTest, HostConstantsHaveSaneDefaults) {
    EXPECT_GT(system_clock_ticks(), 0);
    EXPECT_GT(system_page_size(), 0);
}
