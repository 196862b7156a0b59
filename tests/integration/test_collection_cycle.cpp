/**
 * @file test_collection_cycle.cpp
 * @brief Integration tests exercising the full sampling and alerting pipeline.
 */

#include "support/pipeline.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace container_pulse;
using namespace container_pulse::test_support;
using namespace std::chrono_literals;

namespace {

constexpr TimestampMs kT0 = 1'700'000'000'000;
constexpr TimestampMs kMinute = 60'000;

/// Holds every request until release() is called.
class GateHttpClient : public IHttpClient {
public:
    Result<HttpResponse> send(const HttpRequest&) override {
        std::unique_lock lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
        return HttpResponse{204};
    }

    bool wait_entered(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }

    void release() {
        std::lock_guard lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_{false};
    bool released_{false};
};

}  // namespace

// ═══════════════════════════════════════════════
// Sampling and persistence
// ═══════════════════════════════════════════════

TEST(CollectionCycleIntegration, PersistsSnapshotUnderTimestampKey) {
    Pipeline p("cycle_persist");
    auto cycle = p.make_cycle();

    auto report = cycle->run(kT0);
    ASSERT_EQ(report.outcome, CycleOutcome::Completed);
    ASSERT_TRUE(report.snapshot.has_value());
    EXPECT_FALSE(report.error.has_value());

    const auto& snapshot = *report.snapshot;
    EXPECT_EQ(snapshot.timestamp_ms, kT0);
    EXPECT_DOUBLE_EQ(snapshot.limits.cpu_limit_cores, 2.0);
    EXPECT_EQ(snapshot.limits.memory_limit_bytes, 1'000'000);
    EXPECT_DOUBLE_EQ(snapshot.usage.cpu_usage_percent, 0.0);
    EXPECT_EQ(snapshot.usage.memory_usage_bytes, 500'000);
    EXPECT_DOUBLE_EQ(snapshot.usage.memory_usage_percent, 50.0);
    EXPECT_GT(snapshot.usage.storage_total_bytes, 0);
    EXPECT_EQ(snapshot.uid_names,
              (std::map<std::string, std::string>{{"0", "root"}, {"1000", "app"}}));

    ASSERT_EQ(snapshot.processes.size(), 2u);
    for (const auto& process : snapshot.processes) {
        EXPECT_FALSE(process.cpu_percent.has_value());
    }

    auto ttl = p.store.inner.ttl("metrics:" + std::to_string(kT0));
    ASSERT_TRUE(ttl.has_value());
    EXPECT_LE(*ttl, kDefaultSnapshotTtl);
    EXPECT_GT(*ttl, kDefaultSnapshotTtl - 1min);

    auto stored = p.archive.get(kT0);
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->has_value());
    EXPECT_EQ(**stored, snapshot);

    EXPECT_EQ(cycle->completed_cycles(), 1u);
    EXPECT_EQ(count_lines_containing(*p.lines, "CPU:0.00% MEM:50.00%"), 1u);
    EXPECT_EQ(count_lines_containing(*p.lines, "procs:2"), 1u);
}

TEST(CollectionCycleIntegration, NonUtf8CommandLineDoesNotAbortCycle) {
    Pipeline p("cycle_non_utf8");
    p.host.add_process({.pid = 300, .ppid = 1, .uid = 1000, .comm = "python",
                        .argv = {"python", "\xff\xfe", "script"}, .rss_kb = 50});
    auto cycle = p.make_cycle();

    auto first = cycle->run(kT0);
    ASSERT_EQ(first.outcome, CycleOutcome::Completed);
    EXPECT_FALSE(first.error.has_value());
    EXPECT_EQ(first.snapshot->processes.size(), 3u);

    auto stored = p.archive.get(kT0);
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->has_value());
    bool found = false;
    for (const auto& process : (*stored)->processes) {
        if (process.pid != 300) continue;
        found = true;
        EXPECT_EQ(process.command, "python \xEF\xBF\xBD\xEF\xBF\xBD script");
    }
    EXPECT_TRUE(found);

    // Baselines were committed, so the next cycle attributes CPU
    p.host.set_jiffies(300, 10, 0, "python");
    auto second = cycle->run(kT0 + 5'000);
    ASSERT_EQ(second.outcome, CycleOutcome::Completed);
    EXPECT_EQ(cycle->completed_cycles(), 2u);
    for (const auto& process : second.snapshot->processes) {
        EXPECT_TRUE(process.cpu_percent.has_value());
    }
}

TEST(CollectionCycleIntegration, SecondCycleMeasuresCpuDeltas) {
    Pipeline p("cycle_delta");
    auto cycle = p.make_cycle();
    ASSERT_EQ(cycle->run(kT0).outcome, CycleOutcome::Completed);

    // 0.1 s of container CPU and 0.5 s for pid 200, over 5 s on 2 cores
    p.host.set_v2_cpu_usage_usec(2'100'000);
    p.host.set_jiffies(200, 40, 10, "python");

    auto report = cycle->run(kT0 + 5'000);
    ASSERT_EQ(report.outcome, CycleOutcome::Completed);
    EXPECT_NEAR(report.snapshot->usage.cpu_usage_percent, 1.0, 1e-9);

    const auto& top = report.snapshot->processes.front();
    EXPECT_EQ(top.pid, 200);
    EXPECT_EQ(top.command, "python app.py");
    ASSERT_TRUE(top.cpu_percent.has_value());
    EXPECT_NEAR(*top.cpu_percent, 5.0, 1e-9);

    EXPECT_EQ(cycle->state().last_container_usage_ns, 2'100'000'000);
    EXPECT_EQ(cycle->state().per_process.size(), 2u);
    EXPECT_EQ(*p.archive.timestamps(), (std::vector<TimestampMs>{kT0, kT0 + 5'000}));
}

TEST(CollectionCycleIntegration, UidPolicyLimitsProcessesAndNames) {
    Pipeline p("cycle_uid");
    auto cycle = p.make_cycle(UidAllowList{std::set<Uid>{1000}});

    auto report = cycle->run(kT0);
    ASSERT_EQ(report.outcome, CycleOutcome::Completed);
    ASSERT_EQ(report.snapshot->processes.size(), 1u);
    EXPECT_EQ(report.snapshot->processes[0].pid, 200);
    EXPECT_EQ(report.snapshot->uid_names,
              (std::map<std::string, std::string>{{"1000", "app"}}));
}

TEST(CollectionCycleIntegration, ExitedProcessLeavesState) {
    Pipeline p("cycle_exit");
    auto cycle = p.make_cycle();
    (void)cycle->run(kT0);

    p.host.remove_process(200);
    auto report = cycle->run(kT0 + 5'000);
    ASSERT_EQ(report.snapshot->processes.size(), 1u);
    EXPECT_FALSE(cycle->state().per_process.contains(200));
}

// ═══════════════════════════════════════════════
// Alerting
// ═══════════════════════════════════════════════

TEST(CollectionCycleIntegration, NoAlertsWhenDisabled) {
    Pipeline p("cycle_quiet");
    p.host.set_v2_memory("1000000\n", 990'000);
    auto cycle = p.make_cycle();

    auto report = cycle->run(kT0);
    EXPECT_TRUE(report.alerts.empty());
    EXPECT_EQ(p.http.calls(), 0);
}

TEST(CollectionCycleIntegration, AlertDispatchedRecordedAndCooledDown) {
    Pipeline p("cycle_alert");
    p.enable_alerts();
    p.host.set_v2_memory("1000000\n", 950'000);
    auto cycle = p.make_cycle();

    auto first = cycle->run(kT0);
    ASSERT_EQ(first.outcome, CycleOutcome::Completed);
    ASSERT_EQ(first.alerts.size(), 1u);
    EXPECT_EQ(first.alerts[0].resource, Resource::Memory);
    ASSERT_EQ(first.deliveries.size(), 1u);
    EXPECT_TRUE(first.deliveries[0].success);

    ASSERT_EQ(p.http.requests().size(), 1u);
    const auto request = p.http.requests()[0];
    EXPECT_EQ(request.url, "http://ops.example/hook");
    EXPECT_EQ(request.headers.at("Content-Type"), "application/json");
    auto body = nlohmann::json::parse(request.body.value_or("null"));
    EXPECT_EQ(body["text"], "MEMORY usage (95.0%) has exceeded the threshold of 90%");
    EXPECT_EQ(body["value"], 95);

    auto history = p.history.entries();
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 1u);
    EXPECT_EQ((*history)[0].webhook_name, "Ops");
    EXPECT_EQ((*history)[0].reason, "MEMORY threshold exceeded: 95.0%");
    EXPECT_EQ((*history)[0].status_code.value_or(0), 200);
    EXPECT_EQ(count_lines_containing(*p.lines, "MEMORY threshold exceeded: 95.0%"), 1u);

    auto within_cooldown = cycle->run(kT0 + kMinute);
    EXPECT_TRUE(within_cooldown.alerts.empty());
    EXPECT_EQ(p.http.calls(), 1);

    auto after_cooldown = cycle->run(kT0 + 6 * kMinute);
    EXPECT_EQ(after_cooldown.alerts.size(), 1u);
    EXPECT_EQ(p.http.calls(), 2);
    EXPECT_EQ(p.history.entries()->size(), 2u);
}

TEST(CollectionCycleIntegration, FailingWebhookDoesNotFailCycle) {
    Pipeline p("cycle_hookdown");
    p.enable_alerts("http://down.example");
    p.http.fail_url("http://down.example");
    p.host.set_v2_memory("1000000\n", 950'000);
    auto cycle = p.make_cycle();

    auto report = cycle->run(kT0);
    ASSERT_EQ(report.outcome, CycleOutcome::Completed);
    ASSERT_EQ(report.deliveries.size(), 1u);
    EXPECT_FALSE(report.deliveries[0].success);

    auto history = p.history.entries();
    ASSERT_EQ(history->size(), 1u);
    EXPECT_EQ((*history)[0].error.value_or(""), "Connection refused");
    EXPECT_FALSE((*history)[0].status_code.has_value());
}

// ═══════════════════════════════════════════════
// Failure and overlap
// ═══════════════════════════════════════════════

TEST(CollectionCycleIntegration, PersistFailureKeepsPreviousBaselines) {
    Pipeline p("cycle_storefail");
    p.enable_alerts();
    auto cycle = p.make_cycle();
    ASSERT_EQ(cycle->run(kT0).outcome, CycleOutcome::Completed);

    p.store.fail_snapshots = true;
    p.host.set_v2_cpu_usage_usec(2'100'000);
    p.host.set_v2_memory("1000000\n", 950'000);

    auto failed = cycle->run(kT0 + 5'000);
    EXPECT_EQ(failed.outcome, CycleOutcome::Failed);
    EXPECT_EQ(failed.error.value_or(""), "store unavailable");
    EXPECT_TRUE(failed.snapshot.has_value());
    EXPECT_TRUE(failed.alerts.empty());
    EXPECT_EQ(p.http.calls(), 0);
    EXPECT_EQ(cycle->state().last_container_usage_ns, 2'000'000'000);
    EXPECT_EQ(cycle->state().last_container_timestamp_ms, kT0);
    EXPECT_EQ(cycle->completed_cycles(), 1u);
    EXPECT_EQ(count_lines_containing(*p.lines, "failed to persist snapshot"), 1u);

    // The next successful cycle measures against the last committed baseline
    p.store.fail_snapshots = false;
    auto recovered = cycle->run(kT0 + 10'000);
    ASSERT_EQ(recovered.outcome, CycleOutcome::Completed);
    EXPECT_NEAR(recovered.snapshot->usage.cpu_usage_percent, 0.5, 1e-9);
    EXPECT_EQ(recovered.alerts.size(), 1u);
}

TEST(CollectionCycleIntegration, OverlappingRunIsSkipped) {
    Pipeline p("cycle_overlap");
    p.enable_alerts();
    p.host.set_v2_memory("1000000\n", 950'000);

    GateHttpClient gate;
    WebhookDispatcher gated(gate, p.history, p.pool, p.logger);
    auto cycle = p.make_cycle(gated);

    CycleReport first;
    std::jthread worker([&] { first = cycle->run(kT0); });

    const bool entered = gate.wait_entered(5s);
    auto overlapping = cycle->run(kT0 + 1);
    gate.release();
    worker.join();

    ASSERT_TRUE(entered);
    EXPECT_EQ(overlapping.outcome, CycleOutcome::Skipped);
    EXPECT_FALSE(overlapping.snapshot.has_value());
    EXPECT_EQ(first.outcome, CycleOutcome::Completed);
    ASSERT_EQ(first.deliveries.size(), 1u);
    EXPECT_EQ(first.deliveries[0].status_code.value_or(0), 204);
    EXPECT_EQ(*p.archive.timestamps(), (std::vector<TimestampMs>{kT0}));
    EXPECT_EQ(count_lines_containing(*p.lines, "skipping tick"), 1u);

    EXPECT_EQ(cycle->run(kT0 + 5'000).outcome, CycleOutcome::Completed);
}

TEST(CollectionCycleIntegration, BareHostStillProducesSnapshot) {
    Pipeline p("cycle_bare");
    std::filesystem::remove(p.host.mounts_file());
    std::filesystem::remove_all(p.host.cgroup_root());
    auto cycle = p.make_cycle();

    auto report = cycle->run(kT0);
    ASSERT_EQ(report.outcome, CycleOutcome::Completed);
    EXPECT_GE(report.snapshot->limits.cpu_limit_cores, 1.0);
    EXPECT_EQ(report.snapshot->limits.memory_limit_bytes, int64_t{8} * 1024 * 1024 * 1024);
    EXPECT_EQ(report.snapshot->usage.memory_usage_bytes, 0);
    EXPECT_EQ(report.snapshot->processes.size(), 2u);
}

TEST(CollectionCycleIntegration, SummaryFormat) {
    MetricsSnapshot snapshot;
    snapshot.usage.cpu_usage_percent = 12.346;
    snapshot.usage.memory_usage_percent = 56.78;
    snapshot.usage.storage_usage_percent = 9.0;
    snapshot.processes.resize(42);
    EXPECT_EQ(format_cycle_summary(snapshot), "CPU:12.35% MEM:56.78% STOR:9.00% procs:42");
}
