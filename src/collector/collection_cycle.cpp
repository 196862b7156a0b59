/**
 * @file collection_cycle.cpp
 * @brief CollectionCycle implementation.
 */

#include "collector/collection_cycle.hpp"

#include <cstdio>
#include <exception>
#include <iterator>

namespace container_pulse {

namespace {

/// Clears the in-progress flag on every exit path.
class InProgressGuard {
public:
    explicit InProgressGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InProgressGuard() { flag_.store(false); }

    InProgressGuard(const InProgressGuard&) = delete;
    InProgressGuard& operator=(const InProgressGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

double percent_of(int64_t part, int64_t whole) {
    if (whole <= 0) return 0.0;
    return clamp_percent(static_cast<double>(part) / static_cast<double>(whole) * 100.0);
}

}  // anonymous namespace

std::string format_cycle_summary(const MetricsSnapshot& snapshot) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "CPU:%.2f%% MEM:%.2f%% STOR:%.2f%% procs:%zu",
                  snapshot.usage.cpu_usage_percent,
                  snapshot.usage.memory_usage_percent,
                  snapshot.usage.storage_usage_percent,
                  snapshot.processes.size());
    return buf;
}

CollectionCycle::CollectionCycle(CycleComponents components,
                                 UidAllowList allowed,
                                 std::filesystem::path storage_path)
    : c_(components)
    , allowed_(std::move(allowed))
    , storage_path_(std::move(storage_path)) {}

CycleReport CollectionCycle::run(TimestampMs now) {
    if (in_progress_.exchange(true)) {
        c_.logger.warn("collection cycle still running, skipping tick");
        return CycleReport{CycleOutcome::Skipped, std::nullopt, {}, {}, std::nullopt};
    }
    InProgressGuard guard(in_progress_);

    try {
        return run_exclusive(now);
    } catch (const std::exception& ex) {
        c_.logger.error(std::string{"collection cycle failed: "} + ex.what());
        return CycleReport{CycleOutcome::Failed, std::nullopt, {}, {}, std::string{ex.what()}};
    }
}

CycleReport CollectionCycle::run_exclusive(TimestampMs now) {
    SamplerState working = state_;

    const auto version = c_.probe.detect_cgroup_version();
    const auto limits = c_.probe.read_resource_limits(version);
    const auto usage = measure_usage(version, limits, now, working);

    auto processes = c_.enumerator.enumerate(now, limits, allowed_, working);
    auto snapshot = c_.assembler.assemble(now, limits, usage, std::move(processes));

    if (auto stored = c_.archive.put(snapshot); !stored) {
        c_.logger.error("failed to persist snapshot: " + stored.error().message);
        return CycleReport{CycleOutcome::Failed, std::move(snapshot), {}, {},
                           stored.error().message};
    }

    state_ = std::move(working);
    completed_.fetch_add(1);
    c_.logger.info(format_cycle_summary(snapshot));

    CycleReport report;
    report.outcome = CycleOutcome::Completed;
    dispatch_alerts(snapshot.usage, now, report);
    report.snapshot = std::move(snapshot);
    return report;
}

ContainerUsage CollectionCycle::measure_usage(CgroupVersion version,
                                              const ResourceLimits& limits,
                                              TimestampMs now,
                                              SamplerState& working) {
    ContainerUsage usage;

    const auto usage_ns = c_.probe.read_container_cpu_usage_ns(version);
    usage.cpu_usage_percent =
        update_container_cpu_percent(working, usage_ns, now, limits.cpu_limit_cores);

    usage.memory_usage_bytes = c_.probe.read_memory_usage_bytes(version);
    usage.memory_usage_percent = percent_of(usage.memory_usage_bytes, limits.memory_limit_bytes);

    if (auto capacity = c_.probe.read_storage_capacity(storage_path_)) {
        usage.storage_total_bytes = capacity->total_bytes;
        usage.storage_used_bytes = capacity->used_bytes;
        usage.storage_usage_percent = percent_of(capacity->used_bytes, capacity->total_bytes);
    } else {
        c_.logger.debug("storage capacity unavailable for " + storage_path_.string());
    }
    return usage;
}

void CollectionCycle::dispatch_alerts(const ContainerUsage& usage,
                                      TimestampMs now,
                                      CycleReport& report) {
    auto thresholds = c_.settings.threshold_config();
    if (!thresholds) {
        c_.logger.warn("threshold settings unavailable: " + thresholds.error().message);
        return;
    }

    report.alerts = evaluator_.evaluate(*thresholds, usage, now);
    if (report.alerts.empty()) return;

    auto webhooks = c_.settings.webhook_configs();
    if (!webhooks) {
        c_.logger.warn("webhook settings unavailable: " + webhooks.error().message);
        return;
    }

    for (const auto& event : report.alerts) {
        c_.logger.info(event.reason());
        auto entries = c_.dispatcher.notify(event, *webhooks);
        report.deliveries.insert(report.deliveries.end(),
                                 std::make_move_iterator(entries.begin()),
                                 std::make_move_iterator(entries.end()));
    }
}

}  // namespace container_pulse
