/**
 * @file collection_cycle.hpp
 * @brief One end-to-end sampling pass.
 *
 * Probe limits and container usage, enumerate processes, assemble and
 * persist the snapshot, then evaluate thresholds and dispatch webhooks.
 *
 * Sampler state is worked on as a copy and committed only after the
 * snapshot was persisted, so a failed cycle leaves the previous baselines
 * in place for the next one.
 */

#pragma once

#include "alerting/threshold_evaluator.hpp"
#include "alerting/webhook_dispatcher.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "resource_monitor/system_probe.hpp"
#include "sampler/process_enumerator.hpp"
#include "sampler/sampler_state.hpp"
#include "sampler/snapshot_assembler.hpp"
#include "sampler/uid_policy.hpp"
#include "storage/settings_repository.hpp"
#include "storage/snapshot_archive.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace container_pulse {

enum class CycleOutcome : uint8_t {
    Completed,
    Skipped,    ///< Another cycle was still running
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(CycleOutcome outcome) noexcept {
    switch (outcome) {
        case CycleOutcome::Completed: return "completed";
        case CycleOutcome::Skipped:   return "skipped";
        case CycleOutcome::Failed:    return "failed";
    }
    return "unknown";
}

struct CycleReport {
    CycleOutcome outcome{CycleOutcome::Completed};
    std::optional<MetricsSnapshot> snapshot;
    std::vector<AlertEvent> alerts;
    std::vector<WebhookHistoryEntry> deliveries;
    std::optional<std::string> error;
};

/// Collaborators of a cycle. All are borrowed and must outlive it.
struct CycleComponents {
    SystemProbe& probe;
    ProcessEnumerator& enumerator;
    SnapshotAssembler& assembler;
    SnapshotArchive& archive;
    SettingsRepository& settings;
    WebhookDispatcher& dispatcher;
    Logger& logger;
};

class CollectionCycle {
public:
    CollectionCycle(CycleComponents components,
                    UidAllowList allowed,
                    std::filesystem::path storage_path);

    CollectionCycle(const CollectionCycle&) = delete;
    CollectionCycle& operator=(const CollectionCycle&) = delete;

    /**
     * @brief Run one cycle stamped with now.
     *
     * Returns Skipped without touching any state when another call is still
     * in progress. Failures inside the cycle are logged and reported as
     * Failed; nothing propagates to the caller.
     */
    CycleReport run(TimestampMs now);

    [[nodiscard]] const SamplerState& state() const noexcept { return state_; }
    [[nodiscard]] const ThresholdEvaluator& evaluator() const noexcept { return evaluator_; }
    [[nodiscard]] uint64_t completed_cycles() const noexcept { return completed_.load(); }

private:
    CycleReport run_exclusive(TimestampMs now);
    [[nodiscard]] ContainerUsage measure_usage(CgroupVersion version,
                                               const ResourceLimits& limits,
                                               TimestampMs now,
                                               SamplerState& working);
    void dispatch_alerts(const ContainerUsage& usage, TimestampMs now, CycleReport& report);

    CycleComponents c_;
    UidAllowList allowed_;
    std::filesystem::path storage_path_;

    SamplerState state_;
    ThresholdEvaluator evaluator_;
    std::atomic<bool> in_progress_{false};
    std::atomic<uint64_t> completed_{0};
};

/// "CPU:12.34% MEM:56.78% STOR:9.00% procs:42"
[[nodiscard]] std::string format_cycle_summary(const MetricsSnapshot& snapshot);

}  // namespace container_pulse
