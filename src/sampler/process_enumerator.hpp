/**
 * @file process_enumerator.hpp
 * @brief Lists processes from procfs and attributes CPU and memory to each.
 *
 * Per-PID reads run on a ThreadPool; CPU attribution against the retained
 * per-PID tick counts happens afterwards on the calling thread, so only the
 * collection loop ever touches SamplerState.
 *
 * Data sources per PID:
 *   <proc>/<pid>/status   : Uid (read first, for filtering) and VmRSS
 *   <proc>/<pid>/cmdline  : NUL-separated argv, <pid>/comm when empty
 *   <proc>/<pid>/stat     : ppid, utime, stime
 *   <proc>/<pid>/statm    : resident pages when VmRSS is absent
 */

#pragma once

#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "resource_monitor/system_probe.hpp"
#include "sampler/sampler_state.hpp"
#include "sampler/uid_policy.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace container_pulse {

struct ProcessEnumeratorOptions {
    std::filesystem::path proc_root = "/proc";
    size_t proc_max = 8192;
    int64_t clock_ticks = system_clock_ticks();
    int64_t page_size = system_page_size();
};

/// Raw per-PID facts before CPU attribution.
struct ProcessReading {
    Pid pid{0};
    Pid ppid{0};
    std::optional<Uid> uid;
    std::string command;
    int64_t jiffies{0};
    int64_t rss_bytes{0};
};

class ProcessEnumerator {
public:
    ProcessEnumerator(ProcessEnumeratorOptions options, ThreadPool& pool);

    /**
     * @brief Sample every visible process.
     *
     * Updates state.per_process for every sampled PID and drops entries of
     * PIDs no longer listed. The result is sorted by (cpu% desc, memory desc)
     * and capped at proc_max.
     */
    std::vector<ProcessSample> enumerate(TimestampMs now,
                                         const ResourceLimits& limits,
                                         const UidAllowList& allowed,
                                         SamplerState& state);

    /// Numeric entries of the proc root.
    [[nodiscard]] std::vector<Pid> list_pids() const;

    /// Empty when the PID is filtered out or vanished mid-read.
    [[nodiscard]] std::optional<ProcessReading> read_process(Pid pid,
                                                             const UidAllowList& allowed) const;

    [[nodiscard]] const ProcessEnumeratorOptions& options() const noexcept { return options_; }

private:
    ProcessEnumeratorOptions options_;
    ThreadPool& pool_;
};

/// Orders samples by cpu% (empty counts as 0) then memory, both descending.
void sort_process_samples(std::vector<ProcessSample>& samples);

}  // namespace container_pulse
