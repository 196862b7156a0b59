/**
 * @file process_enumerator.cpp
 * @brief ProcessEnumerator: procfs parsing and per-PID CPU attribution.
 */

#include "sampler/process_enumerator.hpp"

#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <unordered_set>

namespace container_pulse {

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

struct StatusFields {
    std::optional<Uid> uid;
    std::optional<int64_t> rss_bytes;
};

StatusFields parse_status(const std::string& status) {
    StatusFields fields;
    std::istringstream iss(status);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.starts_with("Uid:")) {
            // Real, effective, saved, filesystem; the real UID owns the process
            fields.uid = parse_uid(std::string_view{line}.substr(4));
        } else if (line.starts_with("VmRSS:")) {
            if (auto kb = parse_leading_int(std::string_view{line}.substr(6))) {
                fields.rss_bytes = *kb * 1024;
            }
        }
    }
    return fields;
}

std::string join_cmdline(const std::string& raw) {
    std::string command;
    size_t start = 0;
    while (start < raw.size()) {
        auto end = raw.find('\0', start);
        if (end == std::string::npos) end = raw.size();
        if (end > start) {
            if (!command.empty()) command.push_back(' ');
            command.append(raw, start, end - start);
        }
        start = end + 1;
    }
    return command;
}

struct StatFields {
    Pid ppid{0};
    int64_t jiffies{0};
};

/**
 * @brief Parse /proc/<pid>/stat.
 * Format: "pid (comm) state ppid ... utime stime ..."; comm may contain
 * spaces and parentheses, so fields are counted from the last ')'.
 */
std::optional<StatFields> parse_stat(const std::string& stat) {
    auto rparen = stat.rfind(')');
    if (rparen == std::string::npos) return std::nullopt;

    std::istringstream iss(stat.substr(rparen + 1));
    std::vector<std::string> fields{std::istream_iterator<std::string>(iss),
                                    std::istream_iterator<std::string>()};
    // fields[0] = state, [1] = ppid, [11] = utime, [12] = stime
    if (fields.size() < 13) return std::nullopt;

    StatFields out;
    out.ppid = static_cast<Pid>(parse_leading_int(fields[1]).value_or(0));
    out.jiffies = parse_leading_int(fields[11]).value_or(0)
                + parse_leading_int(fields[12]).value_or(0);
    return out;
}

}  // anonymous namespace

ProcessEnumerator::ProcessEnumerator(ProcessEnumeratorOptions options, ThreadPool& pool)
    : options_(std::move(options)), pool_(pool) {
    options_.proc_max = std::max<size_t>(options_.proc_max, 1);
    if (options_.clock_ticks <= 0) options_.clock_ticks = 100;
    if (options_.page_size <= 0) options_.page_size = 4096;
}

std::vector<Pid> ProcessEnumerator::list_pids() const {
    std::vector<Pid> pids;
    std::error_code ec;
    std::filesystem::directory_iterator it(options_.proc_root, ec);
    if (ec) return pids;

    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                                         [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        if (!entry.is_directory(ec)) continue;
        if (auto pid = parse_leading_int(name)) {
            pids.push_back(static_cast<Pid>(*pid));
        }
    }
    return pids;
}

std::optional<ProcessReading> ProcessEnumerator::read_process(Pid pid,
                                                              const UidAllowList& allowed) const {
    const auto dir = options_.proc_root / std::to_string(pid);

    auto status = read_file(dir / "status");
    StatusFields status_fields = status ? parse_status(*status) : StatusFields{};
    if (!allowed.allows(status_fields.uid)) return std::nullopt;

    auto stat = read_file(dir / "stat");
    if (!stat) return std::nullopt;
    auto stat_fields = parse_stat(*stat);
    if (!stat_fields) return std::nullopt;

    ProcessReading reading;
    reading.pid = pid;
    reading.ppid = stat_fields->ppid;
    reading.uid = status_fields.uid;
    reading.jiffies = stat_fields->jiffies;

    if (auto cmdline = read_file(dir / "cmdline")) {
        reading.command = join_cmdline(*cmdline);
    }
    if (reading.command.empty()) {
        // Kernel threads have an empty cmdline
        if (auto comm = read_file(dir / "comm")) {
            reading.command = std::string{trim(*comm)};
        }
    }
    if (reading.command.empty()) reading.command = "(unknown)";

    if (status_fields.rss_bytes) {
        reading.rss_bytes = *status_fields.rss_bytes;
    } else if (auto statm = read_file(dir / "statm")) {
        std::istringstream iss(*statm);
        int64_t size_pages = 0;
        int64_t resident_pages = 0;
        if (iss >> size_pages >> resident_pages) {
            reading.rss_bytes = resident_pages * options_.page_size;
        }
    }

    return reading;
}

std::vector<ProcessSample> ProcessEnumerator::enumerate(TimestampMs now,
                                                        const ResourceLimits& limits,
                                                        const UidAllowList& allowed,
                                                        SamplerState& state) {
    const auto pids = list_pids();

    // Batch PIDs so a busy host does not flood the pool with tiny tasks
    const size_t batches = std::max<size_t>(1, pool_.thread_count() * 4);
    const size_t batch_size = (pids.size() + batches - 1) / batches;

    std::vector<std::future<std::vector<ProcessReading>>> futures;
    for (size_t begin = 0; begin < pids.size(); begin += batch_size) {
        const size_t end = std::min(pids.size(), begin + batch_size);
        futures.push_back(pool_.submit([this, &pids, &allowed, begin, end] {
            std::vector<ProcessReading> readings;
            for (size_t i = begin; i < end; ++i) {
                if (auto reading = read_process(pids[i], allowed)) {
                    readings.push_back(std::move(*reading));
                }
            }
            return readings;
        }));
    }

    std::vector<ProcessSample> samples;
    samples.reserve(pids.size());

    for (auto& outcome : join_all(futures)) {
        if (!outcome) continue;  // a failed batch degrades to missing rows

        for (auto& reading : *outcome) {
            ProcessSample sample;
            sample.pid = reading.pid;
            sample.ppid = reading.ppid;
            sample.uid = reading.uid;
            sample.command = std::move(reading.command);
            sample.memory_bytes = reading.rss_bytes;

            auto prev = state.per_process.find(reading.pid);
            if (prev != state.per_process.end()) {
                double delta_seconds =
                    static_cast<double>(now - prev->second.timestamp_ms) / 1000.0;
                if (delta_seconds > 0.0) {
                    double cpu_seconds =
                        static_cast<double>(reading.jiffies - prev->second.jiffies)
                        / static_cast<double>(options_.clock_ticks);
                    sample.cpu_percent = clamp_percent(
                        (cpu_seconds / delta_seconds) * 100.0
                        / std::max(limits.cpu_limit_cores, 1e-6));
                }
            }
            state.per_process[reading.pid] = ProcessTicks{reading.jiffies, now};

            if (limits.memory_limit_bytes > 0) {
                sample.memory_percent = clamp_percent(
                    static_cast<double>(reading.rss_bytes) * 100.0
                    / static_cast<double>(limits.memory_limit_bytes));
            }

            samples.push_back(std::move(sample));
        }
    }

    // Forget processes that exited
    std::unordered_set<Pid> listed(pids.begin(), pids.end());
    std::erase_if(state.per_process, [&listed](const auto& entry) {
        return !listed.contains(entry.first);
    });

    sort_process_samples(samples);
    if (samples.size() > options_.proc_max) {
        samples.resize(options_.proc_max);
    }
    return samples;
}

void sort_process_samples(std::vector<ProcessSample>& samples) {
    std::sort(samples.begin(), samples.end(), [](const ProcessSample& a, const ProcessSample& b) {
        const double cpu_a = a.cpu_percent.value_or(0.0);
        const double cpu_b = b.cpu_percent.value_or(0.0);
        if (cpu_a != cpu_b) return cpu_a > cpu_b;
        if (a.memory_bytes != b.memory_bytes) return a.memory_bytes > b.memory_bytes;
        return a.pid < b.pid;
    });
}

}  // namespace container_pulse
