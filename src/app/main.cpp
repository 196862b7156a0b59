/**
 * @file main.cpp
 * @brief ContainerPulse daemon entry point.
 *
 * Wires all modules into the sampling pipeline:
 *   Config → Logger → Store → Probe/Enumerator → Cycle → Alerting → Loop
 */

#include "alerting/http_client.hpp"
#include "alerting/webhook_dispatcher.hpp"
#include "collector/collection_cycle.hpp"
#include "collector/collection_loop.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "resource_monitor/system_probe.hpp"
#include "sampler/process_enumerator.hpp"
#include "sampler/snapshot_assembler.hpp"
#include "sampler/uid_policy.hpp"
#include "storage/history_sink.hpp"
#include "storage/kv_store.hpp"
#include "storage/settings_repository.hpp"
#include "storage/snapshot_archive.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/snapshot_codec.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace container_pulse;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    std::optional<int64_t> interval_seconds;
    bool once = false;
    std::optional<std::string> test_webhook_id;
};

void print_usage() {
    std::cout << "Usage: container_pulse [OPTIONS]\n"
              << "  --config <path>          Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>         Log output directory\n"
              << "  --interval <seconds>     Collection interval, 1..3600\n"
              << "  --once                   Run one cycle, print the snapshot JSON, exit\n"
              << "  --test-webhook <id>      Send a test delivery to one webhook, exit\n"
              << "  --help, -h               Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--interval" && i + 1 < argc) {
            args.interval_seconds = parse_leading_int(argv[++i]);
        } else if (arg == "--once") {
            args.once = true;
        } else if (arg == "--test-webhook" && i + 1 < argc) {
            args.test_webhook_id = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

/// The in-process store starts empty; seed it from the configuration file.
void seed_settings(SettingsRepository& settings, const Config& config, Logger& logger) {
    AdminSettings seeded;
    seeded.thresholds = config.alerts.thresholds;
    seeded.webhooks = config.alerts.webhooks;
    seeded.collection_interval_seconds = config.collector.interval_seconds;

    if (auto saved = settings.save(seeded); !saved) {
        logger.error("Failed to seed settings: " + saved.error().message);
    }
}

int run_webhook_test(const std::string& id,
                     SettingsRepository& settings,
                     WebhookDispatcher& dispatcher,
                     Logger& logger) {
    auto loaded = settings.load();
    if (!loaded) {
        logger.error("Settings unavailable: " + loaded.error().message);
        return 1;
    }

    const auto& hooks = loaded->webhooks;
    auto it = std::find_if(hooks.begin(), hooks.end(),
                           [&id](const WebhookConfig& hook) { return hook.id == id; });
    if (it == hooks.end()) {
        std::cerr << "No webhook with id '" << id << "'" << std::endl;
        return 1;
    }

    auto entry = dispatcher.test(*it, loaded->thresholds);
    std::cout << dump_json(history_entry_to_json(entry), 2) << std::endl;
    return entry.success ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();
    apply_env_overrides(config);

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.interval_seconds) {
        config.collector.interval_seconds = clamp_interval_seconds(*args.interval_seconds);
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "container_pulse",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level));
    logger.info("ContainerPulse starting...");

    // ── Collaborators ────────────────────────
    InMemoryStore store;
    SettingsRepository settings(store);
    seed_settings(settings, config, logger);
    SnapshotArchive archive(store, std::chrono::seconds(config.store.snapshot_ttl_seconds),
                            config.store.max_snapshots);
    StoreHistorySink history(store);

    auto thread_count = std::max(1u, std::thread::hardware_concurrency());
    ThreadPool pool(thread_count);
    CurlHttpClient http;
    WebhookDispatcher dispatcher(http, history, pool, logger);

    if (args.test_webhook_id) {
        return run_webhook_test(*args.test_webhook_id, settings, dispatcher, logger);
    }

    // ── Sampling Pipeline ────────────────────
    SystemProbe probe(ProbePaths{config.paths.proc_root,
                                 config.paths.cgroup_root,
                                 config.paths.mounts_file});

    ProcessEnumeratorOptions enum_options;
    enum_options.proc_root = config.paths.proc_root;
    enum_options.proc_max = config.collector.proc_max;
    ProcessEnumerator enumerator(enum_options, pool);

    SnapshotAssembler assembler(config.paths.passwd_file);

    auto allowed = build_uid_allow_list(config.collector.proc_mode,
                                        config.collector.proc_uids,
                                        static_cast<Uid>(::getuid()));
    logger.info("Cgroup " + std::string{to_string(probe.detect_cgroup_version())}
                + ", proc_max " + std::to_string(config.collector.proc_max)
                + ", uid filter " + (allowed.unrestricted() ? std::string{"all"}
                                                            : config.collector.proc_mode));

    CollectionCycle cycle(CycleComponents{probe, enumerator, assembler, archive,
                                          settings, dispatcher, logger},
                          allowed,
                          config.collector.storage_path);

    if (args.once) {
        auto report = cycle.run(now_ms());
        if (!report.snapshot) {
            std::cerr << "Collection failed: " << report.error.value_or("unknown error") << std::endl;
            return 1;
        }
        std::cout << dump_json(snapshot_to_json(*report.snapshot), 2) << std::endl;
        return report.outcome == CycleOutcome::Completed ? 0 : 1;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    CollectionLoop loop(cycle,
                        [&settings] {
                            return std::chrono::seconds(settings.collection_interval_seconds());
                        },
                        logger);
    if (auto started = loop.start(); !started) {
        logger.error("Failed to start collection loop: " + started.error().message);
        return 1;
    }
    logger.info("Entering main loop (interval "
                + std::to_string(config.collector.interval_seconds) + "s). Press Ctrl+C to shutdown.");

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    loop.stop();
    logger.info("ContainerPulse stopped.");
    logger.flush();
    return 0;
}
