/**
 * @file webhook_dispatcher.cpp
 * @brief WebhookDispatcher implementation.
 */

#include "alerting/webhook_dispatcher.hpp"

#include "alerting/body_template.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <random>

namespace container_pulse {

namespace {

bool has_header(const std::map<std::string, std::string>& headers, std::string_view name) {
    return std::any_of(headers.begin(), headers.end(), [name](const auto& item) {
        const auto& key = item.first;
        return key.size() == name.size() &&
               std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
    });
}

}  // anonymous namespace

HttpRequest build_webhook_request(const WebhookConfig& config, const AlertEvent& event) {
    HttpRequest request;
    request.method = config.method;
    request.url = config.url;
    request.headers = config.headers;

    auto body = render_body_template(config.body_template, event);
    if (!body.empty() && allows_body(config.method)) {
        if (!has_header(request.headers, "Content-Type")) {
            request.headers["Content-Type"] = "application/json";
        }
        request.body = std::move(body);
    }
    return request;
}

std::string make_history_id(TimestampMs timestamp_ms) {
    static constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, kAlphabet.size() - 1);

    std::string id = std::to_string(timestamp_ms) + "-";
    for (int i = 0; i < 9; ++i) {
        id += kAlphabet[pick(rng)];
    }
    return id;
}

// ── WebhookDispatcher ────────────────────────

WebhookDispatcher::WebhookDispatcher(IHttpClient& http,
                                     IHistorySink& history,
                                     ThreadPool& pool,
                                     Logger& logger)
    : http_(http), history_(history), pool_(pool), logger_(logger) {}

std::vector<WebhookHistoryEntry> WebhookDispatcher::notify(
    const AlertEvent& event,
    const std::vector<WebhookConfig>& configs) {

    std::vector<const WebhookConfig*> targets;
    for (const auto& config : configs) {
        if (config.enabled) targets.push_back(&config);
    }
    if (targets.empty()) return {};

    const auto reason = event.reason();
    std::vector<std::future<WebhookHistoryEntry>> futures;
    futures.reserve(targets.size());
    for (const auto* config : targets) {
        futures.push_back(pool_.submit([this, config, &event, &reason] {
            return execute(*config, event, make_history_id(now_ms()), reason);
        }));
    }

    std::vector<WebhookHistoryEntry> entries;
    auto outcomes = join_all(futures);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i]) {
            entries.push_back(std::move(*outcomes[i]));
        } else {
            logger_.error("webhook '" + targets[i]->name + "' task failed: " +
                          outcomes[i].error().message);
        }
    }
    return entries;
}

WebhookHistoryEntry WebhookDispatcher::test(const WebhookConfig& config,
                                            const ThresholdConfig& thresholds) {
    const auto now = now_ms();
    AlertEvent event{now, Resource::Cpu, 0.0, thresholds.cpu_percent};
    return execute(config, event, "test-" + std::to_string(now), kManualTestReason);
}

WebhookHistoryEntry WebhookDispatcher::execute(const WebhookConfig& config,
                                               const AlertEvent& event,
                                               std::string id,
                                               std::string reason) {
    const auto request = build_webhook_request(config, event);

    const auto start = std::chrono::steady_clock::now();
    auto response = http_.send(request);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    WebhookHistoryEntry entry;
    entry.id = std::move(id);
    entry.timestamp_ms = now_ms();
    entry.webhook_name = config.name;
    entry.webhook_url = config.url;
    entry.method = std::string{to_string(config.method)};
    entry.reason = std::move(reason);
    entry.response_time_ms = elapsed.count();

    if (response) {
        entry.status_code = response->status_code;
        entry.success = true;
        if (response->status_code >= 400) {
            logger_.warn("webhook '" + config.name + "' returned status " +
                         std::to_string(response->status_code));
        }
    } else {
        entry.success = false;
        entry.error = response.error().message;
        logger_.warn("webhook '" + config.name + "' failed: " + response.error().message);
    }

    if (auto recorded = history_.append(entry); !recorded) {
        logger_.error("failed to record webhook history: " + recorded.error().message);
    }
    return entry;
}

}  // namespace container_pulse
