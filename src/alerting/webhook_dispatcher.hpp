/**
 * @file webhook_dispatcher.hpp
 * @brief Delivers alert events to the configured webhooks.
 *
 * Each enabled webhook is delivered as an independent task on the shared
 * ThreadPool; join_all() collects every outcome, so a hung or failing
 * endpoint never prevents the others from being attempted or recorded.
 * Every attempt, successful or not, produces one WebhookHistoryEntry.
 */

#pragma once

#include "alerting/http_client.hpp"
#include "alerting/threshold_evaluator.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "storage/history_sink.hpp"

#include <string>
#include <vector>

namespace container_pulse {

inline constexpr const char* kManualTestReason = "Manual test from admin panel";

/// Render the request a webhook sends for an event.
[[nodiscard]] HttpRequest build_webhook_request(const WebhookConfig& config,
                                                const AlertEvent& event);

/// "<timestamp>-<9 base36 chars>"
[[nodiscard]] std::string make_history_id(TimestampMs timestamp_ms);

class WebhookDispatcher {
public:
    WebhookDispatcher(IHttpClient& http, IHistorySink& history, ThreadPool& pool, Logger& logger);

    /**
     * @brief Send event to every enabled webhook and wait for all of them.
     *
     * Returns one entry per attempted webhook, in config order.
     */
    std::vector<WebhookHistoryEntry> notify(const AlertEvent& event,
                                            const std::vector<WebhookConfig>& configs);

    /**
     * @brief Manual test delivery.
     *
     * Uses a synthetic CPU event (value 0, threshold from thresholds) and
     * ignores both the enabled flag and any cooldown.
     */
    WebhookHistoryEntry test(const WebhookConfig& config, const ThresholdConfig& thresholds);

private:
    WebhookHistoryEntry execute(const WebhookConfig& config,
                                const AlertEvent& event,
                                std::string id,
                                std::string reason);

    IHttpClient& http_;
    IHistorySink& history_;
    ThreadPool& pool_;
    Logger& logger_;
};

}  // namespace container_pulse
