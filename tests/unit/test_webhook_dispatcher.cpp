/**
 * @file test_webhook_dispatcher.cpp
 * @brief Unit tests for webhook request building and concurrent delivery.
 */

#include "alerting/webhook_dispatcher.hpp"

#include "support/fake_host.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace container_pulse;
using namespace container_pulse::test_support;

namespace {

WebhookConfig hook(std::string id, std::string url, bool enabled = true) {
    WebhookConfig config;
    config.id = id;
    config.name = "hook " + id;
    config.url = std::move(url);
    config.body_template = R"({"text":"{{message}}"})";
    config.enabled = enabled;
    return config;
}

AlertEvent memory_event() {
    return AlertEvent{1'700'000'000'000, Resource::Memory, 92.0, 90.0};
}

}  // namespace

class WebhookDispatcherTest : public ::testing::Test {
protected:
    std::shared_ptr<CapturingSink::Lines> lines_ = std::make_shared<CapturingSink::Lines>();
    Logger logger_{std::make_unique<CapturingSink>(lines_), LogLevel::Debug};
    ThreadPool pool_{4};
    RecordingHistorySink history_;
};

TEST_F(WebhookDispatcherTest, OnlyEnabledHooksAreCalled) {
    FakeHttpClient http;
    WebhookDispatcher dispatcher(http, history_, pool_, logger_);

    auto entries = dispatcher.notify(memory_event(), {hook("a", "http://a"),
                                                      hook("b", "http://b", false),
                                                      hook("c", "http://c")});

    EXPECT_EQ(http.calls(), 2);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].webhook_name, "hook a");
    EXPECT_EQ(entries[1].webhook_name, "hook c");
    EXPECT_EQ(history_.entries().size(), 2u);

    for (const auto& entry : entries) {
        EXPECT_TRUE(entry.success);
        EXPECT_EQ(entry.status_code.value_or(0), 200);
        EXPECT_EQ(entry.method, "POST");
        EXPECT_EQ(entry.reason, "MEMORY threshold exceeded: 92.0%");
        EXPECT_FALSE(entry.error.has_value());
        EXPECT_NE(entry.id.find('-'), std::string::npos);
    }
}

TEST_F(WebhookDispatcherTest, NoEnabledHooksSendsNothing) {
    FakeHttpClient http;
    WebhookDispatcher dispatcher(http, history_, pool_, logger_);

    EXPECT_TRUE(dispatcher.notify(memory_event(), {hook("a", "http://a", false)}).empty());
    EXPECT_TRUE(dispatcher.notify(memory_event(), {}).empty());
    EXPECT_EQ(http.calls(), 0);
    EXPECT_TRUE(history_.entries().empty());
}

TEST_F(WebhookDispatcherTest, TransportFailureDoesNotStopOthers) {
    FakeHttpClient http;
    http.fail_url("http://down");
    WebhookDispatcher dispatcher(http, history_, pool_, logger_);

    auto entries = dispatcher.notify(memory_event(), {hook("down", "http://down"),
                                                      hook("up", "http://up")});
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_FALSE(entries[0].success);
    EXPECT_FALSE(entries[0].status_code.has_value());
    EXPECT_EQ(entries[0].error.value_or(""), "Connection refused");

    EXPECT_TRUE(entries[1].success);
    EXPECT_EQ(history_.entries().size(), 2u);
    EXPECT_EQ(count_lines_containing(*lines_, "Connection refused"), 1u);
}

TEST_F(WebhookDispatcherTest, ServerErrorStillCountsAsDelivered) {
    FakeHttpClient http(500);
    WebhookDispatcher dispatcher(http, history_, pool_, logger_);

    auto entries = dispatcher.notify(memory_event(), {hook("a", "http://a")});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].success);
    EXPECT_EQ(entries[0].status_code.value_or(0), 500);
    EXPECT_EQ(count_lines_containing(*lines_, "returned status 500"), 1u);
}

TEST_F(WebhookDispatcherTest, ManualTestBypassesEnabledFlag) {
    FakeHttpClient http;
    WebhookDispatcher dispatcher(http, history_, pool_, logger_);

    ThresholdConfig thresholds;
    thresholds.cpu_percent = 75;
    auto entry = dispatcher.test(hook("a", "http://a", false), thresholds);

    EXPECT_TRUE(entry.id.starts_with("test-"));
    EXPECT_EQ(entry.reason, kManualTestReason);
    EXPECT_TRUE(entry.success);
    ASSERT_EQ(http.requests().size(), 1u);
    EXPECT_EQ(http.requests()[0].body.value_or(""),
              R"({"text":"CPU usage (0.0%) has exceeded the threshold of 75%"})");
    ASSERT_EQ(history_.entries().size(), 1u);
    EXPECT_EQ(history_.entries()[0].id, entry.id);
}

// ═══════════════════════════════════════════════
// Request building
// ═══════════════════════════════════════════════

TEST(BuildWebhookRequestTest, DefaultsContentTypeForJsonBody) {
    auto request = build_webhook_request(hook("a", "http://a"), memory_event());
    EXPECT_EQ(request.method, HttpMethod::Post);
    EXPECT_EQ(request.url, "http://a");
    EXPECT_EQ(request.headers.at("Content-Type"), "application/json");
    EXPECT_TRUE(request.body.has_value());
    EXPECT_EQ(request.timeout, kWebhookTimeout);
}

TEST(BuildWebhookRequestTest, ExistingContentTypeIsKept) {
    auto config = hook("a", "http://a");
    config.headers["content-type"] = "text/plain";
    config.headers["Authorization"] = "Bearer x";

    auto request = build_webhook_request(config, memory_event());
    EXPECT_EQ(request.headers.size(), 2u);
    EXPECT_EQ(request.headers.at("content-type"), "text/plain");
    EXPECT_EQ(request.headers.at("Authorization"), "Bearer x");
}

TEST(BuildWebhookRequestTest, GetCarriesNoBody) {
    auto config = hook("a", "http://a");
    config.method = HttpMethod::Get;

    auto request = build_webhook_request(config, memory_event());
    EXPECT_FALSE(request.body.has_value());
    EXPECT_FALSE(request.headers.contains("Content-Type"));
}

TEST(BuildWebhookRequestTest, EmptyTemplateSendsNoBody) {
    auto config = hook("a", "http://a");
    config.body_template.clear();

    auto request = build_webhook_request(config, memory_event());
    EXPECT_FALSE(request.body.has_value());
    EXPECT_TRUE(request.headers.empty());
}

TEST(MakeHistoryIdTest, Shape) {
    auto id = make_history_id(1234);
    ASSERT_EQ(id.size(), std::string{"1234-"}.size() + 9);
    EXPECT_TRUE(id.starts_with("1234-"));
    EXPECT_TRUE(std::all_of(id.begin() + 5, id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
    }));
    EXPECT_NE(make_history_id(1234), make_history_id(1234));
}
