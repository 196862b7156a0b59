/**
 * @file test_snapshot_codec.cpp
 * @brief Unit tests for the snapshot JSON shape.
 */

#include "telemetry/snapshot_codec.hpp"

#include <gtest/gtest.h>

using namespace container_pulse;

namespace {

MetricsSnapshot sample_snapshot() {
    MetricsSnapshot s;
    s.timestamp_ms = 1'700'000'000'123;
    s.limits = {.cpu_limit_cores = 1.5, .memory_limit_bytes = 536870912};
    s.usage = {.cpu_usage_percent = 42.25, .memory_usage_bytes = 268435456,
               .memory_usage_percent = 50.0, .storage_total_bytes = 1000,
               .storage_used_bytes = 250, .storage_usage_percent = 25.0};
    s.uid_names = {{"0", "root"}, {"1000", "app"}};

    ProcessSample known;
    known.pid = 7;
    known.ppid = 1;
    known.uid = 1000;
    known.command = "node server.js --port \"8080\"";
    known.cpu_percent = 3.5;
    known.memory_bytes = 4096;
    known.memory_percent = 0.001;

    ProcessSample fresh;
    fresh.pid = 8;
    fresh.command = "(unknown)";
    s.processes = {known, fresh};
    return s;
}

}  // namespace

TEST(SnapshotCodecTest, FieldNames) {
    auto doc = snapshot_to_json(sample_snapshot());

    EXPECT_EQ(doc["timestamp"], 1'700'000'000'123);
    EXPECT_DOUBLE_EQ(doc["cpu_limit"].get<double>(), 1.5);
    EXPECT_DOUBLE_EQ(doc["cpu_usage_percent"].get<double>(), 42.25);
    EXPECT_EQ(doc["memory_limit_bytes"], 536870912);
    EXPECT_EQ(doc["storage_used_bytes"], 250);
    EXPECT_EQ(doc["uid_name_map"]["1000"], "app");

    ASSERT_EQ(doc["processes"].size(), 2u);
    const auto& fresh = doc["processes"][1];
    EXPECT_TRUE(fresh["uid"].is_null());
    EXPECT_TRUE(fresh["cpu_usage_percent"].is_null());
    EXPECT_TRUE(fresh["memory_usage_percent"].is_null());
    EXPECT_EQ(fresh["memory_usage_bytes"], 0);
}

TEST(SnapshotCodecTest, DecodeRestoresNullOptionals) {
    const auto original = sample_snapshot();
    auto decoded = decode_snapshot(encode_snapshot(original));

    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(*decoded, original);
    EXPECT_FALSE(decoded->processes[1].cpu_percent.has_value());
    EXPECT_FALSE(decoded->processes[1].uid.has_value());
}

TEST(SnapshotCodecTest, InvalidJson) {
    auto decoded = decode_snapshot("{ not json");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_NE(decoded.error().message.find("not valid JSON"), std::string::npos);
}

TEST(SnapshotCodecTest, MissingFieldIsAnError) {
    auto decoded = decode_snapshot(R"({"timestamp": 1})");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_NE(decoded.error().message.find("malformed snapshot"), std::string::npos);
}

TEST(SnapshotCodecTest, NonObjectIsAnError) {
    EXPECT_FALSE(decode_snapshot("[1, 2, 3]").has_value());
}
