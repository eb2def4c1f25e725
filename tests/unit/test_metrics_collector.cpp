/**
 * @file test_metrics_collector.cpp
 * @brief Unit tests for counter flattening and MetricsCollector
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <freeprobe/core/errors.hpp>
#include <freeprobe/core/metrics_collector.hpp>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

using namespace freeprobe::core;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockAuthenticatedApi : public AuthenticatedApi {
public:
    MOCK_METHOD(std::string, authenticatedGet, (const std::string& path), (override));
};

google::protobuf::Value parseValue(const std::string& json) {
    google::protobuf::Value value;
    EXPECT_TRUE(google::protobuf::util::JsonStringToMessage(json, &value).ok()) << json;
    return value;
}

std::vector<MetricSample> flatten(const std::string& json) {
    std::vector<MetricSample> out;
    flattenCounters("freebox_wan", parseValue(json), std::chrono::system_clock::now(), out);
    return out;
}

const MetricSample* findSample(const std::vector<MetricSample>& samples, const std::string& name) {
    for (const auto& sample : samples) {
        if (sample.name == name) {
            return &sample;
        }
    }
    return nullptr;
}

}  // namespace

TEST(FlattenCountersTest, NumbersKeepTheirValue) {
    auto samples = flatten(R"({"rate_down": 12345, "rate_up": 678.5})");
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0].name, "freebox_wan_rate_down");
    EXPECT_DOUBLE_EQ(samples[0].value, 12345);
    EXPECT_EQ(samples[1].name, "freebox_wan_rate_up");
    EXPECT_DOUBLE_EQ(samples[1].value, 678.5);
}

TEST(FlattenCountersTest, KeysAreVisitedInSortedOrder) {
    auto samples = flatten(R"({"zeta": 1, "alpha": 2, "mid": 3})");
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(samples[0].name, "freebox_wan_alpha");
    EXPECT_EQ(samples[1].name, "freebox_wan_mid");
    EXPECT_EQ(samples[2].name, "freebox_wan_zeta");
}

TEST(FlattenCountersTest, BooleansBecomeZeroOrOne) {
    auto samples = flatten(R"({"ipv6_enabled": true, "bandwidth_limited": false})");
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_DOUBLE_EQ(findSample(samples, "freebox_wan_ipv6_enabled")->value, 1.0);
    EXPECT_DOUBLE_EQ(findSample(samples, "freebox_wan_bandwidth_limited")->value, 0.0);
}

TEST(FlattenCountersTest, StringsAndNullsAreSkipped) {
    auto samples = flatten(R"({"state": "up", "ipv4": "1.2.3.4", "media": null, "bytes_up": 9})");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].name, "freebox_wan_bytes_up");
}

TEST(FlattenCountersTest, NestedObjectsJoinWithUnderscore) {
    auto samples = flatten(R"({"down": {"attn": 12, "snr": 6}, "up": {"attn": 3}})");
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_NE(findSample(samples, "freebox_wan_down_attn"), nullptr);
    EXPECT_NE(findSample(samples, "freebox_wan_down_snr"), nullptr);
    EXPECT_NE(findSample(samples, "freebox_wan_up_attn"), nullptr);
}

TEST(FlattenCountersTest, KeysAreSanitized) {
    auto samples = flatten(R"({"temp-cpu.m": 51})");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].name, "freebox_wan_temp_cpu_m");
}

TEST(FlattenCountersTest, ArraysOfSensorsAreLabelled) {
    auto samples = flatten(R"({"sensors": [
        {"id": "temp_cpum", "name": "Température CPU M", "value": 57},
        {"id": "temp_sw", "name": "Température Switch", "value": 48},
        {"id": "no_value", "name": "Ignored"},
        "not an object"
    ]})");
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0].name, "freebox_wan_sensors");
    EXPECT_EQ(samples[0].labels.at("id"), "temp_cpum");
    EXPECT_EQ(samples[0].labels.at("name"), "Température CPU M");
    EXPECT_DOUBLE_EQ(samples[0].value, 57);
    EXPECT_EQ(samples[1].labels.at("id"), "temp_sw");
}

TEST(FlattenCountersTest, NumericIdLabelHasNoFraction) {
    auto samples = flatten(R"({"fans": [{"id": 3, "value": 1200}]})");
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].labels.at("id"), "3");
    EXPECT_EQ(samples[0].labels.count("name"), 0u);
}

TEST(FlattenCountersTest, UnlabelledElementsGetTheirIndex) {
    std::vector<MetricSample> samples;
    flattenCounters("freebox_switch", parseValue(R"({"ports": [{"value": 1}, "skipped", {"value": 2}]})"),
                    std::chrono::system_clock::now(), samples);

    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0].name, "freebox_switch_ports");
    EXPECT_EQ(samples[0].labels, (LabelSet{{"index", "0"}}));
    EXPECT_EQ(samples[1].labels, (LabelSet{{"index", "2"}}));
    EXPECT_NE(samples[0].labels, samples[1].labels);
}

TEST(SanitizeMetricNameTest, ReplacesInvalidCharacters) {
    EXPECT_EQ(sanitizeMetricName("rate_down"), "rate_down");
    EXPECT_EQ(sanitizeMetricName("a b-c.d"), "a_b_c_d");
    EXPECT_EQ(sanitizeMetricName("\xC3\xA9t\xC3\xA9"), "__t__");
}

class MetricsCollectorTest : public ::testing::Test {
protected:
    std::vector<Endpoint> endpoints_ = {
        {"/connection/", "wan"},
        {"/system/", "system"},
        {"/connection/xdsl/", "xdsl"},
    };
    MockAuthenticatedApi api_;
};

TEST_F(MetricsCollectorTest, DefaultEndpoints) {
    auto endpoints = defaultEndpoints();
    ASSERT_EQ(endpoints.size(), 4u);
    EXPECT_EQ(endpoints[0].path, "/connection/");
    EXPECT_EQ(endpoints[0].category, "wan");
    MetricsCollector collector;
    EXPECT_EQ(collector.prefix(), "freebox_");
}

TEST_F(MetricsCollectorTest, MalformedEndpointIsSkipped) {
    EXPECT_CALL(api_, authenticatedGet("/connection/"))
        .WillOnce(Return(R"({"success":true,"result":{"rate_down":12345}})"));
    EXPECT_CALL(api_, authenticatedGet("/system/"))
        .WillOnce(Return(R"({"success":true,"result":{"uptime_val":3600}})"));
    EXPECT_CALL(api_, authenticatedGet("/connection/xdsl/"))
        .WillOnce(Return("<html>gateway error</html>"));

    MetricsCollector collector(endpoints_);
    CollectResult result = collector.collect(api_);

    ASSERT_EQ(result.samples.size(), 2u);
    EXPECT_EQ(result.samples[0].name, "freebox_wan_rate_down");
    EXPECT_DOUBLE_EQ(result.samples[0].value, 12345);
    EXPECT_EQ(result.samples[1].name, "freebox_system_uptime_val");
    EXPECT_EQ(result.partialFailures, 1);
    ASSERT_EQ(result.failedEndpoints.size(), 1u);
    EXPECT_EQ(result.failedEndpoints[0], "/connection/xdsl/");
}

TEST_F(MetricsCollectorTest, EndpointErrorIsCounted) {
    EXPECT_CALL(api_, authenticatedGet("/connection/"))
        .WillOnce(Throw(CollectError("/connection/: timeout")));
    EXPECT_CALL(api_, authenticatedGet("/system/"))
        .WillOnce(Return(R"({"success":true,"result":{"uptime_val":3600}})"));
    EXPECT_CALL(api_, authenticatedGet("/connection/xdsl/"))
        .WillOnce(Return(R"({"success":false,"error_code":"nodev"})"));

    MetricsCollector collector(endpoints_);
    CollectResult result = collector.collect(api_);

    EXPECT_EQ(result.samples.size(), 1u);
    EXPECT_EQ(result.partialFailures, 2);
}

TEST_F(MetricsCollectorTest, AuthErrorStopsCollection) {
    EXPECT_CALL(api_, authenticatedGet("/connection/"))
        .WillOnce(Throw(AuthError("Session rejected", "invalid_session")));
    EXPECT_CALL(api_, authenticatedGet("/system/")).Times(0);
    EXPECT_CALL(api_, authenticatedGet("/connection/xdsl/")).Times(0);

    MetricsCollector collector(endpoints_);
    EXPECT_THROW(collector.collect(api_), AuthError);
}

TEST_F(MetricsCollectorTest, CustomPrefix) {
    EXPECT_CALL(api_, authenticatedGet("/connection/"))
        .WillOnce(Return(R"({"success":true,"result":{"rate_up":1}})"));

    MetricsCollector collector({{"/connection/", "wan"}}, "fbx_");
    CollectResult result = collector.collect(api_);
    ASSERT_EQ(result.samples.size(), 1u);
    EXPECT_EQ(result.samples[0].name, "fbx_wan_rate_up");
}
