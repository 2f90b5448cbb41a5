/**
 * @file test_prometheus_renderer.cpp
 * @brief Unit tests for the Prometheus text rendering.
 */

#include "telemetry/prometheus_renderer.hpp"

#include "protocol/codec.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace hvac_exporter;
using namespace std::chrono_literals;

namespace {

const Timestamp T0 = Timestamp{} + std::chrono::hours(1000);

HostRecord make_host(const std::string& key, Liveness liveness) {
    HostRecord host;
    host.key = key;
    host.unit_id = "A0B1";
    host.name = "Living";
    host.endpoint = Endpoint{.host = "10.0.0.5"};
    host.liveness = liveness;
    return host;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}  // namespace

TEST(PrometheusRendererTest, HostWithoutSnapshotOnlyHasLiveness) {
    auto host = make_host("10.0.0.5", Liveness::Unreachable);
    host.unit_id.reset();
    host.name.reset();
    host.consecutive_failures = 4;
    ExporterStats stats;

    auto text = render_prometheus({host}, {}, stats, T0);

    EXPECT_TRUE(contains(text, "# TYPE daikin_up gauge\n"));
    EXPECT_TRUE(contains(text, "daikin_up{host=\"10.0.0.5\",unit=\"\",name=\"\"} 0\n"));
    EXPECT_TRUE(contains(text, "daikin_consecutive_failures{host=\"10.0.0.5\",unit=\"\",name=\"\"} 4\n"));
    EXPECT_FALSE(contains(text, "daikin_snapshot_stale{"));
}

TEST(PrometheusRendererTest, SnapshotMetrics) {
    auto host = make_host("A0B1", Liveness::Responding);

    MetricSnapshot snapshot;
    snapshot.captured_at = T0 - 2500ms;
    snapshot.metrics["unit_temp"] = 21.5;
    snapshot.metrics["power"] = std::string("on");
    snapshot.metrics["fan_rate"] = std::string("auto");

    ExporterStats stats;
    auto text = render_prometheus({host}, {CacheEntry{.host = host, .snapshot = snapshot}}, stats, T0);

    const std::string labels = "{host=\"A0B1\",unit=\"A0B1\",name=\"Living\"}";
    EXPECT_TRUE(contains(text, "daikin_up" + labels + " 1\n"));
    EXPECT_TRUE(contains(text, "daikin_unit_temp" + labels + " 21.5\n"));
    EXPECT_TRUE(contains(text, "daikin_snapshot_stale" + labels + " 0\n"));
    EXPECT_TRUE(contains(text, "daikin_snapshot_age_seconds" + labels + " 2.5\n"));
    EXPECT_TRUE(contains(text,
        "daikin_power_info{host=\"A0B1\",unit=\"A0B1\",name=\"Living\",value=\"on\"} 1\n"));
    EXPECT_TRUE(contains(text, "# TYPE daikin_fan_rate_info gauge\n"));
}

TEST(PrometheusRendererTest, StaleFlagRendered) {
    auto host = make_host("A0B1", Liveness::Unreachable);
    MetricSnapshot snapshot;
    snapshot.captured_at = T0 - 60s;
    snapshot.stale = true;
    snapshot.metrics["unit_temp"] = 21.5;

    ExporterStats stats;
    auto text = render_prometheus({host}, {CacheEntry{.host = host, .snapshot = snapshot}}, stats, T0);

    EXPECT_TRUE(contains(text, "daikin_snapshot_stale{host=\"A0B1\",unit=\"A0B1\",name=\"Living\"} 1\n"));
    EXPECT_TRUE(contains(text, "daikin_up{host=\"A0B1\",unit=\"A0B1\",name=\"Living\"} 0\n"));
    EXPECT_TRUE(contains(text, "daikin_unit_temp{host=\"A0B1\",unit=\"A0B1\",name=\"Living\"} 21.5\n"));
}

TEST(PrometheusRendererTest, StatsAreCounters) {
    ExporterStats stats;
    stats.query_requests = 12;
    stats.query_timeouts = 3;

    auto text = render_prometheus({}, {}, stats, T0);
    EXPECT_TRUE(contains(text, "# TYPE daikin_query_requests_total counter\n"));
    EXPECT_TRUE(contains(text, "daikin_query_requests_total 12\n"));
    EXPECT_TRUE(contains(text, "daikin_query_timeouts_total 3\n"));
    EXPECT_TRUE(contains(text, "daikin_discovery_requests_total 0\n"));
}

TEST(PrometheusRendererTest, LabeledRequestSeries) {
    ExporterStats stats;
    stats.record_request("10.0.0.5", "/aircon/get_sensor_info");
    stats.record_request("10.0.0.5", "/aircon/get_sensor_info");
    stats.observe_request_duration("10.0.0.5", "/aircon/get_sensor_info", 250ms);
    stats.observe_request_duration("10.0.0.5", "/aircon/get_sensor_info", 500ms);
    stats.record_request_error("10.0.0.5", "/aircon/get_sensor_info", "timeout");
    stats.record_discovery_request("192.168.1.255");
    stats.record_discovery_response("192.168.1.20");

    auto text = render_prometheus({}, {}, stats, T0);

    const std::string labels = "host=\"10.0.0.5\",path=\"/aircon/get_sensor_info\"";
    EXPECT_TRUE(contains(text, "# TYPE daikin_udp_requests_total counter\n"));
    EXPECT_TRUE(contains(text, "daikin_udp_requests_total{" + labels + "} 2\n"));
    EXPECT_TRUE(contains(text,
        "daikin_udp_request_errors_total{" + labels + ",error_type=\"timeout\"} 1\n"));

    EXPECT_TRUE(contains(text, "# TYPE daikin_udp_request_duration_seconds histogram\n"));
    EXPECT_TRUE(contains(text,
        "daikin_udp_request_duration_seconds_bucket{" + labels + ",le=\"0.1\"} 0\n"));
    EXPECT_TRUE(contains(text,
        "daikin_udp_request_duration_seconds_bucket{" + labels + ",le=\"0.25\"} 1\n"));
    EXPECT_TRUE(contains(text,
        "daikin_udp_request_duration_seconds_bucket{" + labels + ",le=\"0.5\"} 2\n"));
    EXPECT_TRUE(contains(text,
        "daikin_udp_request_duration_seconds_bucket{" + labels + ",le=\"+Inf\"} 2\n"));
    EXPECT_TRUE(contains(text, "daikin_udp_request_duration_seconds_sum{" + labels + "} 0.75\n"));
    EXPECT_TRUE(contains(text, "daikin_udp_request_duration_seconds_count{" + labels + "} 2\n"));

    EXPECT_TRUE(contains(text,
        "daikin_udp_discover_requests_total{address=\"192.168.1.255\"} 1\n"));
    EXPECT_TRUE(contains(text,
        "daikin_udp_discover_responses_total{host=\"192.168.1.20\"} 1\n"));
}

TEST(PrometheusRendererTest, NoLabeledSeriesBeforeTraffic) {
    ExporterStats stats;
    auto text = render_prometheus({}, {}, stats, T0);
    EXPECT_FALSE(contains(text, "daikin_udp_requests_total"));
    EXPECT_FALSE(contains(text, "daikin_udp_request_duration_seconds"));
}

TEST(PrometheusRendererTest, FamilyHeaderAppearsOnce) {
    ExporterStats stats;
    auto text = render_prometheus({make_host("a", Liveness::Responding),
                                   make_host("b", Liveness::Responding)}, {}, stats, T0);

    auto first = text.find("# TYPE daikin_up gauge");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(text.find("# TYPE daikin_up gauge", first + 1), std::string::npos);
}

TEST(PrometheusRendererTest, EscapingAndSanitizing) {
    EXPECT_EQ(escape_label_value("Tom's \"den\"\\\n"), "Tom's \\\"den\\\"\\\\\\n");
    EXPECT_EQ(sanitize_metric_name("monitor-fan.speed"), "monitor_fan_speed");
    EXPECT_EQ(sanitize_metric_name("ok_name1"), "ok_name1");
}

TEST(PrometheusRendererTest, BytesThatAreNotUtf8AreReplaced) {
    EXPECT_EQ(escape_label_value("ok\xff\xfe"), "ok\xef\xbf\xbd\xef\xbf\xbd");
    EXPECT_EQ(escape_label_value("caf\xc3\xa9"), "caf\xc3\xa9");

    auto host = make_host("10.0.0.5", Liveness::Responding);
    host.name = std::string("\xff\xfeLiving");

    MetricSnapshot snapshot;
    snapshot.captured_at = T0;
    snapshot.metrics["model"] = std::string("\xc3(");

    ExporterStats stats;
    auto text = render_prometheus({host}, {CacheEntry{.host = host, .snapshot = snapshot}},
                                  stats, T0);

    EXPECT_TRUE(is_valid_utf8(text));
    EXPECT_TRUE(contains(text, "name=\"\xef\xbf\xbd\xef\xbf\xbdLiving\""));
    EXPECT_TRUE(contains(text, "value=\"\xef\xbf\xbd(\"} 1\n"));
}
