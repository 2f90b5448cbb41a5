/**
 * @file test_metric_server.cpp
 * @brief Unit tests for the /metrics HTTP endpoint.
 */

#include "telemetry/metric_server.hpp"
#include "telemetry/json_sink.hpp"
#include "support/http_client.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

using namespace hvac_exporter;
using namespace hvac_exporter::testing;

// ═══════════════════════════════════════════════
// Routing
// ═══════════════════════════════════════════════

TEST(RouteRequestTest, MetricsPath) {
    auto response = route_request("GET /metrics HTTP/1.1\r\nHost: x\r\n\r\n",
                                  [] { return std::string("daikin_up 1\n"); });
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.content_type, "text/plain; version=0.0.4");
    EXPECT_EQ(response.body, "daikin_up 1\n");
}

TEST(RouteRequestTest, QueryStringIgnored) {
    auto response = route_request("GET /metrics?format=text HTTP/1.1\r\n\r\n",
                                  [] { return std::string("x"); });
    EXPECT_EQ(response.status, 200);
}

TEST(RouteRequestTest, OtherPathsAndMethodsAreNotFound) {
    auto render = [] { return std::string("x"); };
    EXPECT_EQ(route_request("GET / HTTP/1.1\r\n\r\n", render).status, 404);
    EXPECT_EQ(route_request("GET /metricsx HTTP/1.1\r\n\r\n", render).status, 404);
    EXPECT_EQ(route_request("POST /metrics HTTP/1.1\r\n\r\n", render).status, 404);
    EXPECT_EQ(route_request("garbage", render).status, 404);
}

// ═══════════════════════════════════════════════
// Server
// ═══════════════════════════════════════════════

class MetricServerTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug};
    std::atomic<int> renders_{0};
};

TEST_F(MetricServerTest, ServesMetrics) {
    MetricServer server(Endpoint{.host = "127.0.0.1", .port = 0}, [this] {
        ++renders_;
        return std::string("daikin_up{host=\"a\"} 1\n");
    }, logger_);
    ASSERT_TRUE(server.start().has_value());
    ASSERT_NE(server.port(), 0);

    auto response = http_get(server.port(), "/metrics");
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(response.find("Content-Type: text/plain; version=0.0.4\r\n"), std::string::npos);
    EXPECT_NE(response.find("\r\n\r\ndaikin_up{host=\"a\"} 1\n"), std::string::npos);

    // Rendered on demand, once per scrape
    http_get(server.port(), "/metrics");
    EXPECT_EQ(renders_.load(), 2);
    server.stop();
    EXPECT_FALSE(server.is_listening());
}

TEST_F(MetricServerTest, UnknownPathIs404) {
    MetricServer server(Endpoint{.host = "127.0.0.1", .port = 0},
                        [] { return std::string(); }, logger_);
    ASSERT_TRUE(server.start().has_value());

    auto response = http_get(server.port(), "/");
    EXPECT_EQ(response.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
}

TEST_F(MetricServerTest, RenderFailureIs500) {
    MetricServer server(Endpoint{.host = "127.0.0.1", .port = 0},
                        []() -> std::string { throw std::runtime_error("boom"); }, logger_);
    ASSERT_TRUE(server.start().has_value());

    auto response = http_get(server.port(), "/metrics");
    EXPECT_EQ(response.rfind("HTTP/1.1 500", 0), 0u);
}

TEST_F(MetricServerTest, InvalidBindAddressFails) {
    MetricServer server(Endpoint{.host = "not-an-ip", .port = 0},
                        [] { return std::string(); }, logger_);
    EXPECT_FALSE(server.start().has_value());
}
