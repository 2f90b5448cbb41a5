/**
 * @file metric_server.hpp
 * @brief Minimal HTTP/1.1 endpoint serving GET /metrics.
 *
 * One accept thread polls the listening socket and handles each connection
 * inline: read the request head, render, write, close. Scrapes are rare and
 * rendering only reads the cache, so there is no per-connection threading.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <string_view>
#include <thread>

namespace hvac_exporter {

/// Produces the response body for one scrape.
using RenderFn = std::function<std::string()>;

struct HttpResponse {
    int status{200};
    std::string content_type;
    std::string body;
};

/**
 * @brief Route one raw request head. Only "GET /metrics" (with or without
 *        a query string) is served; everything else is 404.
 */
[[nodiscard]] HttpResponse route_request(std::string_view request_head, const RenderFn& render);

class MetricServer {
public:
    static constexpr size_t MAX_REQUEST_SIZE = 8192;
    static constexpr int CLIENT_TIMEOUT_MS = 2000;

    MetricServer(Endpoint bind_to, RenderFn render, Logger& logger);
    ~MetricServer();

    MetricServer(const MetricServer&) = delete;
    MetricServer& operator=(const MetricServer&) = delete;

    /// Bind, listen and start the accept thread.
    Result<void> start();
    void stop();

    /// Bound port; meaningful after start(), useful when binding port 0.
    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] bool is_listening() const noexcept { return server_fd_ >= 0; }

private:
    void serve_loop(std::stop_token stop);
    void handle_connection(int client_fd);

    Endpoint bind_to_;
    RenderFn render_;
    Logger& logger_;

    int server_fd_{-1};
    uint16_t port_{0};
    std::jthread serve_thread_;
};

}  // namespace hvac_exporter
