/**
 * @file metric_server.cpp
 * @brief MetricServer implementation using poll() on a non-blocking listener.
 */

#include "telemetry/metric_server.hpp"
#include "telemetry/prometheus_renderer.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hvac_exporter {

namespace {

std::string_view status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
    }
    return "Unknown";
}

std::string serialize(const HttpResponse& response) {
    std::string out = "HTTP/1.1 " + std::to_string(response.status) + " "
        + std::string(status_text(response.status)) + "\r\n";
    out += "Content-Type: " + response.content_type + "\r\n";
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += response.body;
    return out;
}

/**
 * @brief Read until the end of the request head, the size cap, or timeout.
 */
std::string read_request_head(int fd) {
    std::string head;
    char buf[1024];

    while (head.size() < MetricServer::MAX_REQUEST_SIZE
           && head.find("\r\n\r\n") == std::string::npos) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, MetricServer::CLIENT_TIMEOUT_MS) <= 0) break;

        auto received = ::recv(fd, buf, sizeof(buf), 0);
        if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        if (received <= 0) break;
        head.append(buf, static_cast<size_t>(received));
    }
    return head;
}

bool send_all(int fd, std::string_view data) {
    while (!data.empty()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        if (::poll(&pfd, 1, MetricServer::CLIENT_TIMEOUT_MS) <= 0) return false;

        auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(sent));
    }
    return true;
}

}  // anonymous namespace

HttpResponse route_request(std::string_view request_head, const RenderFn& render) {
    auto line_end = request_head.find("\r\n");
    auto line = request_head.substr(0, line_end);

    auto method_end = line.find(' ');
    if (method_end != std::string_view::npos) {
        auto method = line.substr(0, method_end);
        auto rest = line.substr(method_end + 1);
        auto target = rest.substr(0, rest.find(' '));
        auto path = target.substr(0, target.find('?'));

        if (method == "GET" && path == "/metrics") {
            return HttpResponse{200, std::string(PROMETHEUS_CONTENT_TYPE), render()};
        }
    }
    return HttpResponse{404, "text/plain", "Not Found\n"};
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

MetricServer::MetricServer(Endpoint bind_to, RenderFn render, Logger& logger)
    : bind_to_(std::move(bind_to))
    , render_(std::move(render))
    , logger_(logger) {}

MetricServer::~MetricServer() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> MetricServer::start() {
    if (server_fd_ >= 0) {
        return Error{"Already listening"};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(bind_to_.port);
    if (::inet_pton(AF_INET, bind_to_.host.c_str(), &addr.sin_addr) != 1) {
        return Error{"Invalid metrics bind address: " + bind_to_.host};
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return Error{"Failed to create server socket: " + std::string(strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto message = "Bind " + bind_to_.to_string() + " failed: " + std::string(strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{message};
    }

    if (::listen(server_fd_, 16) < 0) {
        auto message = "Listen failed: " + std::string(strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{message};
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    serve_thread_ = std::jthread([this](std::stop_token stop) { serve_loop(stop); });
    logger_.info("Serving metrics on " + bind_to_.host + ":" + std::to_string(port_) + "/metrics");
    return Result<void>{};
}

void MetricServer::stop() {
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// Serving
// ─────────────────────────────────────────────

void MetricServer::serve_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, 100);  // 100ms timeout for stop check
        if (ready <= 0) continue;

        int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) continue;

        handle_connection(client_fd);

        ::shutdown(client_fd, SHUT_RDWR);
        ::close(client_fd);
    }
}

void MetricServer::handle_connection(int client_fd) {
    auto head = read_request_head(client_fd);
    if (head.empty()) return;

    HttpResponse response;
    try {
        response = route_request(head, render_);
    } catch (const std::exception& e) {
        logger_.error(std::string("Rendering metrics failed: ") + e.what());
        response = HttpResponse{500, "text/plain", "Internal Server Error\n"};
    }

    if (!send_all(client_fd, serialize(response))) {
        logger_.debug("Metrics client went away before the response was sent");
    }
}

}  // namespace hvac_exporter
