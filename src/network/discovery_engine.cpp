/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation using one broadcast-enabled UDP socket.
 *
 * Units answer to the source port of the request, so broadcasts and replies
 * share the socket: the broadcast thread only sends, the listen thread only
 * receives.
 */

#include "network/discovery_engine.hpp"

#include <chrono>

namespace hvac_exporter {

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

DiscoveryEngine::DiscoveryEngine(DiscoverySettings settings,
                                 HostTable& hosts,
                                 Logger& logger,
                                 ExporterStats& stats)
    : settings_(std::move(settings))
    , hosts_(hosts)
    , logger_(logger)
    , stats_(stats) {}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void, ProtocolError> DiscoveryEngine::start() {
    if (running_) return Result<void, ProtocolError>{};

    auto opened = socket_.open(settings_.bind_address, true);
    if (!opened) return opened.error();

    logger_.info("Listening for units on " + settings_.bind_address.host + ":"
                 + std::to_string(socket_.local_port()));

    running_ = true;
    listen_thread_ = std::jthread([this](std::stop_token stop) {
        listen_loop(stop);
    });
    broadcast_thread_ = std::jthread([this](std::stop_token stop) {
        broadcast_loop(stop);
    });
    return Result<void, ProtocolError>{};
}

void DiscoveryEngine::stop() {
    if (!running_.exchange(false)) return;

    broadcast_thread_.request_stop();
    listen_thread_.request_stop();
    sleep_cv_.notify_all();

    // Join before closing so neither thread touches a closed descriptor
    if (broadcast_thread_.joinable()) broadcast_thread_.join();
    if (listen_thread_.joinable()) listen_thread_.join();

    socket_.close();
}

void DiscoveryEngine::on_host_added(HostCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_added_.push_back(std::move(callback));
}

uint16_t DiscoveryEngine::local_port() const {
    return socket_.local_port();
}

uint64_t DiscoveryEngine::bursts_started() const noexcept {
    return bursts_.load();
}

bool DiscoveryEngine::running() const noexcept {
    return running_.load();
}

// ─────────────────────────────────────────────
// Broadcast Thread
// ─────────────────────────────────────────────

void DiscoveryEngine::broadcast_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto burst_start = std::chrono::steady_clock::now();
        ++bursts_;

        auto targets = current_targets();
        if (targets.empty()) {
            logger_.warn("No broadcast-capable interface, skipping discovery cycle");
        } else if (broadcast_all(targets)) {
            // Second request tolerates one lost packet in either direction
            if (sleep_until(burst_start + settings_.minor_interval, stop)) {
                broadcast_all(targets);
            }
        }

        sleep_until(burst_start + settings_.major_interval, stop);
    }
}

bool DiscoveryEngine::broadcast_all(const std::vector<Endpoint>& targets) {
    static const std::string request = encode_discovery_request();

    for (const auto& target : targets) {
        auto sent = socket_.send_to(target, request);
        if (!sent) {
            logger_.error("Discovery request to " + target.to_string() + " failed: "
                          + sent.error().message + "; retrying next cycle");
            return false;
        }
        ++stats_.discovery_requests;
        stats_.record_discovery_request(target.host);
        logger_.debug("Sent discovery request to " + target.to_string());
    }
    return true;
}

std::vector<Endpoint> DiscoveryEngine::current_targets() const {
    if (!settings_.targets.empty()) return settings_.targets;

    // Interfaces come and go (Wi-Fi, VPN), so look them up every cycle
    auto targets = broadcast_endpoints(settings_.unit_port);
    if (targets.empty()) {
        targets.push_back(Endpoint{.host = "255.255.255.255", .port = settings_.unit_port});
    }
    return targets;
}

bool DiscoveryEngine::sleep_until(SteadyTime deadline, std::stop_token stop) {
    std::unique_lock lock(sleep_mutex_);
    sleep_cv_.wait_until(lock, stop, deadline, [] { return false; });
    return !stop.stop_requested();
}

// ─────────────────────────────────────────────
// Listen Thread
// ─────────────────────────────────────────────

void DiscoveryEngine::listen_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        auto datagram = socket_.receive(deadline, stop);

        if (!datagram) {
            if (datagram.error().kind == ProtocolError::Kind::SocketError) {
                logger_.error("Discovery listen failed: " + datagram.error().message);
                sleep_until(std::chrono::steady_clock::now() + std::chrono::seconds(1), stop);
            }
            continue;
        }

        handle_datagram(*datagram);
    }
}

void DiscoveryEngine::handle_datagram(const Datagram& datagram) {
    ++stats_.discovery_responses;
    stats_.record_discovery_response(datagram.sender_address);

    auto reply = decode_discovery_reply(datagram.payload, datagram.sender_address);
    if (!reply) {
        ++stats_.discovery_malformed;
        logger_.debug("Dropped discovery reply from " + datagram.sender_address + ": "
                      + reply.error().message);
        return;
    }

    auto result = hosts_.upsert_discovered(*reply, std::chrono::system_clock::now());

    if (result.previous_endpoint) {
        logger_.info("Unit " + reply->unit_id + " moved from "
                     + result.previous_endpoint->to_string() + " to "
                     + reply->endpoint.to_string());
    }

    if (result.inserted) {
        logger_.info("Discovered unit " + reply->unit_id + " at " + reply->endpoint.to_string()
                     + (reply->name ? " (" + *reply->name + ")" : std::string{}));
        if (auto record = hosts_.get(result.key)) {
            notify_added(*record);
        }
    }
}

void DiscoveryEngine::notify_added(const HostRecord& host) {
    std::lock_guard lock(callback_mutex_);
    for (const auto& callback : on_added_) {
        callback(host);
    }
}

}  // namespace hvac_exporter
