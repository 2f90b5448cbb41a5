/**
 * @file discovery_engine.hpp
 * @brief UDP broadcast discovery of adaptors on the local subnets.
 *
 * Every major interval a burst of two discovery broadcasts, spaced by the
 * minor interval, goes out to each target; the listener thread runs the
 * whole time and upserts every decoded reply into the HostTable. The first
 * burst is sent as soon as the engine starts.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/host_table.hpp"
#include "network/udp_socket.hpp"
#include "protocol/codec.hpp"
#include "telemetry/exporter_stats.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace hvac_exporter {

using HostCallback = std::function<void(const HostRecord&)>;

struct DiscoverySettings {
    Endpoint bind_address{.host = "0.0.0.0", .port = 0};
    Duration major_interval{300000};
    Duration minor_interval{200};
    uint16_t unit_port = UNIT_PORT;
    std::vector<Endpoint> targets;      ///< Empty = every interface broadcast address
};

class DiscoveryEngine {
public:
    DiscoveryEngine(DiscoverySettings settings,
                    HostTable& hosts,
                    Logger& logger,
                    ExporterStats& stats);
    ~DiscoveryEngine();

    // Non-copyable
    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /// Bind the discovery socket and launch the broadcast and listen threads.
    Result<void, ProtocolError> start();
    void stop();

    /// Called from the listen thread for every newly inserted host.
    void on_host_added(HostCallback callback);

    [[nodiscard]] uint16_t local_port() const;
    [[nodiscard]] uint64_t bursts_started() const noexcept;
    [[nodiscard]] bool running() const noexcept;

private:
    void broadcast_loop(std::stop_token stop);
    void listen_loop(std::stop_token stop);

    bool broadcast_all(const std::vector<Endpoint>& targets);
    std::vector<Endpoint> current_targets() const;
    bool sleep_until(SteadyTime deadline, std::stop_token stop);

    void handle_datagram(const Datagram& datagram);
    void notify_added(const HostRecord& host);

    DiscoverySettings settings_;
    HostTable& hosts_;
    Logger& logger_;
    ExporterStats& stats_;

    UdpSocket socket_;

    std::jthread broadcast_thread_;
    std::jthread listen_thread_;

    std::mutex sleep_mutex_;
    std::condition_variable_any sleep_cv_;

    std::atomic<uint64_t> bursts_{0};
    std::atomic<bool> running_{false};

    std::mutex callback_mutex_;
    std::vector<HostCallback> on_added_;
};

}  // namespace hvac_exporter
