/**
 * @file query_client.hpp
 * @brief Single-exchange UDP query client for one adaptor.
 *
 * One call = one attempt: a request per configured query group, each answered
 * by exactly one datagram from the target address, all under one deadline.
 * Retrying is the caller's business; so is committing the result anywhere.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "network/udp_socket.hpp"
#include "protocol/codec.hpp"
#include "telemetry/exporter_stats.hpp"

#include <functional>
#include <memory>
#include <stop_token>
#include <vector>

namespace hvac_exporter {

/**
 * @brief Abstract query interface (runtime polymorphism).
 *
 * The refresh scheduler only sees this interface, which lets tests drive it
 * with scripted replies and artificial latency.
 */
class IQueryClient {
public:
    virtual ~IQueryClient() = default;

    virtual Result<QueryReply, ProtocolError> query(const Endpoint& endpoint,
                                                    Duration timeout,
                                                    std::stop_token stop) = 0;
};

using QueryClientFactory = std::function<std::unique_ptr<IQueryClient>()>;

/**
 * @brief IQueryClient over one UDP socket.
 *
 * With @p stats set, every group exchange is recorded under the target host
 * and the group's path: a request, its duration, and the error type
 * ("timeout", "malformed" or "socket") when it fails. Cancelled exchanges
 * are not recorded.
 */
class UdpQueryClient : public IQueryClient {
public:
    explicit UdpQueryClient(std::vector<QueryGroup> groups,
                            ExporterStats* stats = nullptr,
                            Endpoint bind_to = Endpoint{.host = "0.0.0.0", .port = 0});

    Result<QueryReply, ProtocolError> query(const Endpoint& endpoint,
                                            Duration timeout,
                                            std::stop_token stop) override;

    [[nodiscard]] const std::vector<QueryGroup>& groups() const noexcept { return groups_; }

private:
    Result<QueryReply, ProtocolError> exchange(const Endpoint& endpoint,
                                               const std::string& expected_sender,
                                               QueryGroup group,
                                               SteadyTime deadline,
                                               std::stop_token stop);

    std::vector<QueryGroup> groups_;
    ExporterStats* stats_;
    Endpoint bind_to_;
    UdpSocket socket_;
};

/**
 * @brief Factory producing one UdpQueryClient (and so one socket) per caller.
 */
QueryClientFactory udp_query_client_factory(std::vector<QueryGroup> groups,
                                            ExporterStats* stats = nullptr);

}  // namespace hvac_exporter
