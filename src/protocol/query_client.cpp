/**
 * @file query_client.cpp
 * @brief UdpQueryClient implementation.
 */

#include "protocol/query_client.hpp"

#include <chrono>

namespace hvac_exporter {

namespace {

std::string_view error_type(ProtocolError::Kind kind) {
    switch (kind) {
        case ProtocolError::Kind::TimedOut:    return "timeout";
        case ProtocolError::Kind::Malformed:   return "malformed";
        case ProtocolError::Kind::SocketError: return "socket";
    }
    return "socket";
}

}  // anonymous namespace

UdpQueryClient::UdpQueryClient(std::vector<QueryGroup> groups, ExporterStats* stats,
                               Endpoint bind_to)
    : groups_(std::move(groups)), stats_(stats), bind_to_(std::move(bind_to)) {}

Result<QueryReply, ProtocolError> UdpQueryClient::query(const Endpoint& endpoint,
                                                        Duration timeout,
                                                        std::stop_token stop) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    if (!socket_.is_open()) {
        auto opened = socket_.open(bind_to_, false);
        if (!opened) return opened.error();
    }

    auto expected_sender = resolve_ipv4(endpoint.host);
    if (!expected_sender) return expected_sender.error();

    QueryReply merged;
    for (auto group : groups_) {
        auto reply = exchange(endpoint, *expected_sender, group, deadline, stop);
        if (!reply) {
            if (reply.error().kind == ProtocolError::Kind::SocketError) {
                socket_.close();
            }
            return reply.error();
        }
        for (auto& [key, value] : reply->fields) {
            merged.fields.insert_or_assign(key, std::move(value));
        }
    }
    return merged;
}

Result<QueryReply, ProtocolError> UdpQueryClient::exchange(const Endpoint& endpoint,
                                                           const std::string& expected_sender,
                                                           QueryGroup group,
                                                           SteadyTime deadline,
                                                           std::stop_token stop) {
    const auto path = query_path(group);
    const auto started = std::chrono::steady_clock::now();

    auto record = [&](const Result<QueryReply, ProtocolError>& outcome) {
        if (stats_ == nullptr || stop.stop_requested()) return;
        stats_->record_request(endpoint.host, path);
        stats_->observe_request_duration(endpoint.host, path,
                                         std::chrono::steady_clock::now() - started);
        if (!outcome) {
            stats_->record_request_error(endpoint.host, path, error_type(outcome.error().kind));
        }
    };

    // Late or duplicated replies to an earlier request must not answer this one
    socket_.drain();

    auto sent = socket_.send_to(endpoint, encode_query_request(group));
    if (!sent) {
        Result<QueryReply, ProtocolError> failed = sent.error();
        record(failed);
        return failed;
    }

    while (true) {
        auto datagram = socket_.receive(deadline, stop);
        if (!datagram) {
            auto error = datagram.error();
            if (error.kind == ProtocolError::Kind::TimedOut) {
                error.message = std::string(to_string(group)) + " query to "
                              + endpoint.to_string() + ": " + error.message;
            }
            Result<QueryReply, ProtocolError> failed = error;
            record(failed);
            return failed;
        }

        // Only the unit we asked may answer
        if (datagram->sender_address != expected_sender) continue;

        auto reply = decode_query_reply(datagram->payload);
        record(reply);
        return reply;
    }
}

QueryClientFactory udp_query_client_factory(std::vector<QueryGroup> groups,
                                            ExporterStats* stats) {
    return [groups = std::move(groups), stats]() -> std::unique_ptr<IQueryClient> {
        return std::make_unique<UdpQueryClient>(groups, stats);
    };
}

}  // namespace hvac_exporter
