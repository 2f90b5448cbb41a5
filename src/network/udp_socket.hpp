/**
 * @file udp_socket.hpp
 * @brief Non-blocking POSIX UDP socket with deadline-bounded receive.
 *
 * Shared by the discovery engine (broadcast + listen) and the query client
 * (unicast request/response). Receives poll in short slices so a stop
 * request is observed within 100 ms.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/codec.hpp"

#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace hvac_exporter {

struct Datagram {
    std::string payload;
    std::string sender_address;    ///< Dotted quad
    uint16_t sender_port{0};
};

class UdpSocket {
public:
    static constexpr size_t MAX_DATAGRAM_SIZE = 2048;

    UdpSocket() = default;
    ~UdpSocket();

    // Non-copyable, movable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    Result<void, ProtocolError> open(const Endpoint& bind_to, bool enable_broadcast);
    void close();

    Result<void, ProtocolError> send_to(const Endpoint& destination, std::string_view payload);

    /**
     * @brief Wait for one datagram until the deadline.
     *
     * Returns TimedOut when the deadline passes or a stop is requested.
     */
    Result<Datagram, ProtocolError> receive(SteadyTime deadline, std::stop_token stop = {});

    /// Discard every datagram already queued. Returns how many were dropped.
    size_t drain();

    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] uint16_t local_port() const;

private:
    int fd_ = -1;
};

/**
 * @brief Resolve a host name or dotted quad to a dotted quad.
 */
Result<std::string, ProtocolError> resolve_ipv4(const std::string& host);

/**
 * @brief IPv4 broadcast addresses of all local interfaces that have one.
 */
std::vector<Endpoint> broadcast_endpoints(uint16_t port);

}  // namespace hvac_exporter
