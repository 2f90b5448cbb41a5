/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation using POSIX sockets and poll().
 */

#include "network/udp_socket.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hvac_exporter {

namespace {

constexpr auto POLL_SLICE = std::chrono::milliseconds(100);

ProtocolError socket_error(const std::string& what) {
    return ProtocolError{ProtocolError::Kind::SocketError,
                         what + ": " + std::string(std::strerror(errno))};
}

/**
 * @brief Resolve an endpoint to an IPv4 socket address.
 *
 * Dotted quads are parsed directly; anything else goes through getaddrinfo.
 */
Result<sockaddr_in, ProtocolError> resolve(const Endpoint& endpoint) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);

    if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* found = nullptr;
    int rc = ::getaddrinfo(endpoint.host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || found == nullptr) {
        return ProtocolError{ProtocolError::Kind::SocketError,
                             "Cannot resolve " + endpoint.host + ": " + ::gai_strerror(rc)};
    }

    addr.sin_addr = reinterpret_cast<const sockaddr_in*>(found->ai_addr)->sin_addr;
    ::freeaddrinfo(found);
    return addr;
}

}  // anonymous namespace

Result<std::string, ProtocolError> resolve_ipv4(const std::string& host) {
    auto addr = resolve(Endpoint{.host = host, .port = 0});
    if (!addr) return addr.error();

    char ip_buf[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &addr->sin_addr, ip_buf, sizeof(ip_buf));
    return std::string(ip_buf);
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void, ProtocolError> UdpSocket::open(const Endpoint& bind_to, bool enable_broadcast) {
    close();

    auto addr = resolve(bind_to);
    if (!addr) return addr.error();

    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        return socket_error("Failed to create UDP socket");
    }

    if (enable_broadcast) {
        int optval = 1;
        if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) < 0) {
            auto err = socket_error("Failed to enable SO_BROADCAST");
            close();
            return err;
        }
    }

    if (::bind(fd_, reinterpret_cast<const sockaddr*>(&*addr), sizeof(sockaddr_in)) < 0) {
        auto err = socket_error("Bind to " + bind_to.to_string() + " failed");
        close();
        return err;
    }

    return Result<void, ProtocolError>{};
}

void UdpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool UdpSocket::is_open() const noexcept {
    return fd_ >= 0;
}

uint16_t UdpSocket::local_port() const {
    if (fd_ < 0) return 0;

    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

// ─────────────────────────────────────────────
// I/O
// ─────────────────────────────────────────────

Result<void, ProtocolError> UdpSocket::send_to(const Endpoint& destination,
                                               std::string_view payload) {
    if (fd_ < 0) {
        return ProtocolError{ProtocolError::Kind::SocketError, "Socket is not open"};
    }

    auto addr = resolve(destination);
    if (!addr) return addr.error();

    auto sent = ::sendto(fd_, payload.data(), payload.size(), 0,
                         reinterpret_cast<const sockaddr*>(&*addr), sizeof(sockaddr_in));
    if (sent < 0) {
        return socket_error("Send to " + destination.to_string() + " failed");
    }
    if (static_cast<size_t>(sent) != payload.size()) {
        return ProtocolError{ProtocolError::Kind::SocketError,
                             "Short send to " + destination.to_string()};
    }
    return Result<void, ProtocolError>{};
}

Result<Datagram, ProtocolError> UdpSocket::receive(SteadyTime deadline, std::stop_token stop) {
    if (fd_ < 0) {
        return ProtocolError{ProtocolError::Kind::SocketError, "Socket is not open"};
    }

    char buf[MAX_DATAGRAM_SIZE];

    while (true) {
        if (stop.stop_requested()) {
            return ProtocolError{ProtocolError::Kind::TimedOut, "Cancelled"};
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return ProtocolError{ProtocolError::Kind::TimedOut, "No reply before deadline"};
        }

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        auto slice = std::min<std::chrono::milliseconds>(remaining, POLL_SLICE);

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(slice.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return socket_error("poll failed");
        }
        if (ready == 0) continue;

        sockaddr_in sender{};
        socklen_t addr_len = sizeof(sender);
        auto bytes_read = ::recvfrom(fd_, buf, sizeof(buf), 0,
                                     reinterpret_cast<sockaddr*>(&sender), &addr_len);
        if (bytes_read < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            // ICMP port unreachable from an earlier send surfaces here on Linux
            if (errno == ECONNREFUSED) continue;
            return socket_error("recvfrom failed");
        }

        char ip_buf[INET_ADDRSTRLEN];
        ::inet_ntop(AF_INET, &sender.sin_addr, ip_buf, sizeof(ip_buf));

        return Datagram{
            .payload = std::string(buf, static_cast<size_t>(bytes_read)),
            .sender_address = ip_buf,
            .sender_port = ntohs(sender.sin_port)
        };
    }
}

size_t UdpSocket::drain() {
    if (fd_ < 0) return 0;

    char buf[MAX_DATAGRAM_SIZE];
    size_t dropped = 0;
    while (true) {
        auto n = ::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == ECONNREFUSED) continue;
            break;
        }
        ++dropped;
    }
    return dropped;
}

// ─────────────────────────────────────────────
// Interface enumeration
// ─────────────────────────────────────────────

std::vector<Endpoint> broadcast_endpoints(uint16_t port) {
    std::vector<Endpoint> endpoints;

    ifaddrs* interfaces = nullptr;
    if (::getifaddrs(&interfaces) < 0) return endpoints;

    for (auto* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if ((ifa->ifa_flags & IFF_BROADCAST) == 0 || ifa->ifa_broadaddr == nullptr) continue;

        const auto* broadcast = reinterpret_cast<const sockaddr_in*>(ifa->ifa_broadaddr);
        char ip_buf[INET_ADDRSTRLEN];
        ::inet_ntop(AF_INET, &broadcast->sin_addr, ip_buf, sizeof(ip_buf));

        Endpoint endpoint{.host = ip_buf, .port = port};
        if (std::find(endpoints.begin(), endpoints.end(), endpoint) == endpoints.end()) {
            endpoints.push_back(std::move(endpoint));
        }
    }

    ::freeifaddrs(interfaces);
    return endpoints;
}

}  // namespace hvac_exporter
