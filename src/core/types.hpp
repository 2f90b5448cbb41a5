/**
 * @file types.hpp
 * @brief Fundamental types used throughout the HVAC exporter.
 *
 * Defines HostKey, Endpoint, HostRecord and the other shared vocabulary types.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hvac_exporter {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using HostKey = std::string;
using UnitId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// UDP port the adaptors listen on for both discovery and queries.
inline constexpr uint16_t UNIT_PORT = 30050;

// ─────────────────────────────────────────────
// Endpoint
// ─────────────────────────────────────────────

/**
 * @brief A UDP endpoint as configured or observed: host name or dotted quad
 *        plus port. Resolution happens at send time.
 */
struct Endpoint {
    std::string host;
    uint16_t port = UNIT_PORT;

    [[nodiscard]] std::string to_string() const {
        return host + ":" + std::to_string(port);
    }

    bool operator==(const Endpoint&) const = default;
};

// ─────────────────────────────────────────────
// Host State
// ─────────────────────────────────────────────

enum class HostOrigin : uint8_t {
    Static,       ///< Listed in the configuration file
    Discovered    ///< Answered a discovery broadcast
};

enum class Liveness : uint8_t {
    Responding,   ///< Last refresh succeeded
    Unreachable   ///< Last refresh failed, or never succeeded
};

[[nodiscard]] constexpr std::string_view to_string(HostOrigin origin) noexcept {
    switch (origin) {
        case HostOrigin::Static:     return "static";
        case HostOrigin::Discovered: return "discovered";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(Liveness liveness) noexcept {
    switch (liveness) {
        case Liveness::Responding:  return "responding";
        case Liveness::Unreachable: return "unreachable";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Query Groups
// ─────────────────────────────────────────────

/**
 * @brief Independently requestable subsets of unit information.
 */
enum class QueryGroup : uint8_t {
    Basic,       ///< Identity, name, power state
    Control,     ///< Mode, set points, fan settings
    Sensor,      ///< Measured temperatures, compressor demand
    WeekPower,   ///< Runtime counters
    Monitor      ///< Adaptor diagnostics (hex-encoded fields)
};

[[nodiscard]] constexpr std::string_view to_string(QueryGroup group) noexcept {
    switch (group) {
        case QueryGroup::Basic:     return "basic";
        case QueryGroup::Control:   return "control";
        case QueryGroup::Sensor:    return "sensor";
        case QueryGroup::WeekPower: return "week_power";
        case QueryGroup::Monitor:   return "monitor";
    }
    return "unknown";
}

/**
 * @brief Registry entry for one HVAC unit.
 *
 * `key` never changes once the record exists. The endpoint is a mutable
 * attribute: units on DHCP move, and the unit id is what identifies them.
 */
struct HostRecord {
    HostKey key;
    std::optional<UnitId> unit_id;        ///< MAC reported by the unit
    Endpoint endpoint;
    std::optional<std::string> name;      ///< Display name reported by the unit
    HostOrigin origin{HostOrigin::Static};
    Liveness liveness{Liveness::Unreachable};
    std::optional<Timestamp> last_seen;
    std::optional<Timestamp> last_attempt;
    uint32_t consecutive_failures{0};
};

}  // namespace hvac_exporter
