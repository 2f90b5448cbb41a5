/**
 * @file metric_snapshot.hpp
 * @brief Last-known metric values of one unit.
 */

#pragma once

#include "core/types.hpp"
#include "protocol/codec.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hvac_exporter {

/// Numeric reading, or an enumerated/opaque string ("cool", "on", "-").
using MetricValue = std::variant<double, std::string>;

/**
 * @brief A point-in-time set of metrics for one unit.
 *
 * Immutable once published to the cache; a refresh replaces it wholesale.
 */
struct MetricSnapshot {
    std::map<std::string, MetricValue> metrics;
    Timestamp captured_at;
    bool stale{false};

    [[nodiscard]] std::optional<double> number(const std::string& name) const;
    [[nodiscard]] std::optional<std::string> text(const std::string& name) const;
};

/**
 * @brief Build a snapshot from a merged query reply.
 *
 * Known adaptor fields are renamed and normalized (pow=1 -> power="on",
 * htemp -> unit_temp, ...). Unknown fields pass through verbatim as text
 * under their wire name.
 */
MetricSnapshot snapshot_from_reply(const QueryReply& reply, Timestamp captured_at);

/// Parse a whole string as a finite double.
std::optional<double> parse_number(std::string_view text);

}  // namespace hvac_exporter
