/**
 * @file codec.hpp
 * @brief Encoder/decoder for the adaptor UDP protocol.
 *
 * Requests are ASCII "DAIKIN_UDP" followed by a resource path. Replies are
 * comma-delimited key=value pairs whose first pair must be "ret=OK". Unknown
 * keys are kept so new firmware fields surface without code changes.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace hvac_exporter {

// ─────────────────────────────────────────────
// Protocol errors
// ─────────────────────────────────────────────

/**
 * @brief Closed set of protocol outcomes other than success.
 */
struct ProtocolError {
    enum class Kind : uint8_t {
        Malformed,     ///< Payload failed the wire grammar or lacks mandatory fields
        TimedOut,      ///< No reply within the deadline
        SocketError    ///< Local network stack failure
    };

    Kind kind;
    std::string message;

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

[[nodiscard]] constexpr std::string_view to_string(ProtocolError::Kind kind) noexcept {
    switch (kind) {
        case ProtocolError::Kind::Malformed:   return "malformed";
        case ProtocolError::Kind::TimedOut:    return "timed_out";
        case ProtocolError::Kind::SocketError: return "socket_error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Decoded messages
// ─────────────────────────────────────────────

/// Reply fields in key order; "ret" is stripped after the magic check.
using FieldMap = std::map<std::string, std::string>;

struct DiscoveryReply {
    UnitId unit_id;                     ///< "mac" field
    Endpoint endpoint;                  ///< Datagram source address + "port" field
    std::optional<std::string> name;    ///< Percent-decoded "name" field
    FieldMap fields;
};

struct QueryReply {
    FieldMap fields;
};

// ─────────────────────────────────────────────
// Codec
// ─────────────────────────────────────────────

inline constexpr std::string_view REQUEST_PREFIX = "DAIKIN_UDP";

[[nodiscard]] std::string_view query_path(QueryGroup group) noexcept;

[[nodiscard]] std::string encode_discovery_request();
[[nodiscard]] std::string encode_query_request(QueryGroup group);

/**
 * @brief Split a reply into fields and check the "ret=OK" marker.
 */
Result<FieldMap, ProtocolError> parse_fields(std::string_view payload);

Result<DiscoveryReply, ProtocolError> decode_discovery_reply(std::string_view payload,
                                                             const std::string& sender_address);

Result<QueryReply, ProtocolError> decode_query_reply(std::string_view payload);

/// Decodes "%4c%69" to "Li". Bytes that do not form UTF-8 are an error.
Result<std::string> percent_decode(std::string_view encoded);

/// Decodes "4142" to "AB". Bytes that do not form UTF-8 are an error.
Result<std::string> hex_decode(std::string_view encoded);

/**
 * @brief Length of the well-formed UTF-8 sequence starting at @p pos, or 0.
 *
 * Overlong forms, surrogates and code points above U+10FFFF are not
 * well-formed.
 */
[[nodiscard]] size_t utf8_sequence_length(std::string_view text, size_t pos) noexcept;

[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

}  // namespace hvac_exporter
