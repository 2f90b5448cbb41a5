/**
 * @file codec.cpp
 * @brief Adaptor wire grammar: request encoding and key=value reply decoding.
 */

#include "protocol/codec.hpp"

#include <charconv>

namespace hvac_exporter {

namespace {

constexpr std::string_view MAGIC_KEY = "ret";
constexpr std::string_view MAGIC_OK = "OK";

ProtocolError malformed(std::string message) {
    return ProtocolError{ProtocolError::Kind::Malformed, std::move(message)};
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view trim_trailing(std::string_view text) noexcept {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'
                             || text.back() == ' ' || text.back() == '\0')) {
        text.remove_suffix(1);
    }
    return text;
}

}  // anonymous namespace

std::string_view query_path(QueryGroup group) noexcept {
    switch (group) {
        case QueryGroup::Basic:     return "/common/basic_info";
        case QueryGroup::Control:   return "/aircon/get_control_info";
        case QueryGroup::Sensor:    return "/aircon/get_sensor_info";
        case QueryGroup::WeekPower: return "/aircon/get_week_power";
        case QueryGroup::Monitor:   return "/aircon/get_monitordata";
    }
    return "/common/basic_info";
}

std::string encode_discovery_request() {
    return encode_query_request(QueryGroup::Basic);
}

std::string encode_query_request(QueryGroup group) {
    std::string request(REQUEST_PREFIX);
    request += query_path(group);
    return request;
}

Result<FieldMap, ProtocolError> parse_fields(std::string_view payload) {
    payload = trim_trailing(payload);
    if (payload.empty()) {
        return malformed("empty payload");
    }

    FieldMap fields;
    bool first = true;

    while (true) {
        auto comma = payload.find(',');
        auto segment = payload.substr(0, comma);

        auto equals = segment.find('=');
        if (equals == std::string_view::npos) {
            return malformed("field without '=': " + std::string(segment));
        }
        auto key = segment.substr(0, equals);
        auto value = segment.substr(equals + 1);
        if (key.empty()) {
            return malformed("field with empty key");
        }

        if (first) {
            if (key != MAGIC_KEY) {
                return malformed("reply does not start with ret=");
            }
            if (value != MAGIC_OK) {
                return malformed("unit returned ret=" + std::string(value));
            }
            first = false;
        } else {
            fields.insert_or_assign(std::string(key), std::string(value));
        }

        if (comma == std::string_view::npos) break;
        payload.remove_prefix(comma + 1);
    }

    return fields;
}

Result<DiscoveryReply, ProtocolError> decode_discovery_reply(std::string_view payload,
                                                             const std::string& sender_address) {
    auto parsed = parse_fields(payload);
    if (!parsed) return parsed.error();

    auto& fields = *parsed;
    auto mac = fields.find("mac");
    if (mac == fields.end() || mac->second.empty()) {
        return malformed("discovery reply without mac");
    }

    DiscoveryReply reply;
    reply.unit_id = mac->second;
    reply.endpoint.host = sender_address;
    reply.endpoint.port = UNIT_PORT;

    if (auto port = fields.find("port"); port != fields.end()) {
        const auto& text = port->second;
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()
            && value > 0 && value <= 65535) {
            reply.endpoint.port = static_cast<uint16_t>(value);
        }
    }

    if (auto name = fields.find("name"); name != fields.end() && !name->second.empty()) {
        auto decoded = percent_decode(name->second);
        reply.name = decoded ? *decoded : name->second;
    }

    reply.fields = std::move(fields);
    return reply;
}

Result<QueryReply, ProtocolError> decode_query_reply(std::string_view payload) {
    auto parsed = parse_fields(payload);
    if (!parsed) return parsed.error();
    return QueryReply{std::move(*parsed)};
}

Result<std::string> percent_decode(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size() / 3 + 1);

    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            decoded += encoded[i];
            continue;
        }
        if (i + 2 >= encoded.size()) {
            return Error{"truncated percent escape"};
        }
        int hi = hex_value(encoded[i + 1]);
        int lo = hex_value(encoded[i + 2]);
        if (hi < 0 || lo < 0) {
            return Error{"invalid percent escape"};
        }
        decoded += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    if (!is_valid_utf8(decoded)) {
        return Error{"percent escapes do not form UTF-8"};
    }
    return decoded;
}

Result<std::string> hex_decode(std::string_view encoded) {
    if (encoded.size() % 2 != 0) {
        return Error{"odd-length hex string"};
    }

    std::string decoded;
    decoded.reserve(encoded.size() / 2);
    for (size_t i = 0; i < encoded.size(); i += 2) {
        int hi = hex_value(encoded[i]);
        int lo = hex_value(encoded[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{"invalid hex digit"};
        }
        decoded += static_cast<char>((hi << 4) | lo);
    }
    if (!is_valid_utf8(decoded)) {
        return Error{"hex bytes do not form UTF-8"};
    }
    return decoded;
}

size_t utf8_sequence_length(std::string_view text, size_t pos) noexcept {
    if (pos >= text.size()) return 0;

    auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);
    if (lead < 0x80) return 1;

    size_t length = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) lower = 0xA0;         // overlong
        if (lead == 0xED) upper = 0x9F;         // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) lower = 0x90;         // overlong
        if (lead == 0xF4) upper = 0x8F;         // above U+10FFFF
    } else {
        return 0;
    }

    if (pos + length > text.size()) return 0;
    if (byte(pos + 1) < lower || byte(pos + 1) > upper) return 0;
    for (size_t i = 2; i < length; ++i) {
        if (byte(pos + i) < 0x80 || byte(pos + i) > 0xBF) return 0;
    }
    return length;
}

bool is_valid_utf8(std::string_view text) noexcept {
    for (size_t pos = 0; pos < text.size();) {
        auto length = utf8_sequence_length(text, pos);
        if (length == 0) return false;
        pos += length;
    }
    return true;
}

}  // namespace hvac_exporter
