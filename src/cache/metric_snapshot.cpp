/**
 * @file metric_snapshot.cpp
 * @brief Field normalization from adaptor replies to named metrics.
 */

#include "cache/metric_snapshot.hpp"

#include <array>
#include <charconv>
#include <cmath>

namespace hvac_exporter {

namespace {

enum class Transform : uint8_t {
    Number,     ///< numeric when parseable, raw text otherwise
    Power,
    Mode,
    FanRate,
    FanDirection,
    Percent,    ///< percent-encoded text
    Hex         ///< hex-encoded text, then numeric when parseable
};

struct FieldRule {
    std::string_view field;
    std::string_view metric;
    Transform transform;
};

constexpr std::array<FieldRule, 20> FIELD_RULES = {{
    {"pow",             "power",                      Transform::Power},
    {"mode",            "mode",                       Transform::Mode},
    {"stemp",           "set_temp",                   Transform::Number},
    {"shum",            "set_humidity",               Transform::Number},
    {"f_rate",          "fan_rate",                   Transform::FanRate},
    {"f_dir",           "fan_direction",              Transform::FanDirection},
    {"htemp",           "unit_temp",                  Transform::Number},
    {"hhum",            "unit_humidity",              Transform::Number},
    {"otemp",           "outdoor_temp",               Transform::Number},
    {"cmpfreq",         "compressor_demand",          Transform::Number},
    {"today_runtime",   "daily_runtime",              Transform::Number},
    {"name",            "name",                       Transform::Percent},
    {"fan",             "monitor_fan_speed",          Transform::Hex},
    {"rawrtmp",         "monitor_rawrtmp",            Transform::Hex},
    {"trtmp",           "monitor_trtmp",              Transform::Hex},
    {"fangl",           "monitor_fangl",              Transform::Hex},
    {"hetmp",           "monitor_hetmp",              Transform::Hex},
    {"ResetCount",      "monitor_resets",             Transform::Number},
    {"RouterDisconCnt", "monitor_router_disconnects", Transform::Number},
    {"PollingErrCnt",   "monitor_polling_errors",     Transform::Number},
}};

const FieldRule* find_rule(std::string_view field) {
    for (const auto& rule : FIELD_RULES) {
        if (rule.field == field) return &rule;
    }
    return nullptr;
}

MetricValue number_or_text(const std::string& raw) {
    if (auto value = parse_number(raw)) return *value;
    return raw;
}

MetricValue apply(Transform transform, const std::string& raw) {
    switch (transform) {
        case Transform::Number:
            return number_or_text(raw);

        case Transform::Power:
            if (raw == "1") return std::string("on");
            if (raw == "0") return std::string("off");
            return raw;

        case Transform::Mode:
            if (raw == "0" || raw == "1" || raw == "7") return std::string("auto");
            if (raw == "2") return std::string("dry");
            if (raw == "3") return std::string("cool");
            if (raw == "4") return std::string("heat");
            if (raw == "6") return std::string("fan");
            return raw;

        case Transform::FanRate:
            if (raw == "A") return std::string("auto");
            if (raw == "B") return std::string("silence");
            return number_or_text(raw);

        case Transform::FanDirection:
            if (raw == "0") return std::string("off");
            if (raw == "1") return std::string("vertical");
            if (raw == "2") return std::string("horizontal");
            if (raw == "3") return std::string("both");
            return raw;

        case Transform::Percent: {
            auto decoded = percent_decode(raw);
            return decoded ? *decoded : raw;
        }

        case Transform::Hex: {
            auto decoded = hex_decode(raw);
            return decoded ? number_or_text(*decoded) : number_or_text(raw);
        }
    }
    return raw;
}

}  // anonymous namespace

std::optional<double> MetricSnapshot::number(const std::string& name) const {
    auto it = metrics.find(name);
    if (it == metrics.end()) return std::nullopt;
    if (const auto* value = std::get_if<double>(&it->second)) return *value;
    return std::nullopt;
}

std::optional<std::string> MetricSnapshot::text(const std::string& name) const {
    auto it = metrics.find(name);
    if (it == metrics.end()) return std::nullopt;
    if (const auto* value = std::get_if<std::string>(&it->second)) return *value;
    return std::nullopt;
}

MetricSnapshot snapshot_from_reply(const QueryReply& reply, Timestamp captured_at) {
    MetricSnapshot snapshot;
    snapshot.captured_at = captured_at;
    snapshot.stale = false;

    for (const auto& [field, raw] : reply.fields) {
        if (const auto* rule = find_rule(field)) {
            snapshot.metrics.insert_or_assign(std::string(rule->metric),
                                              apply(rule->transform, raw));
        } else {
            snapshot.metrics.insert_or_assign(field, raw);
        }
    }
    return snapshot;
}

std::optional<double> parse_number(std::string_view text) {
    if (text.empty()) return std::nullopt;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

}  // namespace hvac_exporter
