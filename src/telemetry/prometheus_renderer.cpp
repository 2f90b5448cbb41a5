/**
 * @file prometheus_renderer.cpp
 * @brief Prometheus text exposition (format 0.0.4).
 */

#include "telemetry/prometheus_renderer.hpp"

#include "protocol/codec.hpp"

#include <charconv>
#include <cmath>
#include <initializer_list>
#include <map>

namespace hvac_exporter {

namespace {

struct Family {
    std::string_view type;
    std::string help;
    std::vector<std::string> samples;
};

using Families = std::map<std::string, Family>;

/// U+FFFD, substituted for bytes that are not UTF-8.
constexpr std::string_view REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

std::string format_value(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) return "NaN";
    return std::string(buf, ptr);
}

/// {host="..",unit="..",name=".."} for one record, plus optional extra label.
std::string host_labels(const HostRecord& host,
                        std::string_view extra_key = {},
                        std::string_view extra_value = {}) {
    std::string labels = "{host=\"" + escape_label_value(host.key)
        + "\",unit=\"" + escape_label_value(host.unit_id.value_or(""))
        + "\",name=\"" + escape_label_value(host.name.value_or("")) + "\"";
    if (!extra_key.empty()) {
        labels += "," + std::string(extra_key) + "=\"" + escape_label_value(extra_value) + "\"";
    }
    labels += "}";
    return labels;
}

Family& family_for(Families& families, const std::string& name, std::string_view type,
                   std::string_view help) {
    auto& family = families[name];
    if (family.type.empty()) {
        family.type = type;
        family.help = std::string(help);
    }
    return family;
}

void add_sample(Families& families, const std::string& name, std::string_view type,
                std::string_view help, std::string labels, double value) {
    family_for(families, name, type, help)
        .samples.push_back(name + labels + " " + format_value(value));
}

using Label = std::pair<std::string_view, std::string_view>;

/// {k1="v1",k2="v2"} with escaped values.
std::string label_set(std::initializer_list<Label> labels) {
    std::string out = "{";
    for (const auto& [key, value] : labels) {
        if (out.size() > 1) out += ",";
        out += std::string(key) + "=\"" + escape_label_value(value) + "\"";
    }
    out += "}";
    return out;
}

void add_request_series(Families& families, const std::string& prefix,
                        const LabeledStats& labeled) {
    const auto histogram = prefix + "udp_request_duration_seconds";

    for (const auto& [key, series] : labeled.requests) {
        const auto& [host, path] = key;

        add_sample(families, prefix + "udp_requests_total", "counter",
                   "UDP query requests made to units, by group path.",
                   label_set({{"host", host}, {"path", path}}),
                   static_cast<double>(series.requests));

        for (const auto& [type, count] : series.errors) {
            add_sample(families, prefix + "udp_request_errors_total", "counter",
                       "UDP query requests that failed, by error type.",
                       label_set({{"host", host}, {"path", path}, {"error_type", type}}),
                       static_cast<double>(count));
        }

        auto& family = family_for(families, histogram, "histogram",
                                  "Time from sending a UDP query request to its outcome.");
        for (size_t i = 0; i < DURATION_BUCKETS.size(); ++i) {
            auto bound = format_value(DURATION_BUCKETS[i]);
            family.samples.push_back(
                histogram + "_bucket"
                + label_set({{"host", host}, {"path", path}, {"le", bound}})
                + " " + format_value(static_cast<double>(series.duration.buckets[i])));
        }
        family.samples.push_back(
            histogram + "_bucket" + label_set({{"host", host}, {"path", path}, {"le", "+Inf"}})
            + " " + format_value(static_cast<double>(series.duration.count)));
        family.samples.push_back(
            histogram + "_sum" + label_set({{"host", host}, {"path", path}})
            + " " + format_value(series.duration.sum));
        family.samples.push_back(
            histogram + "_count" + label_set({{"host", host}, {"path", path}})
            + " " + format_value(static_cast<double>(series.duration.count)));
    }

    for (const auto& [address, count] : labeled.discovery_requests) {
        add_sample(families, prefix + "udp_discover_requests_total", "counter",
                   "UDP discovery requests sent, by broadcast address.",
                   label_set({{"address", address}}), static_cast<double>(count));
    }
    for (const auto& [host, count] : labeled.discovery_responses) {
        add_sample(families, prefix + "udp_discover_responses_total", "counter",
                   "UDP discovery responses received, by sender address.",
                   label_set({{"host", host}}), static_cast<double>(count));
    }
}

void add_stat(Families& families, std::string_view name, std::string_view help,
              const std::atomic<uint64_t>& counter) {
    add_sample(families, std::string(METRIC_PREFIX) + std::string(name), "counter", help,
               "", static_cast<double>(counter.load()));
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

std::string sanitize_metric_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
               || (c >= '0' && c <= '9') || c == '_';
        out.push_back(ok ? c : '_');
    }
    return out;
}

std::string escape_label_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (size_t pos = 0; pos < value.size();) {
        auto length = utf8_sequence_length(value, pos);
        if (length == 0) {
            out += REPLACEMENT_CHARACTER;
            ++pos;
            continue;
        }
        if (length > 1) {
            out.append(value.substr(pos, length));
            pos += length;
            continue;
        }
        char c = value[pos++];
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

// ─────────────────────────────────────────────
// Rendering
// ─────────────────────────────────────────────

std::string render_prometheus(const std::vector<HostRecord>& hosts,
                              const std::vector<CacheEntry>& entries,
                              const ExporterStats& stats,
                              Timestamp now) {
    Families families;
    const std::string prefix(METRIC_PREFIX);

    for (const auto& host : hosts) {
        auto labels = host_labels(host);
        add_sample(families, prefix + "up", "gauge",
                   "Whether the last refresh of the unit succeeded.", labels,
                   host.liveness == Liveness::Responding ? 1.0 : 0.0);
        add_sample(families, prefix + "consecutive_failures", "gauge",
                   "Refresh failures since the last success.", labels,
                   static_cast<double>(host.consecutive_failures));
    }

    for (const auto& entry : entries) {
        auto labels = host_labels(entry.host);
        const auto& snapshot = entry.snapshot;

        auto age = std::chrono::duration<double>(now - snapshot.captured_at).count();
        add_sample(families, prefix + "snapshot_stale", "gauge",
                   "Whether the cached values are older than one refresh interval.", labels,
                   snapshot.stale ? 1.0 : 0.0);
        add_sample(families, prefix + "snapshot_age_seconds", "gauge",
                   "Seconds since the cached values were captured.", labels,
                   age < 0 ? 0.0 : age);

        for (const auto& [metric, value] : snapshot.metrics) {
            auto sanitized = sanitize_metric_name(metric);
            auto name = prefix + sanitized;
            if (const auto* number = std::get_if<double>(&value)) {
                add_sample(families, name, "gauge", "Unit reading " + sanitized + ".",
                           labels, *number);
            } else {
                add_sample(families, name + "_info", "gauge", "Unit state " + sanitized + ".",
                           host_labels(entry.host, "value", std::get<std::string>(value)), 1.0);
            }
        }
    }

    add_stat(families, "discovery_requests_total", "Discovery datagrams sent.",
             stats.discovery_requests);
    add_stat(families, "discovery_responses_total", "Datagrams received on the discovery socket.",
             stats.discovery_responses);
    add_stat(families, "discovery_malformed_total", "Discovery replies that failed to decode.",
             stats.discovery_malformed);
    add_stat(families, "query_requests_total", "Refresh queries started.",
             stats.query_requests);
    add_stat(families, "query_successes_total", "Refresh queries that returned data.",
             stats.query_successes);
    add_stat(families, "query_timeouts_total", "Refresh queries that timed out.",
             stats.query_timeouts);
    add_stat(families, "query_malformed_total", "Refresh queries with a malformed reply.",
             stats.query_malformed);
    add_stat(families, "query_socket_errors_total", "Refresh queries that hit a socket error.",
             stats.query_socket_errors);

    add_request_series(families, prefix, stats.labeled());

    std::string out;
    for (const auto& [name, family] : families) {
        out += "# HELP " + name + " " + family.help + "\n";
        out += "# TYPE " + name + " " + std::string(family.type) + "\n";
        for (const auto& sample : family.samples) {
            out += sample;
            out += '\n';
        }
    }
    return out;
}

}  // namespace hvac_exporter
