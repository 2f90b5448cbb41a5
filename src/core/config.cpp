/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <charconv>
#include <cstdint>
#include <optional>

#include <toml++/toml.hpp>

namespace hvac_exporter {

namespace {

/**
 * @brief Read an array of strings; non-string elements are a config error.
 */
Result<std::vector<std::string>> string_array(toml::node_view<toml::node> node,
                                              std::string_view key) {
    std::vector<std::string> values;
    if (!node) return values;

    auto* arr = node.as_array();
    if (arr == nullptr) {
        return Error{std::string(key) + " must be an array of strings"};
    }
    for (auto& element : *arr) {
        auto value = element.value<std::string>();
        if (!value) {
            return Error{std::string(key) + " must only contain strings"};
        }
        values.push_back(std::move(*value));
    }
    return values;
}

/**
 * @brief Read an integer key, rejecting other types and values outside
 *        [min_value, max_value]. An absent key yields @p fallback.
 */
template <typename T>
Result<T> integer_in_range(toml::node_view<toml::node> node, std::string_view key,
                           T fallback, int64_t min_value, int64_t max_value) {
    if (!node) return fallback;

    auto value = node.value<int64_t>();
    if (!value || !node.is_integer()) {
        return Error{std::string(key) + " must be an integer"};
    }
    if (*value < min_value || *value > max_value) {
        return Error{std::string(key) + " must be between " + std::to_string(min_value)
                     + " and " + std::to_string(max_value) + ", got "
                     + std::to_string(*value)};
    }
    return static_cast<T>(*value);
}

Result<uint32_t> milliseconds(toml::node_view<toml::node> node, std::string_view key,
                              uint32_t fallback) {
    return integer_in_range<uint32_t>(node, key, fallback, 0, UINT32_MAX);
}

/**
 * @brief Read a string key; another type is a config error.
 */
Result<std::string> string_value(toml::node_view<toml::node> node, std::string_view key,
                                 std::string fallback) {
    if (!node) return fallback;

    auto value = node.value<std::string>();
    if (!value) {
        return Error{std::string(key) + " must be a string"};
    }
    return std::move(*value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // hosts = [...]
        auto hosts = string_array(tbl["hosts"], "hosts");
        if (!hosts) return hosts.error();
        config.hosts = std::move(*hosts);

        // Keeps the first error; later reads are skipped
        std::optional<Error> failure;
        auto assign = [&failure](auto& target, auto result) {
            if (failure) return;
            if (!result) {
                failure = result.error();
                return;
            }
            target = std::move(*result);
        };

        // [discovery]
        if (auto discovery = tbl["discovery"]; discovery.is_table()) {
            auto& d = config.discovery;
            d.enabled = discovery["enabled"].value_or(true);
            assign(d.bind_address, string_value(discovery["bind_address"],
                                                "discovery.bind_address",
                                                d.bind_address));
            assign(d.major_interval_ms, milliseconds(discovery["major_interval_ms"],
                                                     "discovery.major_interval_ms",
                                                     d.major_interval_ms));
            assign(d.minor_interval_ms, milliseconds(discovery["minor_interval_ms"],
                                                     "discovery.minor_interval_ms",
                                                     d.minor_interval_ms));
            assign(d.port, integer_in_range<uint16_t>(discovery["port"], "discovery.port",
                                                      d.port, 1, 65535));
            assign(d.targets, string_array(discovery["targets"], "discovery.targets"));
        }

        // [refresh]
        if (auto refresh = tbl["refresh"]; refresh.is_table()) {
            auto& r = config.refresh;
            assign(r.interval_ms, milliseconds(refresh["interval_ms"], "refresh.interval_ms",
                                               r.interval_ms));
            assign(r.timeout_ms, milliseconds(refresh["timeout_ms"], "refresh.timeout_ms",
                                              r.timeout_ms));

            if (refresh["groups"]) {
                auto names = string_array(refresh["groups"], "refresh.groups");
                if (!names) return names.error();

                r.groups.clear();
                for (const auto& name : *names) {
                    auto group = parse_query_group(name);
                    if (!group) return group.error();
                    r.groups.push_back(*group);
                }
            }
        }

        // [exporter]
        if (auto exporter = tbl["exporter"]; exporter.is_table()) {
            assign(config.exporter.bind_address,
                   string_value(exporter["bind_address"], "exporter.bind_address",
                                config.exporter.bind_address));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            std::string log_dir;
            assign(log_dir, string_value(telemetry["log_dir"], "telemetry.log_dir", ""));
            t.log_dir = log_dir;
            assign(t.log_level, string_value(telemetry["log_level"],
                                             "telemetry.log_level", t.log_level));
            assign(t.max_file_size_mb,
                   integer_in_range<uint32_t>(telemetry["max_file_size_mb"],
                                              "telemetry.max_file_size_mb",
                                              t.max_file_size_mb, 1, 1024 * 1024));
            assign(t.rotate_count,
                   integer_in_range<uint32_t>(telemetry["rotate_count"],
                                              "telemetry.rotate_count",
                                              t.rotate_count, 1, 1000));
        }

        // Flat top-level keys, as written by existing daikin.toml files.
        // They take precedence over the sectioned form.
        assign(config.exporter.bind_address,
               string_value(tbl["bind_address"], "bind_address",
                            config.exporter.bind_address));
        assign(config.discovery.bind_address,
               string_value(tbl["discover_bind_address"], "discover_bind_address",
                            config.discovery.bind_address));
        assign(config.discovery.major_interval_ms,
               milliseconds(tbl["discover_major_interval"], "discover_major_interval",
                            config.discovery.major_interval_ms));
        assign(config.discovery.minor_interval_ms,
               milliseconds(tbl["discover_minor_interval"], "discover_minor_interval",
                            config.discovery.minor_interval_ms));
        assign(config.refresh.interval_ms,
               milliseconds(tbl["refresh_interval"], "refresh_interval",
                            config.refresh.interval_ms));
        assign(config.refresh.timeout_ms,
               milliseconds(tbl["refresh_timeout"], "refresh_timeout",
                            config.refresh.timeout_ms));

        if (failure) return *failure;

        if (config.discovery.major_interval_ms == 0 || config.refresh.interval_ms == 0) {
            return Error{"Intervals must be greater than zero"};
        }
        if (config.refresh.groups.empty()) {
            return Error{"refresh.groups must name at least one query group"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<Endpoint> parse_endpoint(std::string_view text, uint16_t default_port) {
    Endpoint endpoint;
    endpoint.port = default_port;

    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        endpoint.host = std::string(text);
    } else {
        endpoint.host = std::string(text.substr(0, colon));
        auto port_text = text.substr(colon + 1);

        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(),
                                         port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size()
            || port > 65535 || port_text.empty()) {
            return Error{"Invalid port in address: " + std::string(text)};
        }
        endpoint.port = static_cast<uint16_t>(port);
    }

    if (endpoint.host.empty()) {
        return Error{"Missing host in address: " + std::string(text)};
    }
    return endpoint;
}

Result<QueryGroup> parse_query_group(std::string_view name) {
    for (auto group : {QueryGroup::Basic, QueryGroup::Control, QueryGroup::Sensor,
                       QueryGroup::WeekPower, QueryGroup::Monitor}) {
        if (to_string(group) == name) return group;
    }
    return Error{"Unknown query group: " + std::string(name)};
}

}  // namespace hvac_exporter
