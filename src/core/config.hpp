/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace hvac_exporter {

struct DiscoveryConfig {
    bool enabled = true;
    std::string bind_address = "0.0.0.0:0";     ///< Wildcard address, ephemeral port
    uint32_t major_interval_ms = 300000;
    uint32_t minor_interval_ms = 200;
    uint16_t port = UNIT_PORT;
    std::vector<std::string> targets;           ///< Empty = interface broadcast addresses
};

struct RefreshConfig {
    uint32_t interval_ms = 7500;
    uint32_t timeout_ms = 250;
    std::vector<QueryGroup> groups = {QueryGroup::Basic, QueryGroup::Control, QueryGroup::Sensor};
};

struct ExporterConfig {
    std::string bind_address = "0.0.0.0:9150";
};

struct TelemetryConfig {
    std::filesystem::path log_dir;              ///< Empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    std::vector<std::string> hosts;            ///< Static hosts, "host" or "host:port"
    DiscoveryConfig discovery;
    RefreshConfig refresh;
    ExporterConfig exporter;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Parse "host", "host:port" into an Endpoint.
 *
 * An empty host part is an error; so is a port outside 0..65535.
 */
Result<Endpoint> parse_endpoint(std::string_view text, uint16_t default_port);

/**
 * @brief Parse a query group name as used in the configuration file.
 */
Result<QueryGroup> parse_query_group(std::string_view name);

}  // namespace hvac_exporter
