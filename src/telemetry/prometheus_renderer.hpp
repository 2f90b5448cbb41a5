/**
 * @file prometheus_renderer.hpp
 * @brief Renders host state and cached snapshots in the Prometheus text format.
 */

#pragma once

#include "cache/state_cache.hpp"
#include "core/types.hpp"
#include "telemetry/exporter_stats.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace hvac_exporter {

inline constexpr std::string_view METRIC_PREFIX = "daikin_";
inline constexpr std::string_view PROMETHEUS_CONTENT_TYPE = "text/plain; version=0.0.4";

/**
 * @brief Render one scrape.
 *
 * Every host gets daikin_up and daikin_consecutive_failures, including hosts
 * that never answered. Hosts with a cached snapshot additionally get their
 * metrics plus staleness and age. Numeric metrics become gauges, string
 * metrics become `<name>_info{value="..."} 1`. The exporter's own request
 * counters and latency histogram follow, labeled by host and group path.
 */
[[nodiscard]] std::string render_prometheus(const std::vector<HostRecord>& hosts,
                                            const std::vector<CacheEntry>& entries,
                                            const ExporterStats& stats,
                                            Timestamp now);

/// Map anything outside [a-zA-Z0-9_] to '_'.
[[nodiscard]] std::string sanitize_metric_name(std::string_view name);

/// Escape backslash, double quote and newline for a label value; bytes that
/// are not UTF-8 become U+FFFD.
[[nodiscard]] std::string escape_label_value(std::string_view value);

}  // namespace hvac_exporter
