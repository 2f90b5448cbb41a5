/**
 * @file exporter_stats.hpp
 * @brief Protocol counters exposed on the metrics endpoint.
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace hvac_exporter {

/// Upper bounds of the request duration buckets, in seconds.
inline constexpr std::array<double, 11> DURATION_BUCKETS = {
    0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};

struct DurationHistogram {
    std::array<uint64_t, DURATION_BUCKETS.size()> buckets{};  ///< Cumulative, as exposed
    uint64_t count = 0;
    double sum = 0.0;

    void observe(double seconds);
};

/// Requests, errors by type, and latency for one (host, path) pair.
struct RequestSeries {
    uint64_t requests = 0;
    std::map<std::string, uint64_t> errors;
    DurationHistogram duration;
};

/// (host, path)
using RequestKey = std::pair<std::string, std::string>;

/**
 * @brief Copy of the labeled series, taken under the stats lock.
 */
struct LabeledStats {
    std::map<RequestKey, RequestSeries> requests;
    std::map<std::string, uint64_t> discovery_requests;    ///< By target address
    std::map<std::string, uint64_t> discovery_responses;   ///< By sender address
};

/**
 * @brief Counters shared by discovery and the refresh tasks.
 *
 * The totals are lock-free atomics. The labeled series sit behind one mutex;
 * each update touches a single map node.
 */
class ExporterStats {
public:
    std::atomic<uint64_t> discovery_requests{0};
    std::atomic<uint64_t> discovery_responses{0};
    std::atomic<uint64_t> discovery_malformed{0};
    std::atomic<uint64_t> query_requests{0};
    std::atomic<uint64_t> query_successes{0};
    std::atomic<uint64_t> query_timeouts{0};
    std::atomic<uint64_t> query_malformed{0};
    std::atomic<uint64_t> query_socket_errors{0};

    // ── Per-request series ───────────────────

    void record_request(std::string_view host, std::string_view path);
    void record_request_error(std::string_view host, std::string_view path,
                              std::string_view error_type);
    void observe_request_duration(std::string_view host, std::string_view path,
                                  std::chrono::steady_clock::duration elapsed);

    // ── Per-address discovery series ─────────

    void record_discovery_request(std::string_view address);
    void record_discovery_response(std::string_view host);

    [[nodiscard]] LabeledStats labeled() const;

private:
    RequestSeries& series(std::string_view host, std::string_view path);

    mutable std::mutex mutex_;
    LabeledStats labeled_;
};

}  // namespace hvac_exporter
