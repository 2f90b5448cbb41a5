/**
 * @file exporter_stats.cpp
 * @brief ExporterStats labeled series.
 */

#include "telemetry/exporter_stats.hpp"

namespace hvac_exporter {

void DurationHistogram::observe(double seconds) {
    for (size_t i = 0; i < DURATION_BUCKETS.size(); ++i) {
        if (seconds <= DURATION_BUCKETS[i]) ++buckets[i];
    }
    ++count;
    sum += seconds;
}

RequestSeries& ExporterStats::series(std::string_view host, std::string_view path) {
    return labeled_.requests[RequestKey{std::string(host), std::string(path)}];
}

void ExporterStats::record_request(std::string_view host, std::string_view path) {
    std::lock_guard lock(mutex_);
    ++series(host, path).requests;
}

void ExporterStats::record_request_error(std::string_view host, std::string_view path,
                                         std::string_view error_type) {
    std::lock_guard lock(mutex_);
    ++series(host, path).errors[std::string(error_type)];
}

void ExporterStats::observe_request_duration(std::string_view host, std::string_view path,
                                             std::chrono::steady_clock::duration elapsed) {
    auto seconds = std::chrono::duration<double>(elapsed).count();
    std::lock_guard lock(mutex_);
    series(host, path).duration.observe(seconds);
}

void ExporterStats::record_discovery_request(std::string_view address) {
    std::lock_guard lock(mutex_);
    ++labeled_.discovery_requests[std::string(address)];
}

void ExporterStats::record_discovery_response(std::string_view host) {
    std::lock_guard lock(mutex_);
    ++labeled_.discovery_responses[std::string(host)];
}

LabeledStats ExporterStats::labeled() const {
    std::lock_guard lock(mutex_);
    return labeled_;
}

}  // namespace hvac_exporter
