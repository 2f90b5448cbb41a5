/**
 * @file refresh_scheduler.hpp
 * @brief Per-host periodic refresh of unit state into the StateCache.
 *
 * Each host gets its own std::jthread running a fixed-cadence loop, so a
 * unit that never answers only ever delays itself. Ticks for one host are
 * strictly sequential: when a tick overruns, the missed slots are skipped
 * instead of queued.
 */

#pragma once

#include "cache/state_cache.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "network/host_table.hpp"
#include "protocol/query_client.hpp"
#include "telemetry/exporter_stats.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>

namespace hvac_exporter {

struct RefreshSettings {
    Duration interval{7500};
    Duration timeout{250};
};

class RefreshScheduler {
public:
    RefreshScheduler(RefreshSettings settings,
                     HostTable& hosts,
                     StateCache& cache,
                     QueryClientFactory client_factory,
                     Logger& logger,
                     ExporterStats& stats);
    ~RefreshScheduler();

    // Non-copyable
    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    /// Start a refresh task for every host already in the table.
    void start();

    /// Cancel every task and wait for in-flight queries to unwind.
    void stop();

    /**
     * @brief Start the refresh task for one host; its first tick runs at once.
     *
     * Returns false when the host is unknown, already scheduled, or the
     * scheduler has been stopped.
     */
    bool add_host(const HostKey& key);

    [[nodiscard]] size_t scheduled_count() const;
    [[nodiscard]] uint64_t ticks_skipped() const noexcept;

private:
    void refresh_loop(const HostKey& key, std::stop_token stop);
    void tick(const HostKey& key, IQueryClient& client, std::stop_token stop);
    void sleep_until(SteadyTime deadline, std::stop_token stop);

    RefreshSettings settings_;
    HostTable& hosts_;
    StateCache& cache_;
    QueryClientFactory client_factory_;
    Logger& logger_;
    ExporterStats& stats_;

    mutable std::mutex tasks_mutex_;
    std::unordered_map<HostKey, std::jthread> tasks_;
    bool stopped_{false};

    std::mutex sleep_mutex_;
    std::condition_variable_any sleep_cv_;

    std::atomic<uint64_t> ticks_skipped_{0};
};

}  // namespace hvac_exporter
