/**
 * @file state_cache.hpp
 * @brief Stale-serving cache of the last successful snapshot per host.
 *
 * Entries are never evicted. A failed refresh leaves the entry alone; the
 * stale flag is derived at read time from the snapshot age, so no background
 * sweep ever races a reader.
 */

#pragma once

#include "cache/metric_snapshot.hpp"
#include "core/types.hpp"
#include "network/host_table.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace hvac_exporter {

struct CacheEntry {
    HostRecord host;
    MetricSnapshot snapshot;
};

class StateCache {
public:
    StateCache(const HostTable& hosts, Duration refresh_interval);

    /// Publish a new snapshot; readers see either the old or the new one whole.
    void store(const HostKey& key, MetricSnapshot snapshot);

    [[nodiscard]] std::optional<MetricSnapshot> get(const HostKey& key) const;
    [[nodiscard]] std::optional<MetricSnapshot> get(const HostKey& key, Timestamp now) const;

    /// Every host that has a snapshot, ordered by host key.
    [[nodiscard]] std::vector<CacheEntry> snapshot_all() const;
    [[nodiscard]] std::vector<CacheEntry> snapshot_all(Timestamp now) const;

    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] Duration refresh_interval() const noexcept { return refresh_interval_; }

private:
    struct Slot {
        mutable std::mutex mutex;
        std::shared_ptr<const MetricSnapshot> snapshot;
    };

    [[nodiscard]] std::shared_ptr<const MetricSnapshot> load(const HostKey& key) const;
    [[nodiscard]] MetricSnapshot with_staleness(const MetricSnapshot& snapshot,
                                                Timestamp now) const;

    const HostTable& hosts_;
    Duration refresh_interval_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<HostKey, std::unique_ptr<Slot>> slots_;
};

}  // namespace hvac_exporter
