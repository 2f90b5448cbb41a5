/**
 * @file state_cache.cpp
 * @brief StateCache implementation.
 */

#include "cache/state_cache.hpp"

namespace hvac_exporter {

StateCache::StateCache(const HostTable& hosts, Duration refresh_interval)
    : hosts_(hosts), refresh_interval_(refresh_interval) {}

void StateCache::store(const HostKey& key, MetricSnapshot snapshot) {
    auto published = std::make_shared<const MetricSnapshot>(std::move(snapshot));

    {
        std::shared_lock lock(mutex_);
        if (auto it = slots_.find(key); it != slots_.end()) {
            std::lock_guard slot_lock(it->second->mutex);
            it->second->snapshot = std::move(published);
            return;
        }
    }

    std::unique_lock lock(mutex_);
    auto& slot = slots_[key];
    if (!slot) slot = std::make_unique<Slot>();
    std::lock_guard slot_lock(slot->mutex);
    slot->snapshot = std::move(published);
}

std::shared_ptr<const MetricSnapshot> StateCache::load(const HostKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) return nullptr;

    std::lock_guard slot_lock(it->second->mutex);
    return it->second->snapshot;
}

MetricSnapshot StateCache::with_staleness(const MetricSnapshot& snapshot, Timestamp now) const {
    MetricSnapshot copy = snapshot;
    copy.stale = (now - snapshot.captured_at) > refresh_interval_;
    return copy;
}

std::optional<MetricSnapshot> StateCache::get(const HostKey& key) const {
    return get(key, std::chrono::system_clock::now());
}

std::optional<MetricSnapshot> StateCache::get(const HostKey& key, Timestamp now) const {
    auto snapshot = load(key);
    if (!snapshot) return std::nullopt;
    return with_staleness(*snapshot, now);
}

std::vector<CacheEntry> StateCache::snapshot_all() const {
    return snapshot_all(std::chrono::system_clock::now());
}

std::vector<CacheEntry> StateCache::snapshot_all(Timestamp now) const {
    std::vector<CacheEntry> entries;
    for (auto& host : hosts_.snapshot()) {
        auto snapshot = load(host.key);
        if (!snapshot) continue;
        entries.push_back(CacheEntry{
            .host = std::move(host),
            .snapshot = with_staleness(*snapshot, now)
        });
    }
    return entries;
}

size_t StateCache::size() const noexcept {
    std::shared_lock lock(mutex_);
    return slots_.size();
}

}  // namespace hvac_exporter
