/**
 * @file host_table.cpp
 * @brief HostTable implementation.
 */

#include "network/host_table.hpp"

#include <algorithm>

namespace hvac_exporter {

bool HostTable::add_static(const HostKey& key, Endpoint endpoint) {
    std::unique_lock lock(mutex_);
    if (entries_.count(key) > 0) return false;

    auto entry = std::make_unique<Entry>();
    entry->record.key = key;
    entry->record.endpoint = std::move(endpoint);
    entry->record.origin = HostOrigin::Static;
    entry->record.liveness = Liveness::Unreachable;
    entries_.emplace(key, std::move(entry));
    return true;
}

void HostTable::apply_reply(HostRecord& record, const DiscoveryReply& reply,
                            Timestamp now, UpsertResult& result) {
    if (record.endpoint != reply.endpoint) {
        result.previous_endpoint = record.endpoint;
        record.endpoint = reply.endpoint;
    }
    if (reply.name) record.name = reply.name;
    record.last_seen = now;
    record.liveness = Liveness::Responding;
}

UpsertResult HostTable::upsert_discovered(const DiscoveryReply& reply, Timestamp now) {
    UpsertResult result;

    // Fast path: a unit we already know by id
    {
        std::shared_lock lock(mutex_);
        if (auto it = by_unit_id_.find(reply.unit_id); it != by_unit_id_.end()) {
            auto& entry = *entries_.at(it->second);
            std::lock_guard entry_lock(entry.mutex);
            result.key = it->second;
            apply_reply(entry.record, reply, now, result);
            return result;
        }
    }

    std::unique_lock lock(mutex_);

    // Another reply may have registered the unit between the two locks
    if (auto it = by_unit_id_.find(reply.unit_id); it != by_unit_id_.end()) {
        auto& entry = *entries_.at(it->second);
        std::lock_guard entry_lock(entry.mutex);
        result.key = it->second;
        apply_reply(entry.record, reply, now, result);
        return result;
    }

    // A configured host at this address learning its identity
    for (auto& [key, entry] : entries_) {
        std::lock_guard entry_lock(entry->mutex);
        if (!entry->record.unit_id && entry->record.endpoint.host == reply.endpoint.host) {
            entry->record.unit_id = reply.unit_id;
            by_unit_id_.emplace(reply.unit_id, key);
            result.key = key;
            apply_reply(entry->record, reply, now, result);
            return result;
        }
    }

    // A configured host whose name happens to be the unit id
    HostKey key = reply.unit_id;
    if (auto it = entries_.find(key); it != entries_.end()) {
        std::lock_guard entry_lock(it->second->mutex);
        if (!it->second->record.unit_id) {
            it->second->record.unit_id = reply.unit_id;
            by_unit_id_.emplace(reply.unit_id, key);
            result.key = key;
            apply_reply(it->second->record, reply, now, result);
            return result;
        }
        key = reply.unit_id + "@" + reply.endpoint.host;
    }

    auto entry = std::make_unique<Entry>();
    entry->record.key = key;
    entry->record.unit_id = reply.unit_id;
    entry->record.endpoint = reply.endpoint;
    entry->record.name = reply.name;
    entry->record.origin = HostOrigin::Discovered;
    entry->record.liveness = Liveness::Responding;
    entry->record.last_seen = now;

    by_unit_id_.emplace(reply.unit_id, key);
    entries_.emplace(key, std::move(entry));

    result.key = key;
    result.inserted = true;
    return result;
}

std::optional<Liveness> HostTable::mark_responding(const HostKey& key, Timestamp now) {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    std::lock_guard entry_lock(it->second->mutex);
    auto& record = it->second->record;
    auto previous = record.liveness;
    record.liveness = Liveness::Responding;
    record.last_seen = now;
    record.last_attempt = now;
    record.consecutive_failures = 0;
    return previous;
}

std::optional<Liveness> HostTable::mark_unreachable(const HostKey& key, Timestamp now) {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    std::lock_guard entry_lock(it->second->mutex);
    auto& record = it->second->record;
    auto previous = record.liveness;
    record.liveness = Liveness::Unreachable;
    record.last_attempt = now;
    ++record.consecutive_failures;
    return previous;
}

bool HostTable::bind_identity(const HostKey& key,
                              const std::optional<UnitId>& unit_id,
                              const std::optional<std::string>& name) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;

    std::lock_guard entry_lock(it->second->mutex);
    auto& record = it->second->record;
    if (name) record.name = name;

    // An identity once learned is kept
    if (!unit_id || record.unit_id) return true;

    if (by_unit_id_.count(*unit_id) > 0) {
        return false;
    }
    record.unit_id = unit_id;
    by_unit_id_.emplace(*unit_id, key);
    return true;
}

std::optional<HostRecord> HostTable::get(const HostKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    std::lock_guard entry_lock(it->second->mutex);
    return it->second->record;
}

std::optional<HostKey> HostTable::find_by_unit_id(const UnitId& unit_id) const {
    std::shared_lock lock(mutex_);
    auto it = by_unit_id_.find(unit_id);
    if (it == by_unit_id_.end()) return std::nullopt;
    return it->second;
}

std::vector<HostRecord> HostTable::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<HostRecord> records;
    records.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        std::lock_guard entry_lock(entry->mutex);
        records.push_back(entry->record);
    }
    std::sort(records.begin(), records.end(),
              [](const HostRecord& a, const HostRecord& b) { return a.key < b.key; });
    return records;
}

std::vector<HostKey> HostTable::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<HostKey> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) result.push_back(key);
    return result;
}

size_t HostTable::size() const noexcept {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

bool HostTable::contains(const HostKey& key) const {
    std::shared_lock lock(mutex_);
    return entries_.count(key) > 0;
}

}  // namespace hvac_exporter
