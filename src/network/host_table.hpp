/**
 * @file host_table.hpp
 * @brief Thread-safe, identity-keyed registry of known HVAC units.
 *
 * Written by the discovery engine (upserts) and the refresh tasks (liveness),
 * read by the renderer at scrape time. Records are never removed.
 */

#pragma once

#include "core/types.hpp"
#include "protocol/codec.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace hvac_exporter {

struct UpsertResult {
    HostKey key;
    bool inserted{false};
    std::optional<Endpoint> previous_endpoint;   ///< Set when the address changed
};

/**
 * @brief Maintains one HostRecord per unit.
 *
 * The structure lock only guards the key -> entry maps and is taken
 * exclusively just to add a key or a unit id. Each record has its own mutex,
 * so refreshes of different hosts never contend.
 */
class HostTable {
public:
    /// Insert a configured host. Returns false when the key already exists.
    bool add_static(const HostKey& key, Endpoint endpoint);

    /**
     * @brief Register a discovery reply.
     *
     * Matches by unit id first, then adopts a record at the same address that
     * has no unit id yet, else inserts a Discovered record keyed by unit id.
     */
    UpsertResult upsert_discovered(const DiscoveryReply& reply, Timestamp now);

    /// Returns the previous liveness, or nullopt for an unknown key.
    std::optional<Liveness> mark_responding(const HostKey& key, Timestamp now);

    /// Returns the previous liveness, or nullopt for an unknown key.
    std::optional<Liveness> mark_unreachable(const HostKey& key, Timestamp now);

    /**
     * @brief Attach identity reported in a query reply.
     *
     * Only a record without a unit id takes one; a unit id already owned by
     * another record is refused (returns false).
     */
    bool bind_identity(const HostKey& key,
                       const std::optional<UnitId>& unit_id,
                       const std::optional<std::string>& name);

    [[nodiscard]] std::optional<HostRecord> get(const HostKey& key) const;
    [[nodiscard]] std::optional<HostKey> find_by_unit_id(const UnitId& unit_id) const;
    [[nodiscard]] std::vector<HostRecord> snapshot() const;
    [[nodiscard]] std::vector<HostKey> keys() const;
    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] bool contains(const HostKey& key) const;

private:
    struct Entry {
        mutable std::mutex mutex;
        HostRecord record;
    };

    static void apply_reply(HostRecord& record, const DiscoveryReply& reply,
                            Timestamp now, UpsertResult& result);

    mutable std::shared_mutex mutex_;
    std::unordered_map<HostKey, std::unique_ptr<Entry>> entries_;
    std::unordered_map<UnitId, HostKey> by_unit_id_;
};

}  // namespace hvac_exporter
