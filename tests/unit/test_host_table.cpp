/**
 * @file test_host_table.cpp
 * @brief Unit tests for the HostTable registry.
 */

#include "network/host_table.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>

using namespace hvac_exporter;

namespace {

DiscoveryReply make_reply(const std::string& mac, const std::string& address,
                          std::optional<std::string> name = std::nullopt) {
    DiscoveryReply reply;
    reply.unit_id = mac;
    reply.endpoint = Endpoint{.host = address, .port = UNIT_PORT};
    reply.name = std::move(name);
    return reply;
}

const Timestamp T0 = Timestamp{} + std::chrono::hours(1000);

}  // namespace

// ═══════════════════════════════════════════════
// Static hosts
// ═══════════════════════════════════════════════

TEST(HostTableTest, AddStaticStartsUnreachable) {
    HostTable table;
    EXPECT_TRUE(table.add_static("192.168.1.20", Endpoint{.host = "192.168.1.20"}));

    auto record = table.get("192.168.1.20");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->origin, HostOrigin::Static);
    EXPECT_EQ(record->liveness, Liveness::Unreachable);
    EXPECT_FALSE(record->unit_id.has_value());
}

TEST(HostTableTest, DuplicateStaticRejected) {
    HostTable table;
    EXPECT_TRUE(table.add_static("hvac.lan", Endpoint{.host = "hvac.lan"}));
    EXPECT_FALSE(table.add_static("hvac.lan", Endpoint{.host = "hvac.lan"}));
    EXPECT_EQ(table.size(), 1u);
}

// ═══════════════════════════════════════════════
// Discovery upserts
// ═══════════════════════════════════════════════

TEST(HostTableTest, UpsertInsertsDiscoveredRecord) {
    HostTable table;
    auto result = table.upsert_discovered(make_reply("A0B1", "10.0.0.5", "Living"), T0);

    EXPECT_TRUE(result.inserted);
    EXPECT_EQ(result.key, "A0B1");
    EXPECT_FALSE(result.previous_endpoint.has_value());

    auto record = table.get("A0B1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->origin, HostOrigin::Discovered);
    EXPECT_EQ(record->liveness, Liveness::Responding);
    EXPECT_EQ(record->unit_id, "A0B1");
    EXPECT_EQ(record->name, "Living");
    EXPECT_EQ(record->last_seen, T0);
    EXPECT_EQ(table.find_by_unit_id("A0B1"), "A0B1");
}

TEST(HostTableTest, RepeatedReplyDoesNotDuplicate) {
    HostTable table;
    table.upsert_discovered(make_reply("A0B1", "10.0.0.5"), T0);
    auto second = table.upsert_discovered(make_reply("A0B1", "10.0.0.5"), T0 + std::chrono::seconds(1));

    EXPECT_FALSE(second.inserted);
    EXPECT_EQ(second.key, "A0B1");
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.get("A0B1")->last_seen, T0 + std::chrono::seconds(1));
}

TEST(HostTableTest, AddressChangeUpdatesEndpoint) {
    HostTable table;
    table.upsert_discovered(make_reply("A0B1", "10.0.0.5"), T0);
    auto moved = table.upsert_discovered(make_reply("A0B1", "10.0.0.9"), T0);

    EXPECT_FALSE(moved.inserted);
    ASSERT_TRUE(moved.previous_endpoint.has_value());
    EXPECT_EQ(moved.previous_endpoint->host, "10.0.0.5");
    EXPECT_EQ(table.get("A0B1")->endpoint.host, "10.0.0.9");
    EXPECT_EQ(table.size(), 1u);
}

TEST(HostTableTest, StaticHostAdoptsIdentityByAddress) {
    HostTable table;
    table.add_static("10.0.0.5", Endpoint{.host = "10.0.0.5"});

    auto result = table.upsert_discovered(make_reply("A0B1", "10.0.0.5"), T0);
    EXPECT_FALSE(result.inserted);
    EXPECT_EQ(result.key, "10.0.0.5");
    EXPECT_EQ(table.size(), 1u);

    auto record = table.get("10.0.0.5");
    EXPECT_EQ(record->unit_id, "A0B1");
    EXPECT_EQ(record->origin, HostOrigin::Static);
    EXPECT_EQ(table.find_by_unit_id("A0B1"), "10.0.0.5");
}

TEST(HostTableTest, ConcurrentUpsertsOfOneUnitYieldOneRecord) {
    HostTable table;
    std::vector<std::jthread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&table] {
            for (int i = 0; i < 200; ++i) {
                table.upsert_discovered(make_reply("A0B1", "10.0.0.5"), T0);
            }
        });
    }
    threads.clear();  // join

    EXPECT_EQ(table.size(), 1u);
}

// ═══════════════════════════════════════════════
// Liveness
// ═══════════════════════════════════════════════

TEST(HostTableTest, LivenessTransitions) {
    HostTable table;
    table.add_static("hvac", Endpoint{.host = "10.0.0.5"});

    EXPECT_EQ(table.mark_unreachable("hvac", T0), Liveness::Unreachable);
    EXPECT_EQ(table.mark_unreachable("hvac", T0), Liveness::Unreachable);
    EXPECT_EQ(table.get("hvac")->consecutive_failures, 2u);
    EXPECT_FALSE(table.get("hvac")->last_seen.has_value());

    EXPECT_EQ(table.mark_responding("hvac", T0), Liveness::Unreachable);
    auto record = table.get("hvac");
    EXPECT_EQ(record->liveness, Liveness::Responding);
    EXPECT_EQ(record->consecutive_failures, 0u);
    EXPECT_EQ(record->last_seen, T0);

    EXPECT_EQ(table.mark_unreachable("hvac", T0), Liveness::Responding);
    EXPECT_FALSE(table.mark_responding("unknown", T0).has_value());
}

// ═══════════════════════════════════════════════
// Identity binding and enumeration
// ═══════════════════════════════════════════════

TEST(HostTableTest, BindIdentityFromQueryReply) {
    HostTable table;
    table.add_static("hvac.lan", Endpoint{.host = "hvac.lan"});

    EXPECT_TRUE(table.bind_identity("hvac.lan", std::string("A0B1"), std::string("Bedroom")));
    EXPECT_EQ(table.get("hvac.lan")->unit_id, "A0B1");
    EXPECT_EQ(table.get("hvac.lan")->name, "Bedroom");

    // A later discovery reply from the unit updates the same record
    auto result = table.upsert_discovered(make_reply("A0B1", "10.0.0.5"), T0);
    EXPECT_EQ(result.key, "hvac.lan");
    EXPECT_EQ(table.size(), 1u);
}

TEST(HostTableTest, BindIdentityRefusesOwnedUnitId) {
    HostTable table;
    table.upsert_discovered(make_reply("A0B1", "10.0.0.5"), T0);
    table.add_static("other", Endpoint{.host = "10.0.0.7"});

    EXPECT_FALSE(table.bind_identity("other", std::string("A0B1"), std::nullopt));
    EXPECT_FALSE(table.get("other")->unit_id.has_value());
    EXPECT_EQ(table.find_by_unit_id("A0B1"), "A0B1");
}

TEST(HostTableTest, BindIdentityKeepsLearnedUnitId) {
    HostTable table;
    table.add_static("hvac.lan", Endpoint{.host = "hvac.lan"});
    ASSERT_TRUE(table.bind_identity("hvac.lan", std::string("A0B1"), std::nullopt));

    EXPECT_TRUE(table.bind_identity("hvac.lan", std::string("C2D3"), std::string("Hall")));
    EXPECT_EQ(table.get("hvac.lan")->unit_id, "A0B1");
    EXPECT_EQ(table.get("hvac.lan")->name, "Hall");
    EXPECT_FALSE(table.find_by_unit_id("C2D3").has_value());
}

TEST(HostTableTest, SnapshotSortedByKey) {
    HostTable table;
    table.add_static("c", Endpoint{.host = "10.0.0.3"});
    table.add_static("a", Endpoint{.host = "10.0.0.1"});
    table.upsert_discovered(make_reply("b", "10.0.0.2"), T0);

    auto records = table.snapshot();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].key, "a");
    EXPECT_EQ(records[1].key, "b");
    EXPECT_EQ(records[2].key, "c");
    EXPECT_TRUE(table.contains("b"));
    EXPECT_EQ(table.keys().size(), 3u);
}
