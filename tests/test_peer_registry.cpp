/**
 * @file test_peer_registry.cpp
 * @brief Unit tests for PeerRegistry
 *
 * Tests the peer table including:
 * - Add and update semantics
 * - Sequence ordering of metadata
 * - Out-of-order liveness
 * - Stale marking and expiry
 * - Event publication
 */

#include <gtest/gtest.h>
#include "meshpulse/peer_registry.hpp"
#include "meshpulse/event_surface.hpp"
#include "test_support.hpp"

#include <thread>

using namespace meshpulse;
using namespace meshpulse::testing_support;
using namespace std::chrono_literals;

class PeerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        events_ = std::make_shared<EventSurface>();
        recorder_ = std::make_unique<EventRecorder>(events_);
        registry_ = std::make_unique<PeerRegistry>(events_, 6000ms, 10000ms);
        t0_ = PeerRegistry::Clock::now();
    }

    PeerRecord make_peer(const std::string& id, uint64_t sequence = 1, uint16_t port = 5000) {
        PeerRecord record;
        record.peer_id = id;
        record.address = "192.168.1.20";
        record.transfer_port = port;
        record.display_name = "Peer " + id;
        record.sequence = sequence;
        return record;
    }

    std::shared_ptr<EventSurface> events_;
    std::unique_ptr<EventRecorder> recorder_;
    std::unique_ptr<PeerRegistry> registry_;
    PeerRegistry::Clock::time_point t0_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(PeerRegistryTest, RequiresStaleBeforeExpire) {
    EXPECT_THROW(PeerRegistry(nullptr, 10000ms, 6000ms), std::invalid_argument);
    EXPECT_THROW(PeerRegistry(nullptr, 0ms, 6000ms), std::invalid_argument);
    EXPECT_NO_THROW(PeerRegistry(nullptr));
}

// ============================================================================
// Upsert
// ============================================================================

TEST_F(PeerRegistryTest, FirstSightingAddsPeer) {
    EXPECT_EQ(registry_->upsert(make_peer("alpha"), t0_), UpsertResult::ADDED);

    auto record = registry_->lookup("alpha");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, PeerStatus::ALIVE);
    EXPECT_EQ(record->first_seen, t0_);
    EXPECT_EQ(record->last_seen, t0_);

    auto events = recorder_->peer_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, PeerEventType::ADDED);
    EXPECT_EQ(events[0].peer.peer_id, "alpha");
}

TEST_F(PeerRegistryTest, RepeatedSightingUpdatesPeer) {
    registry_->upsert(make_peer("alpha", 1), t0_);
    EXPECT_EQ(registry_->upsert(make_peer("alpha", 2, 6000), t0_ + 2s), UpsertResult::UPDATED);

    auto record = registry_->lookup("alpha");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->transfer_port, 6000);
    EXPECT_EQ(record->first_seen, t0_);
    EXPECT_EQ(record->last_seen, t0_ + 2s);
    EXPECT_EQ(registry_->size(), 1u);

    auto events = recorder_->peer_events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].type, PeerEventType::UPDATED);
}

TEST_F(PeerRegistryTest, OlderSequenceRefreshesLivenessOnly) {
    registry_->upsert(make_peer("alpha", 5, 5000), t0_);
    registry_->upsert(make_peer("alpha", 3, 7000), t0_ + 1s);

    auto record = registry_->lookup("alpha");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->transfer_port, 5000);
    EXPECT_EQ(record->sequence, 5u);
    EXPECT_EQ(record->last_seen, t0_ + 1s);
}

TEST_F(PeerRegistryTest, LateDeliveryNeverRewindsLastSeen) {
    registry_->upsert(make_peer("alpha", 1), t0_ + 5s);
    registry_->upsert(make_peer("alpha", 2), t0_ + 1s);

    auto record = registry_->lookup("alpha");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->last_seen, t0_ + 5s);
}

TEST_F(PeerRegistryTest, SnapshotIsOrderedById) {
    registry_->upsert(make_peer("charlie"), t0_);
    registry_->upsert(make_peer("alpha"), t0_);
    registry_->upsert(make_peer("bravo"), t0_);

    auto peers = registry_->snapshot();
    ASSERT_EQ(peers.size(), 3u);
    EXPECT_EQ(peers[0].peer_id, "alpha");
    EXPECT_EQ(peers[1].peer_id, "bravo");
    EXPECT_EQ(peers[2].peer_id, "charlie");
}

// ============================================================================
// Sweep
// ============================================================================

TEST_F(PeerRegistryTest, SweepKeepsRecentPeers) {
    registry_->upsert(make_peer("alpha"), t0_);

    auto report = registry_->sweep(t0_ + 6s);
    EXPECT_TRUE(report.marked_stale.empty());
    EXPECT_TRUE(report.removed.empty());
    EXPECT_EQ(registry_->lookup("alpha")->status, PeerStatus::ALIVE);
}

TEST_F(PeerRegistryTest, SilentPeerBecomesStaleThenExpires) {
    registry_->upsert(make_peer("alpha"), t0_);

    auto stale = registry_->sweep(t0_ + 7s);
    ASSERT_EQ(stale.marked_stale.size(), 1u);
    EXPECT_EQ(registry_->lookup("alpha")->status, PeerStatus::STALE);

    // Already stale: not reported twice
    EXPECT_TRUE(registry_->sweep(t0_ + 8s).marked_stale.empty());

    auto expired = registry_->sweep(t0_ + 10001ms);
    ASSERT_EQ(expired.removed.size(), 1u);
    EXPECT_EQ(expired.removed[0].status, PeerStatus::EXPIRED);
    EXPECT_FALSE(registry_->lookup("alpha").has_value());

    auto events = recorder_->peer_events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].type, PeerEventType::UPDATED);
    EXPECT_EQ(events[1].peer.status, PeerStatus::STALE);
    EXPECT_EQ(events[2].type, PeerEventType::REMOVED);
}

TEST_F(PeerRegistryTest, StalePeerRevivesOnAnnouncement) {
    registry_->upsert(make_peer("alpha", 1), t0_);
    registry_->sweep(t0_ + 7s);
    ASSERT_EQ(registry_->lookup("alpha")->status, PeerStatus::STALE);

    registry_->upsert(make_peer("alpha", 2), t0_ + 8s);
    EXPECT_EQ(registry_->lookup("alpha")->status, PeerStatus::ALIVE);

    // The new sighting restarts the clock
    EXPECT_TRUE(registry_->sweep(t0_ + 15s).removed.empty());
}

TEST_F(PeerRegistryTest, SweepRemovesOnlyExpiredPeers) {
    registry_->upsert(make_peer("old"), t0_);
    registry_->upsert(make_peer("new"), t0_ + 9s);

    auto report = registry_->sweep(t0_ + 11s);
    ASSERT_EQ(report.removed.size(), 1u);
    EXPECT_EQ(report.removed[0].peer_id, "old");
    EXPECT_TRUE(registry_->lookup("new").has_value());
}

TEST_F(PeerRegistryTest, ClearEmptiesRegistry) {
    registry_->upsert(make_peer("alpha"), t0_);
    registry_->clear();
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_TRUE(registry_->sweep(t0_ + 60s).removed.empty());
}

// ============================================================================
// Thread Safety
// ============================================================================

TEST_F(PeerRegistryTest, ConcurrentUpsertsAndSweeps) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 200; ++i) {
                registry_->upsert(make_peer("peer-" + std::to_string(t) + "-" + std::to_string(i % 20),
                                            static_cast<uint64_t>(i)),
                                  t0_ + std::chrono::milliseconds(i));
            }
        });
    }
    threads.emplace_back([this]() {
        for (int i = 0; i < 100; ++i) {
            registry_->sweep(t0_ + 1s);
        }
    });
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry_->size(), 80u);
}
