/**
 * @file peer_registry.hpp
 * @brief Thread-safe registry of discovered peers with TTL eviction
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Invariants:
 * - at most one record per peer ID
 * - last_seen never moves backwards
 * - sweep() (and clear() at shutdown) are the only removal paths
 */

#pragma once

#include "meshpulse/peer_record.hpp"
#include "meshpulse/event_surface.hpp"
#include "meshpulse/security_config.hpp"

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <chrono>
#include <optional>

namespace meshpulse {

/**
 * @brief Outcome of PeerRegistry::upsert()
 */
enum class UpsertResult {
    ADDED,
    UPDATED
};

/**
 * @brief Records touched by one eviction sweep
 */
struct SweepReport {
    std::vector<PeerRecord> marked_stale;   ///< Newly STALE records
    std::vector<PeerRecord> removed;        ///< EXPIRED records, already removed
};

/**
 * @brief PeerRegistry - owned map of peer ID to PeerRecord
 *
 * Readers get copies. Events are published after the internal lock is
 * released, so subscribers may call back into the registry.
 */
class PeerRegistry {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Construct PeerRegistry
     * @param events Event surface for peer events (may be null)
     * @param stale_after Silence before a peer is marked STALE
     * @param expire_after Silence before a peer is removed (TTL)
     */
    explicit PeerRegistry(
        std::shared_ptr<EventSurface> events = nullptr,
        std::chrono::milliseconds stale_after = security::PEER_STALE_AFTER,
        std::chrono::milliseconds expire_after = security::PEER_EXPIRE_AFTER
    );

    ~PeerRegistry() = default;

    // Disable copy and move
    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;
    PeerRegistry(PeerRegistry&&) = delete;
    PeerRegistry& operator=(PeerRegistry&&) = delete;

    /**
     * @brief Insert or refresh a peer
     *
     * last_seen becomes max(stored, seen_at). Address, port, name and
     * metrics are replaced only when candidate.sequence is not older than
     * the stored sequence.
     *
     * @param candidate Record built from an announcement
     * @param seen_at Receive time of the announcement
     * @return ADDED for a new peer ID, UPDATED otherwise
     */
    UpsertResult upsert(const PeerRecord& candidate, Clock::time_point seen_at);

    /**
     * @brief Get a copy of one record
     * @return PeerRecord if present, std::nullopt otherwise
     */
    std::optional<PeerRecord> lookup(const std::string& peer_id) const;

    /**
     * @brief Get copies of all records, ordered by peer ID
     */
    std::vector<PeerRecord> snapshot() const;

    /**
     * @brief Age out silent peers
     *
     * Records silent longer than stale_after become STALE; records silent
     * longer than expire_after are removed and reported as EXPIRED.
     *
     * @param now Reference time
     * @return Records marked stale and records removed
     */
    SweepReport sweep(Clock::time_point now = Clock::now());

    /**
     * @brief Get number of tracked peers
     */
    size_t size() const;

    /**
     * @brief Remove all peers without publishing events (shutdown)
     */
    void clear();

    std::chrono::milliseconds get_stale_after() const { return stale_after_; }
    std::chrono::milliseconds get_expire_after() const { return expire_after_; }

private:
    void publish(PeerEventType type, const PeerRecord& record);

    std::shared_ptr<EventSurface> events_;
    std::chrono::milliseconds stale_after_;
    std::chrono::milliseconds expire_after_;

    /// Records by peer ID
    std::map<std::string, PeerRecord> peers_;

    /// (last_seen, peer ID) ordered oldest first, for sweeping
    std::set<std::pair<Clock::time_point, std::string>> by_last_seen_;

    mutable std::mutex mutex_;
};

} // namespace meshpulse
