/**
 * @file peer_registry.cpp
 * @brief Implementation of the peer registry
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshpulse/peer_registry.hpp"
#include "meshpulse/utilities.hpp"

#include <stdexcept>

namespace meshpulse {

PeerRegistry::PeerRegistry(
    std::shared_ptr<EventSurface> events,
    std::chrono::milliseconds stale_after,
    std::chrono::milliseconds expire_after
)
    : events_(std::move(events))
    , stale_after_(stale_after)
    , expire_after_(expire_after)
{
    if (stale_after_.count() <= 0 || expire_after_ <= stale_after_) {
        throw std::invalid_argument("PeerRegistry requires 0 < stale_after < expire_after");
    }
}

// ============================================================================
// Mutation
// ============================================================================

UpsertResult PeerRegistry::upsert(const PeerRecord& candidate, Clock::time_point seen_at) {
    UpsertResult result;
    PeerRecord published;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = peers_.find(candidate.peer_id);
        if (it == peers_.end()) {
            PeerRecord record = candidate;
            record.first_seen = seen_at;
            record.last_seen = seen_at;
            record.status = PeerStatus::ALIVE;

            by_last_seen_.emplace(seen_at, record.peer_id);
            it = peers_.emplace(record.peer_id, std::move(record)).first;
            result = UpsertResult::ADDED;
        } else {
            PeerRecord& record = it->second;

            // Out-of-order receipts never rewind liveness
            if (seen_at >= record.last_seen) {
                by_last_seen_.erase({record.last_seen, record.peer_id});
                record.last_seen = seen_at;
                by_last_seen_.emplace(record.last_seen, record.peer_id);
                record.status = PeerStatus::ALIVE;
            }

            if (candidate.sequence >= record.sequence) {
                record.address = candidate.address;
                record.transfer_port = candidate.transfer_port;
                record.display_name = candidate.display_name;
                record.metrics = candidate.metrics;
                record.sequence = candidate.sequence;
            }

            result = UpsertResult::UPDATED;
        }

        published = it->second;
    }

    if (result == UpsertResult::ADDED) {
        utilities::log_info("Registry: peer added " + published.peer_id + " (" +
                            published.display_name + " @ " + published.address + ":" +
                            std::to_string(published.transfer_port) + ")");
        publish(PeerEventType::ADDED, published);
    } else {
        publish(PeerEventType::UPDATED, published);
    }

    return result;
}

SweepReport PeerRegistry::sweep(Clock::time_point now) {
    SweepReport report;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Oldest first; stop at the first record still inside the stale window
        for (auto it = by_last_seen_.begin(); it != by_last_seen_.end(); ) {
            auto silence = now - it->first;
            if (silence <= stale_after_) {
                break;
            }

            auto peer_it = peers_.find(it->second);
            if (peer_it == peers_.end()) {
                it = by_last_seen_.erase(it);
                continue;
            }

            if (silence > expire_after_) {
                PeerRecord removed = std::move(peer_it->second);
                removed.status = PeerStatus::EXPIRED;
                peers_.erase(peer_it);
                it = by_last_seen_.erase(it);
                report.removed.push_back(std::move(removed));
                continue;
            }

            if (peer_it->second.status == PeerStatus::ALIVE) {
                peer_it->second.status = PeerStatus::STALE;
                report.marked_stale.push_back(peer_it->second);
            }
            ++it;
        }
    }

    for (const auto& record : report.marked_stale) {
        utilities::log_debug("Registry: peer stale " + record.peer_id);
        publish(PeerEventType::UPDATED, record);
    }
    for (const auto& record : report.removed) {
        utilities::log_info("Registry: peer expired " + record.peer_id);
        publish(PeerEventType::REMOVED, record);
    }

    return report;
}

void PeerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.clear();
    by_last_seen_.clear();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<PeerRecord> PeerRegistry::lookup(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PeerRecord> PeerRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PeerRecord> records;
    records.reserve(peers_.size());
    for (const auto& [id, record] : peers_) {
        records.push_back(record);
    }
    return records;
}

size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

void PeerRegistry::publish(PeerEventType type, const PeerRecord& record) {
    if (events_) {
        events_->publish(PeerEvent{type, record});
    }
}

} // namespace meshpulse
