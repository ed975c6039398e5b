/**
 * @file peer_record.hpp
 * @brief Peer record value type shared by discovery, registry and events
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <string>
#include <map>
#include <chrono>
#include <cstdint>

namespace meshpulse {

/**
 * @brief Liveness of a discovered peer
 */
enum class PeerStatus {
    ALIVE,    ///< Announced within the stale threshold
    STALE,    ///< Silent past the stale threshold, not yet expired
    EXPIRED   ///< Silent past the TTL; only seen in removal events
};

/**
 * @brief Get name of a peer status
 */
inline const char* peer_status_to_string(PeerStatus status) {
    switch (status) {
        case PeerStatus::ALIVE:   return "ALIVE";
        case PeerStatus::STALE:   return "STALE";
        case PeerStatus::EXPIRED: return "EXPIRED";
    }
    return "UNKNOWN";
}

/**
 * @brief Information about a discovered peer
 */
struct PeerRecord {
    std::string peer_id;                                ///< Unique peer identifier
    std::string address;                                ///< Source IP of its announcements
    uint16_t transfer_port = 0;                         ///< TCP port for transfers
    std::string display_name;                           ///< Human readable name
    std::chrono::steady_clock::time_point first_seen;   ///< First announcement received
    std::chrono::steady_clock::time_point last_seen;    ///< Latest announcement received
    PeerStatus status = PeerStatus::ALIVE;              ///< Liveness
    uint64_t sequence = 0;                              ///< Highest sequence number seen
    std::map<std::string, double> metrics;              ///< Latest advertised metrics
};

} // namespace meshpulse
