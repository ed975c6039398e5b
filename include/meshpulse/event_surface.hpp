/**
 * @file event_surface.hpp
 * @brief Subscription point for peer and transfer events
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Front ends subscribe here instead of polling. Callbacks run on the
 * publishing thread (an I/O worker), outside any internal lock, and must
 * not block for long.
 */

#pragma once

#include "meshpulse/peer_record.hpp"
#include "meshpulse/transfer_session.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <atomic>
#include <cstdint>

namespace meshpulse {

/**
 * @brief Kinds of peer events
 */
enum class PeerEventType {
    ADDED,
    UPDATED,
    REMOVED
};

/**
 * @brief Peer lifecycle event
 */
struct PeerEvent {
    PeerEventType type;
    PeerRecord peer;
};

/**
 * @brief Kinds of transfer events
 */
enum class TransferEventType {
    STARTED,
    PROGRESS,
    COMPLETED,
    FAILED,
    CANCELLED
};

/**
 * @brief Transfer lifecycle event
 */
struct TransferEvent {
    TransferEventType type;
    TransferSnapshot session;
};

std::string peer_event_type_to_string(PeerEventType type);
std::string transfer_event_type_to_string(TransferEventType type);

/// Callback for peer events
using PeerEventCallback = std::function<void(const PeerEvent& event)>;

/// Callback for transfer events
using TransferEventCallback = std::function<void(const TransferEvent& event)>;

/// Handle returned by subscribe calls
using SubscriptionId = uint64_t;

/**
 * @brief EventSurface - thread-safe publish/subscribe hub
 */
class EventSurface {
public:
    EventSurface();
    ~EventSurface() = default;

    // Disable copy and move
    EventSurface(const EventSurface&) = delete;
    EventSurface& operator=(const EventSurface&) = delete;
    EventSurface(EventSurface&&) = delete;
    EventSurface& operator=(EventSurface&&) = delete;

    /**
     * @brief Register a peer event callback
     * @param callback Function invoked for every peer event
     * @return Subscription handle for unsubscribe()
     */
    SubscriptionId subscribe_peer_events(PeerEventCallback callback);

    /**
     * @brief Register a transfer event callback
     * @param callback Function invoked for every transfer event
     * @return Subscription handle for unsubscribe()
     */
    SubscriptionId subscribe_transfer_events(TransferEventCallback callback);

    /**
     * @brief Remove a subscription
     * @param id Handle from a subscribe call
     * @return true if removed, false if unknown
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Deliver a peer event to all subscribers
     */
    void publish(const PeerEvent& event);

    /**
     * @brief Deliver a transfer event to all subscribers
     */
    void publish(const TransferEvent& event);

    /**
     * @brief Get number of active subscriptions
     */
    size_t get_subscriber_count() const;

private:
    std::map<SubscriptionId, PeerEventCallback> peer_callbacks_;
    std::map<SubscriptionId, TransferEventCallback> transfer_callbacks_;
    mutable std::mutex mutex_;
    std::atomic<SubscriptionId> next_id_;
};

} // namespace meshpulse
