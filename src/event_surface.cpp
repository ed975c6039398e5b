/**
 * @file event_surface.cpp
 * @brief Implementation of the event publish/subscribe hub
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshpulse/event_surface.hpp"
#include "meshpulse/utilities.hpp"

#include <vector>

namespace meshpulse {

std::string peer_event_type_to_string(PeerEventType type) {
    switch (type) {
        case PeerEventType::ADDED:   return "peer_added";
        case PeerEventType::UPDATED: return "peer_updated";
        case PeerEventType::REMOVED: return "peer_removed";
    }
    return "unknown";
}

std::string transfer_event_type_to_string(TransferEventType type) {
    switch (type) {
        case TransferEventType::STARTED:   return "transfer_started";
        case TransferEventType::PROGRESS:  return "transfer_progress";
        case TransferEventType::COMPLETED: return "transfer_completed";
        case TransferEventType::FAILED:    return "transfer_failed";
        case TransferEventType::CANCELLED: return "transfer_cancelled";
    }
    return "unknown";
}

EventSurface::EventSurface()
    : next_id_(1)
{
}

SubscriptionId EventSurface::subscribe_peer_events(PeerEventCallback callback) {
    SubscriptionId id = next_id_++;
    std::lock_guard<std::mutex> lock(mutex_);
    peer_callbacks_[id] = std::move(callback);
    return id;
}

SubscriptionId EventSurface::subscribe_transfer_events(TransferEventCallback callback) {
    SubscriptionId id = next_id_++;
    std::lock_guard<std::mutex> lock(mutex_);
    transfer_callbacks_[id] = std::move(callback);
    return id;
}

bool EventSurface::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_callbacks_.erase(id) > 0 || transfer_callbacks_.erase(id) > 0;
}

void EventSurface::publish(const PeerEvent& event) {
    // Copy under lock so callbacks may subscribe or unsubscribe
    std::vector<PeerEventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.reserve(peer_callbacks_.size());
        for (const auto& [id, callback] : peer_callbacks_) {
            callbacks.push_back(callback);
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            utilities::log_error("Peer event callback error (" +
                peer_event_type_to_string(event.type) + "): " + e.what());
        }
    }
}

void EventSurface::publish(const TransferEvent& event) {
    std::vector<TransferEventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.reserve(transfer_callbacks_.size());
        for (const auto& [id, callback] : transfer_callbacks_) {
            callbacks.push_back(callback);
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            utilities::log_error("Transfer event callback error (" +
                transfer_event_type_to_string(event.type) + "): " + e.what());
        }
    }
}

size_t EventSurface::get_subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_callbacks_.size() + transfer_callbacks_.size();
}

} // namespace meshpulse
