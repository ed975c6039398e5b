/**
 * @file peer_discovery.hpp
 * @brief UDP broadcast-based peer discovery for MeshPulse nodes
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides UDP-based peer discovery:
 * - Periodic presence announcements
 * - Listener feeding the peer registry
 * - Periodic eviction sweep of silent peers
 * - Per-source flood guard
 */

#pragma once

#include "meshpulse/message_types.hpp"
#include "meshpulse/peer_registry.hpp"
#include "meshpulse/rate_limiter.hpp"
#include "meshpulse/security_config.hpp"

#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace meshpulse {

/**
 * @brief Supplies the optional metrics map carried in announcements
 */
using MetricsProvider = std::function<std::map<std::string, double>()>;

/**
 * @brief Discovery configuration
 */
struct DiscoveryOptions {
    /// Local UDP port to bind (0 picks an ephemeral port)
    uint16_t port = security::DISCOVERY_PORT;

    /// Local address to bind
    std::string bind_address = "0.0.0.0";

    /// Destination of announcements
    std::string announce_address = security::BROADCAST_ADDRESS;

    /// Destination port of announcements (0 means the bound port)
    uint16_t announce_port = 0;

    std::chrono::milliseconds announce_interval = security::ANNOUNCE_INTERVAL;
    std::chrono::milliseconds sweep_interval = security::SWEEP_INTERVAL;

    double rate_per_second = security::DISCOVERY_RATE_PER_SECOND;
    double rate_burst = security::DISCOVERY_RATE_BURST;
};

/**
 * @brief PeerDiscovery - announce, listen and evict
 *
 * All network work runs on the supplied io_context. The owner must stop
 * the io_context (or call stop() and let pending handlers drain) before
 * destroying this object.
 */
class PeerDiscovery {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Construct PeerDiscovery
     * @param io_context ASIO I/O context for async operations
     * @param registry Registry updated from received announcements
     * @param peer_id This node's peer ID (own announcements are ignored)
     * @param display_name Name announced to other nodes
     * @param options Ports, addresses and intervals
     */
    PeerDiscovery(
        asio::io_context& io_context,
        std::shared_ptr<PeerRegistry> registry,
        std::string peer_id,
        std::string display_name,
        DiscoveryOptions options = {}
    );

    /**
     * @brief Destructor - stops all discovery operations
     */
    ~PeerDiscovery();

    // Disable copy and move
    PeerDiscovery(const PeerDiscovery&) = delete;
    PeerDiscovery& operator=(const PeerDiscovery&) = delete;
    PeerDiscovery(PeerDiscovery&&) = delete;
    PeerDiscovery& operator=(PeerDiscovery&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Bind the discovery socket and start announcing, listening and sweeping
     * @return true if started, false if the socket could not be opened or bound
     */
    bool start();

    /**
     * @brief Stop timers and close the socket
     */
    void stop();

    /**
     * @brief Check if discovery is running
     */
    bool is_running() const;

    // ========================================================================
    // Operations
    // ========================================================================

    /**
     * @brief Set the TCP port advertised in announcements
     *
     * Announcements are skipped while the port is 0.
     */
    void set_transfer_port(uint16_t port);

    /**
     * @brief Set the provider for the optional metrics map
     */
    void set_metrics_provider(MetricsProvider provider);

    /**
     * @brief Send one announcement immediately
     * @return true if sent, false on send error (logged) or no transfer port yet
     */
    bool announce_now();

    /**
     * @brief Process one received datagram
     *
     * Drops rate-limited, malformed and self-originated datagrams;
     * otherwise upserts the sender into the registry.
     *
     * @param payload Datagram contents
     * @param from_address Source IP address
     * @param received_at Receive time
     * @return true if the registry was updated
     */
    bool ingest_datagram(const std::string& payload,
                         const std::string& from_address,
                         Clock::time_point received_at = Clock::now());

    /**
     * @brief Generate a peer ID from a host name plus a random instance suffix
     */
    static std::string generate_peer_id(const std::string& hostname);

    // ========================================================================
    // Accessors / Statistics
    // ========================================================================

    const std::string& get_peer_id() const { return peer_id_; }
    const std::string& get_display_name() const { return display_name_; }

    /**
     * @brief Get the bound UDP port (0 if not started)
     */
    uint16_t get_local_port() const;

    uint64_t get_announcements_sent() const;
    uint64_t get_datagrams_received() const;
    uint64_t get_datagrams_dropped() const;

private:
    bool open_socket();
    void start_receive();
    void handle_receive(const asio::error_code& error, size_t bytes_transferred);
    void schedule_announce(std::chrono::milliseconds delay);
    void schedule_sweep();

    std::shared_ptr<PeerRegistry> registry_;
    std::string peer_id_;
    std::string display_name_;
    DiscoveryOptions options_;

    /// Receive, announce and sweep handlers run here, so registry events keep their order
    asio::strand<asio::io_context::executor_type> strand_;

    /// UDP socket for discovery
    asio::ip::udp::socket socket_;
    asio::steady_timer announce_timer_;
    asio::steady_timer sweep_timer_;

    /// Serializes access to socket and timers across worker threads
    mutable std::mutex io_mutex_;

    asio::ip::udp::endpoint announce_endpoint_;
    uint16_t local_port_;

    /// Receive buffer
    std::array<char, security::MAX_UDP_PACKET_SIZE> recv_buffer_;

    /// Sender endpoint for received packets
    asio::ip::udp::endpoint sender_endpoint_;

    RateLimiter flood_guard_;

    MetricsProvider metrics_provider_;
    std::mutex metrics_mutex_;

    std::atomic<uint16_t> transfer_port_;
    std::atomic<uint64_t> sequence_;
    std::atomic<bool> running_;

    /// Statistics
    std::atomic<uint64_t> announcements_sent_;
    std::atomic<uint64_t> datagrams_received_;
    std::atomic<uint64_t> datagrams_dropped_;
};

} // namespace meshpulse
