/**
 * @file mesh_node.hpp
 * @brief Node orchestrator - wires discovery, registry and transfers together
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * MeshNode coordinates all subsystems:
 * - Shared-secret key derivation
 * - Peer discovery and the peer registry
 * - Encrypted file transfer (send and receive)
 * - Event surface for front ends
 * - ASIO worker thread pool
 */

#pragma once

#include "meshpulse/event_surface.hpp"
#include "meshpulse/peer_discovery.hpp"
#include "meshpulse/peer_registry.hpp"
#include "meshpulse/security_config.hpp"
#include "meshpulse/transfer_crypto.hpp"
#include "meshpulse/transfer_engine.hpp"
#include "meshpulse/utilities.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace meshpulse {

/**
 * @brief Runtime configuration of a node
 */
struct NodeConfig {
    /// Peer ID (empty generates one from the host name)
    std::string peer_id;

    /// Announced display name (empty uses the host name)
    std::string display_name;

    /// Pre-shared secret every node on the network must agree on
    std::string shared_secret = security::DEFAULT_SHARED_SECRET;

    /// Log file (empty for console only)
    std::string log_file;

    utilities::LogLevel log_level = utilities::LogLevel::INFO;

    DiscoveryOptions discovery;
    TransferOptions transfer;

    KeyDerivationParams kdf = KeyDerivationParams::interactive();

    /// ASIO worker threads
    size_t worker_threads = 2;

    /**
     * @brief Build a configuration from defaults plus MESHPULSE_* overrides
     *
     * Reads MESHPULSE_BCAST_PORT, MESHPULSE_XFER_PORT, MESHPULSE_KEY,
     * MESHPULSE_RECEIVE_DIR, MESHPULSE_NAME, MESHPULSE_LOG_FILE,
     * MESHPULSE_LOG_LEVEL and MESHPULSE_ANNOUNCE_ADDR. Invalid values are
     * logged and ignored.
     */
    static NodeConfig from_environment();
};

/**
 * @brief Node statistics
 */
struct MeshNodeStats {
    size_t known_peers;                 ///< Peers in the registry
    size_t active_transfers;            ///< Non-terminal transfer sessions
    uint64_t announcements_sent;        ///< Discovery announcements sent
    uint64_t datagrams_received;        ///< Discovery datagrams received
    uint64_t datagrams_dropped;         ///< Malformed or rate-limited datagrams
    uint64_t uptime_seconds;            ///< Time since start()
};

/**
 * @brief MeshNode - one participant on the LAN
 *
 * Owns the io_context and its worker threads. Subscriptions may be made
 * before start(); transfer operations require a running node.
 */
class MeshNode {
public:
    /**
     * @brief Construct node with configuration
     * @param config Node configuration
     * @throws std::invalid_argument if the peer ID or display name is invalid
     */
    explicit MeshNode(NodeConfig config = NodeConfig::from_environment());

    /**
     * @brief Destructor - graceful shutdown
     */
    ~MeshNode();

    // Disable copy and move
    MeshNode(const MeshNode&) = delete;
    MeshNode& operator=(const MeshNode&) = delete;
    MeshNode(MeshNode&&) = delete;
    MeshNode& operator=(MeshNode&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Derive the key, bind both ports and start worker threads
     * @return true if started successfully, false otherwise
     */
    bool start();

    /**
     * @brief Stop all subsystems and join worker threads
     *
     * Live transfers are cancelled, and their events delivered, before
     * this returns. Must not be called from an event callback (callbacks run on the
     * worker threads being joined).
     */
    void stop();

    /**
     * @brief Check if node is running
     */
    bool is_running() const;

    const std::string& get_peer_id() const { return config_.peer_id; }
    const std::string& get_display_name() const { return config_.display_name; }

    /**
     * @brief Bound UDP discovery port (0 if not running)
     */
    uint16_t get_discovery_port() const;

    /**
     * @brief Bound TCP transfer port (0 if not running)
     */
    uint16_t get_transfer_port() const;

    // ========================================================================
    // Peers
    // ========================================================================

    /**
     * @brief Live peers ordered by peer ID
     */
    std::vector<PeerRecord> get_peers() const;

    std::optional<PeerRecord> get_peer(const std::string& peer_id) const;

    /**
     * @brief Announce presence immediately
     * @return true if an announcement was sent
     */
    bool announce();

    // ========================================================================
    // Transfers
    // ========================================================================

    /**
     * @brief Send a file to a discovered peer
     * @param peer_id Target peer
     * @param file_path Local file
     * @param note Optional note shown to the receiver
     * @return Session ID, or std::nullopt if the request was refused (logged)
     */
    std::optional<std::string> send_file(const std::string& peer_id,
                                         const std::string& file_path,
                                         const std::string& note = "");

    /**
     * @brief Cancel an in-progress transfer
     * @return true if a cancellation was issued
     */
    bool cancel_transfer(const std::string& session_id);

    std::optional<TransferSnapshot> get_transfer(const std::string& session_id) const;
    std::vector<TransferSnapshot> get_transfers() const;

    // ========================================================================
    // Events
    // ========================================================================

    SubscriptionId subscribe_peer_events(PeerEventCallback callback);
    SubscriptionId subscribe_transfer_events(TransferEventCallback callback);
    bool unsubscribe(SubscriptionId id);

    // ========================================================================
    // Statistics
    // ========================================================================

    MeshNodeStats get_stats() const;

    /**
     * @brief Seconds since start() (0 if not running)
     */
    uint64_t get_uptime() const;

private:
    /// Declared first so pending handlers are destroyed after every component
    asio::io_context io_context_;

    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> worker_threads_;

    NodeConfig config_;

    std::shared_ptr<EventSurface> events_;
    std::shared_ptr<PeerRegistry> registry_;
    std::unique_ptr<TransferEngine> engine_;
    std::unique_ptr<PeerDiscovery> discovery_;

    MasterKey master_key_;

    /// Guards start/stop and the component pointers
    mutable std::mutex lifecycle_mutex_;

    std::atomic<bool> running_;
    std::chrono::steady_clock::time_point start_time_;

    void start_workers();
    void stop_workers();
};

} // namespace meshpulse
