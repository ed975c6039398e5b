/**
 * @file transfer_engine.hpp
 * @brief Encrypted TCP file transfer engine
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Accepts inbound transfers, starts outbound transfers to registry peers,
 * tracks every session until its retention period ends, and cancels them
 * on request.
 */

#pragma once

#include "meshpulse/event_surface.hpp"
#include "meshpulse/peer_registry.hpp"
#include "meshpulse/rate_limiter.hpp"
#include "meshpulse/security_config.hpp"
#include "meshpulse/transfer_crypto.hpp"
#include "meshpulse/transfer_handlers.hpp"
#include "meshpulse/transfer_session.hpp"

#include <asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshpulse {

/**
 * @brief Transfer engine configuration
 */
struct TransferOptions {
    /// TCP port to listen on (0 picks an ephemeral port)
    uint16_t port = security::TRANSFER_PORT;

    /// Local address to bind
    std::string bind_address = "0.0.0.0";

    /// Directory for received files
    std::string receive_dir = security::DEFAULT_RECEIVE_DIR;

    uint32_t chunk_size = static_cast<uint32_t>(security::CHUNK_SIZE);
    uint64_t max_file_size = security::MAX_FILE_SIZE;

    std::chrono::milliseconds handshake_timeout = security::HANDSHAKE_TIMEOUT;
    std::chrono::milliseconds stall_timeout = security::STALL_TIMEOUT;
    std::chrono::milliseconds progress_interval = security::PROGRESS_INTERVAL;
    std::chrono::milliseconds retention = security::SESSION_RETENTION;

    /// Decline every inbound transfer when false
    bool accept_inbound = true;

    /// Inbound sessions beyond this are declined as busy
    size_t max_inbound_sessions = security::MAX_INBOUND_SESSIONS;

    /// Inbound connections per second per remote address
    double connection_rate_per_second = 5.0;

    /// Inbound connection burst per remote address
    double connection_burst = 20.0;
};

/**
 * @brief TransferEngine - owns the acceptor and all transfer sessions
 *
 * Duplicate policy: a second send of the same file to the same peer is
 * refused while the first is still in progress. All other concurrent
 * sessions are allowed.
 */
class TransferEngine {
public:
    /**
     * @brief Construct TransferEngine
     * @param io_context ASIO I/O context for async operations
     * @param registry Peer registry used to resolve send targets
     * @param events Event surface for transfer events (may be null)
     * @param master_key Key derived from the shared secret
     * @param local This node's peer ID and display name
     * @param options Ports, directories, limits and timeouts
     */
    TransferEngine(
        asio::io_context& io_context,
        std::shared_ptr<PeerRegistry> registry,
        std::shared_ptr<EventSurface> events,
        const MasterKey& master_key,
        LocalIdentity local,
        TransferOptions options = {}
    );

    /**
     * @brief Destructor - stops the engine
     */
    ~TransferEngine();

    // Disable copy and move
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;
    TransferEngine(TransferEngine&&) = delete;
    TransferEngine& operator=(TransferEngine&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Prepare the receive directory, bind the acceptor and start accepting
     * @return true if listening, false on bind or directory failure
     */
    bool start();

    /**
     * @brief Close the acceptor and cancel every live session
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Get the bound TCP port (0 if not started)
     */
    uint16_t get_listen_port() const;

    // ========================================================================
    // Transfers
    // ========================================================================

    /**
     * @brief Start sending a file to a discovered peer
     *
     * Returns immediately; progress and outcome arrive as events.
     *
     * @param peer_id Target peer (must be in the registry)
     * @param file_path Regular, readable file
     * @param note Optional message shown to the receiver
     * @return Session ID, or std::nullopt if the request was refused (logged)
     */
    std::optional<std::string> send_file(
        const std::string& peer_id,
        const std::string& file_path,
        const std::string& note = ""
    );

    /**
     * @brief Cancel a session
     * @param session_id Session to cancel
     * @return true if the session exists and was still in progress (a session
     *         that has not started yet is cancelled as soon as it starts)
     */
    bool cancel(const std::string& session_id);

    /**
     * @brief Get a copy of one session
     */
    std::optional<TransferSnapshot> get_session(const std::string& session_id) const;

    /**
     * @brief Get copies of all tracked sessions, including recently finished ones
     */
    std::vector<TransferSnapshot> get_sessions() const;

    /**
     * @brief Get number of sessions not yet in a terminal state
     */
    size_t get_active_session_count() const;

private:
    /// Sessions shared with handlers so late releases never touch a dead engine
    struct SessionTable {
        mutable std::mutex mutex;
        std::map<std::string, std::shared_ptr<TransferHandler>> handlers;
    };

    void start_accept();
    void handle_accept(const asio::error_code& error, std::shared_ptr<asio::ip::tcp::socket> socket);
    size_t count_active(TransferDirection direction) const;
    SessionReleaseCallback make_release_callback() const;
    TransferSettings make_settings() const;

    /// ASIO I/O context reference
    asio::io_context& io_context_;

    std::shared_ptr<PeerRegistry> registry_;
    std::shared_ptr<EventSurface> events_;
    MasterKey master_key_;
    LocalIdentity local_;
    TransferOptions options_;
    TransferSettings settings_;

    asio::ip::tcp::acceptor acceptor_;
    mutable std::mutex acceptor_mutex_;
    uint16_t listen_port_;

    RateLimiter connection_guard_;
    std::shared_ptr<SessionTable> sessions_;
    std::atomic<bool> running_;
};

} // namespace meshpulse
