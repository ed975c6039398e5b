/**
 * @file mesh_node.cpp
 * @brief Implementation of the MeshPulse node orchestrator
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshpulse/mesh_node.hpp"

#include <stdexcept>

namespace meshpulse {

using namespace meshpulse::utilities;

// ============================================================================
// Configuration
// ============================================================================

NodeConfig NodeConfig::from_environment() {
    NodeConfig config;

    config.discovery.port = get_env_port("MESHPULSE_BCAST_PORT", config.discovery.port);
    config.transfer.port = get_env_port("MESHPULSE_XFER_PORT", config.transfer.port);

    std::string secret = get_env("MESHPULSE_KEY");
    if (!secret.empty()) {
        config.shared_secret = secret;
    }

    config.transfer.receive_dir = get_env("MESHPULSE_RECEIVE_DIR", config.transfer.receive_dir);
    config.log_file = get_env("MESHPULSE_LOG_FILE");

    std::string name = get_env("MESHPULSE_NAME");
    if (!name.empty()) {
        if (security::validate_display_name(name)) {
            config.display_name = name;
        } else {
            log_warn("Node: Ignoring invalid MESHPULSE_NAME");
        }
    }

    std::string level = get_env("MESHPULSE_LOG_LEVEL");
    if (!level.empty()) {
        auto parsed = parse_log_level(level);
        if (parsed) {
            config.log_level = *parsed;
        } else {
            log_warn("Node: Ignoring unknown MESHPULSE_LOG_LEVEL '" + level + "'");
        }
    }

    std::string announce_address = get_env("MESHPULSE_ANNOUNCE_ADDR");
    if (!announce_address.empty()) {
        asio::error_code ec;
        asio::ip::make_address_v4(announce_address, ec);
        if (ec) {
            log_warn("Node: Ignoring invalid MESHPULSE_ANNOUNCE_ADDR '" + announce_address + "'");
        } else {
            config.discovery.announce_address = announce_address;
        }
    }

    return config;
}

// ============================================================================
// Constructor and Destructor
// ============================================================================

MeshNode::MeshNode(NodeConfig config)
    : config_(std::move(config))
    , events_(std::make_shared<EventSurface>())
    , master_key_{}
    , running_(false)
{
    std::string hostname = get_hostname();

    if (config_.peer_id.empty()) {
        config_.peer_id = PeerDiscovery::generate_peer_id(hostname);
    }
    if (config_.display_name.empty()) {
        config_.display_name = hostname.substr(0, security::MAX_DISPLAY_NAME_LENGTH);
        if (!security::validate_display_name(config_.display_name)) {
            config_.display_name = config_.peer_id;
        }
    }

    if (!security::validate_identifier(config_.peer_id)) {
        throw std::invalid_argument("Invalid peer ID: " + config_.peer_id);
    }
    if (!security::validate_display_name(config_.display_name)) {
        throw std::invalid_argument("Invalid display name: " + config_.display_name);
    }
    if (config_.worker_threads == 0) {
        config_.worker_threads = 1;
    }

    registry_ = std::make_shared<PeerRegistry>(events_);

    log_info("Node: Initialized '" + config_.display_name + "' as " + config_.peer_id);
}

MeshNode::~MeshNode() {
    if (running_) {
        log_warn("Node: Destructor called while still running, forcing stop");
        stop();
    }
    TransferCrypto::secure_zero(master_key_.data(), master_key_.size());
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool MeshNode::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_) {
        log_warn("Node: Already running");
        return false;
    }

    log_info("Node: Starting...");

    if (!TransferCrypto::initialize()) {
        log_error("Node: Failed to initialize libsodium");
        return false;
    }

    auto key = TransferCrypto::derive_master_key(config_.shared_secret, config_.kdf);
    if (!key) {
        log_error("Node: Failed to derive key from shared secret");
        return false;
    }
    master_key_ = *key;
    TransferCrypto::secure_zero(key->data(), key->size());

    io_context_.restart();
    registry_->clear();

    try {
        LocalIdentity local{config_.peer_id, config_.display_name};
        engine_ = std::make_unique<TransferEngine>(
            io_context_, registry_, events_, master_key_, local, config_.transfer);

        if (!engine_->start()) {
            log_error("Node: Failed to start transfer engine");
            engine_.reset();
            return false;
        }

        discovery_ = std::make_unique<PeerDiscovery>(
            io_context_, registry_, config_.peer_id, config_.display_name, config_.discovery);
        discovery_->set_transfer_port(engine_->get_listen_port());

        if (!discovery_->start()) {
            log_error("Node: Failed to start discovery");
            engine_->stop();
            discovery_.reset();
            engine_.reset();
            return false;
        }

    } catch (const std::exception& e) {
        log_error("Node: Exception during start: " + std::string(e.what()));
        if (engine_) {
            engine_->stop();
        }
        discovery_.reset();
        engine_.reset();
        return false;
    }

    start_workers();

    start_time_ = std::chrono::steady_clock::now();
    running_ = true;

    log_info("Node: Running (discovery UDP " + std::to_string(discovery_->get_local_port()) +
             ", transfer TCP " + std::to_string(engine_->get_listen_port()) + ")");
    return true;
}

void MeshNode::stop() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);

        if (!running_) {
            return;
        }

        log_info("Node: Stopping...");
        running_ = false;

        if (discovery_) {
            discovery_->stop();
        }
        if (engine_) {
            engine_->stop();
        }
    }

    // Joined without the lock so callbacks calling back into the node can finish
    stop_workers();

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        discovery_.reset();
        engine_.reset();
    }

    log_info("Node: Stopped");
}

bool MeshNode::is_running() const {
    return running_;
}

void MeshNode::start_workers() {
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_context_.get_executor()
    );

    log_debug("Node: Starting " + std::to_string(config_.worker_threads) + " worker threads");
    for (size_t i = 0; i < config_.worker_threads; ++i) {
        worker_threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                log_error("Node: Worker thread exception: " + std::string(e.what()));
            }
        });
    }
}

void MeshNode::stop_workers() {
    // No io_context_.stop(): the aborted operations and session cancellations
    // queued by stop() must run, and run() returns once they have
    work_guard_.reset();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();
}

uint16_t MeshNode::get_discovery_port() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return discovery_ ? discovery_->get_local_port() : 0;
}

uint16_t MeshNode::get_transfer_port() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return engine_ ? engine_->get_listen_port() : 0;
}

// ============================================================================
// Peers
// ============================================================================

std::vector<PeerRecord> MeshNode::get_peers() const {
    return registry_->snapshot();
}

std::optional<PeerRecord> MeshNode::get_peer(const std::string& peer_id) const {
    return registry_->lookup(peer_id);
}

bool MeshNode::announce() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!discovery_) {
        log_error("Node: Cannot announce - not started");
        return false;
    }
    return discovery_->announce_now();
}

// ============================================================================
// Transfers
// ============================================================================

std::optional<std::string> MeshNode::send_file(
    const std::string& peer_id,
    const std::string& file_path,
    const std::string& note
) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!engine_) {
        log_error("Node: Cannot send - not started");
        return std::nullopt;
    }
    return engine_->send_file(peer_id, file_path, note);
}

bool MeshNode::cancel_transfer(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return engine_ ? engine_->cancel(session_id) : false;
}

std::optional<TransferSnapshot> MeshNode::get_transfer(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!engine_) {
        return std::nullopt;
    }
    return engine_->get_session(session_id);
}

std::vector<TransferSnapshot> MeshNode::get_transfers() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!engine_) {
        return {};
    }
    return engine_->get_sessions();
}

// ============================================================================
// Events
// ============================================================================

SubscriptionId MeshNode::subscribe_peer_events(PeerEventCallback callback) {
    return events_->subscribe_peer_events(std::move(callback));
}

SubscriptionId MeshNode::subscribe_transfer_events(TransferEventCallback callback) {
    return events_->subscribe_transfer_events(std::move(callback));
}

bool MeshNode::unsubscribe(SubscriptionId id) {
    return events_->unsubscribe(id);
}

// ============================================================================
// Statistics
// ============================================================================

MeshNodeStats MeshNode::get_stats() const {
    MeshNodeStats stats{};
    stats.known_peers = registry_->size();
    stats.uptime_seconds = get_uptime();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (engine_) {
        stats.active_transfers = engine_->get_active_session_count();
    }
    if (discovery_) {
        stats.announcements_sent = discovery_->get_announcements_sent();
        stats.datagrams_received = discovery_->get_datagrams_received();
        stats.datagrams_dropped = discovery_->get_datagrams_dropped();
    }
    return stats;
}

uint64_t MeshNode::get_uptime() const {
    if (!running_) {
        return 0;
    }
    auto elapsed = std::chrono::steady_clock::now() - start_time_;
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
}

} // namespace meshpulse
