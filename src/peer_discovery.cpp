/**
 * @file peer_discovery.cpp
 * @brief Implementation of UDP broadcast-based peer discovery
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshpulse/peer_discovery.hpp"
#include "meshpulse/utilities.hpp"
#include <stdexcept>

namespace meshpulse {

// ============================================================================
// Constructor / Destructor
// ============================================================================

PeerDiscovery::PeerDiscovery(
    asio::io_context& io_context,
    std::shared_ptr<PeerRegistry> registry,
    std::string peer_id,
    std::string display_name,
    DiscoveryOptions options
)
    : registry_(std::move(registry))
    , peer_id_(std::move(peer_id))
    , display_name_(std::move(display_name))
    , options_(std::move(options))
    , strand_(asio::make_strand(io_context))
    , socket_(strand_)
    , announce_timer_(strand_)
    , sweep_timer_(strand_)
    , local_port_(0)
    , flood_guard_(options_.rate_per_second, options_.rate_burst)
    , transfer_port_(0)
    , sequence_(0)
    , running_(false)
    , announcements_sent_(0)
    , datagrams_received_(0)
    , datagrams_dropped_(0)
{
    if (!registry_) {
        throw std::invalid_argument("PeerDiscovery: registry cannot be null");
    }
    if (!security::validate_identifier(peer_id_)) {
        throw std::invalid_argument("PeerDiscovery: invalid peer ID '" + peer_id_ + "'");
    }
    if (!security::validate_display_name(display_name_)) {
        throw std::invalid_argument("PeerDiscovery: invalid display name");
    }
    if (options_.announce_interval.count() <= 0 || options_.sweep_interval.count() <= 0) {
        throw std::invalid_argument("PeerDiscovery: intervals must be positive");
    }
}

PeerDiscovery::~PeerDiscovery() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool PeerDiscovery::start() {
    if (running_.load()) {
        return true;  // Already running
    }

    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (!open_socket()) {
            return false;
        }
        running_.store(true);

        // Start async receive
        start_receive();
    }

    // First announcement goes out immediately
    schedule_announce(std::chrono::milliseconds(0));
    schedule_sweep();

    utilities::log_info("Discovery: Listening on UDP " + std::to_string(get_local_port()) +
                        " as " + peer_id_);
    return true;
}

bool PeerDiscovery::open_socket() {
    try {
        asio::ip::udp::endpoint bind_endpoint(
            asio::ip::make_address(options_.bind_address), options_.port);

        // Open UDP socket
        socket_.open(asio::ip::udp::v4());

        // Enable broadcast
        socket_.set_option(asio::socket_base::broadcast(true));
        socket_.set_option(asio::socket_base::reuse_address(true));

        // Bind to discovery port
        socket_.bind(bind_endpoint);
        local_port_ = socket_.local_endpoint().port();

        uint16_t announce_port = options_.announce_port != 0 ? options_.announce_port : local_port_;
        announce_endpoint_ = asio::ip::udp::endpoint(
            asio::ip::make_address(options_.announce_address), announce_port);

    } catch (const std::exception& e) {
        utilities::log_error("Discovery: Failed to bind UDP port " +
                             std::to_string(options_.port) + ": " + e.what());
        asio::error_code ignored;
        socket_.close(ignored);
        return false;
    }

    utilities::log_debug("Discovery: Announcing to " + announce_endpoint_.address().to_string() +
                         ":" + std::to_string(announce_endpoint_.port()));
    return true;
}

void PeerDiscovery::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::lock_guard<std::mutex> lock(io_mutex_);

    announce_timer_.cancel();
    sweep_timer_.cancel();

    asio::error_code error;
    socket_.close(error);
    if (error) {
        utilities::log_error("Discovery: Error closing socket: " + error.message());
    }

    utilities::log_info("Discovery: Stopped");
}

bool PeerDiscovery::is_running() const {
    return running_.load();
}

// ============================================================================
// Timers
// ============================================================================

void PeerDiscovery::schedule_announce(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!running_.load()) {
        return;
    }

    announce_timer_.expires_after(delay);
    announce_timer_.async_wait([this](const asio::error_code& error) {
        if (error || !running_.load()) {
            return;
        }
        announce_now();
        schedule_announce(options_.announce_interval);
    });
}

void PeerDiscovery::schedule_sweep() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!running_.load()) {
        return;
    }

    sweep_timer_.expires_after(options_.sweep_interval);
    sweep_timer_.async_wait([this](const asio::error_code& error) {
        if (error || !running_.load()) {
            return;
        }
        registry_->sweep();
        flood_guard_.cleanup_inactive(std::chrono::seconds(60));
        schedule_sweep();
    });
}

// ============================================================================
// Announce
// ============================================================================

void PeerDiscovery::set_transfer_port(uint16_t port) {
    transfer_port_.store(port);
}

void PeerDiscovery::set_metrics_provider(MetricsProvider provider) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_provider_ = std::move(provider);
}

bool PeerDiscovery::announce_now() {
    uint16_t transfer_port = transfer_port_.load();
    if (transfer_port == 0) {
        utilities::log_debug("Discovery: No transfer port yet, skipping announcement");
        return false;
    }

    PeerAnnouncement announce;
    announce.peer_id = peer_id_;
    announce.display_name = display_name_;
    announce.transfer_port = transfer_port;
    announce.sequence = ++sequence_;
    announce.timestamp = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        if (metrics_provider_) {
            try {
                announce.metrics = metrics_provider_();
            } catch (const std::exception& e) {
                utilities::log_warn("Discovery: Metrics provider failed: " + std::string(e.what()));
            }
        }
    }

    std::string payload = announce.to_json();

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!socket_.is_open()) {
        return false;
    }

    asio::error_code error;
    socket_.send_to(asio::buffer(payload), announce_endpoint_, 0, error);
    if (error) {
        // Transient (no route, interface down); the next tick retries
        utilities::log_warn("Discovery: Announcement send failed: " + error.message());
        return false;
    }

    announcements_sent_++;
    return true;
}

// ============================================================================
// Receive
// ============================================================================

void PeerDiscovery::start_receive() {
    socket_.async_receive_from(
        asio::buffer(recv_buffer_),
        sender_endpoint_,
        [this](const asio::error_code& error, size_t bytes_transferred) {
            handle_receive(error, bytes_transferred);
        }
    );
}

void PeerDiscovery::handle_receive(const asio::error_code& error, size_t bytes_transferred) {
    if (error == asio::error::operation_aborted || !running_.load()) {
        return;
    }

    if (error) {
        utilities::log_warn("Discovery: Receive error: " + error.message());
    } else {
        try {
            std::string payload(recv_buffer_.data(), bytes_transferred);
            ingest_datagram(payload, sender_endpoint_.address().to_string());
        } catch (const std::exception& e) {
            utilities::log_error("Discovery: Error processing datagram: " + std::string(e.what()));
        }
    }

    // Continue listening if still running
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (running_.load() && socket_.is_open()) {
        start_receive();
    }
}

bool PeerDiscovery::ingest_datagram(const std::string& payload,
                                    const std::string& from_address,
                                    Clock::time_point received_at) {
    datagrams_received_++;

    if (!flood_guard_.allow(from_address, received_at)) {
        datagrams_dropped_++;
        return false;
    }

    auto announce = PeerAnnouncement::from_json(payload);
    if (!announce) {
        datagrams_dropped_++;
        utilities::log_debug("Discovery: Dropping malformed datagram from " + from_address);
        return false;
    }

    // Ignore our own announcements
    if (announce->peer_id == peer_id_) {
        return false;
    }

    PeerRecord record;
    record.peer_id = announce->peer_id;
    record.address = from_address;
    record.transfer_port = announce->transfer_port;
    record.display_name = announce->display_name;
    record.sequence = announce->sequence;
    record.metrics = std::move(announce->metrics);

    registry_->upsert(record, received_at);
    return true;
}

std::string PeerDiscovery::generate_peer_id(const std::string& hostname) {
    return security::sanitize_identifier(hostname) + "-" + utilities::generate_random_string(8);
}

// ============================================================================
// Accessors / Statistics
// ============================================================================

uint16_t PeerDiscovery::get_local_port() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return local_port_;
}

uint64_t PeerDiscovery::get_announcements_sent() const {
    return announcements_sent_.load();
}

uint64_t PeerDiscovery::get_datagrams_received() const {
    return datagrams_received_.load();
}

uint64_t PeerDiscovery::get_datagrams_dropped() const {
    return datagrams_dropped_.load();
}

} // namespace meshpulse
