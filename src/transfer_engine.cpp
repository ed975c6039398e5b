/**
 * @file transfer_engine.cpp
 * @brief Implementation of the encrypted TCP file transfer engine
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshpulse/transfer_engine.hpp"
#include "meshpulse/utilities.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace meshpulse {

// ============================================================================
// Constructor and Destructor
// ============================================================================

TransferEngine::TransferEngine(
    asio::io_context& io_context,
    std::shared_ptr<PeerRegistry> registry,
    std::shared_ptr<EventSurface> events,
    const MasterKey& master_key,
    LocalIdentity local,
    TransferOptions options
)
    : io_context_(io_context)
    , registry_(std::move(registry))
    , events_(std::move(events))
    , master_key_(master_key)
    , local_(std::move(local))
    , options_(std::move(options))
    , acceptor_(io_context)
    , listen_port_(0)
    , connection_guard_(options_.connection_rate_per_second, options_.connection_burst)
    , sessions_(std::make_shared<SessionTable>())
    , running_(false)
{
    if (!registry_) {
        throw std::invalid_argument("TransferEngine: registry cannot be null");
    }
    if (!security::validate_identifier(local_.peer_id)) {
        throw std::invalid_argument("TransferEngine: invalid local peer ID");
    }
    if (options_.chunk_size < security::MIN_CHUNK_SIZE || options_.chunk_size > security::MAX_CHUNK_SIZE) {
        throw std::invalid_argument("TransferEngine: chunk size out of range");
    }
    settings_ = make_settings();
}

TransferEngine::~TransferEngine() {
    stop();
    TransferCrypto::secure_zero(master_key_.data(), master_key_.size());
}

TransferSettings TransferEngine::make_settings() const {
    TransferSettings settings;
    settings.chunk_size = options_.chunk_size;
    settings.max_file_size = options_.max_file_size;
    settings.handshake_timeout = options_.handshake_timeout;
    settings.stall_timeout = options_.stall_timeout;
    settings.progress_interval = options_.progress_interval;
    settings.retention = options_.retention;
    settings.receive_dir = options_.receive_dir;
    return settings;
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool TransferEngine::start() {
    if (running_.load()) {
        return true;
    }

    try {
        settings_.receive_dir = security::get_receive_directory(options_.receive_dir);
    } catch (const std::exception& e) {
        utilities::log_error("Transfer: Cannot prepare receive directory '" +
                             options_.receive_dir + "': " + e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(acceptor_mutex_);
        try {
            asio::ip::tcp::endpoint endpoint(asio::ip::make_address(options_.bind_address), options_.port);

            acceptor_.open(endpoint.protocol());
            acceptor_.set_option(asio::socket_base::reuse_address(true));
            acceptor_.bind(endpoint);
            acceptor_.listen(security::TRANSFER_BACKLOG);
            listen_port_ = acceptor_.local_endpoint().port();

        } catch (const std::exception& e) {
            utilities::log_error("Transfer: Failed to listen on TCP port " +
                                 std::to_string(options_.port) + ": " + e.what());
            asio::error_code ignored;
            acceptor_.close(ignored);
            return false;
        }

        running_.store(true);
    }

    start_accept();

    utilities::log_info("Transfer: Listening on TCP " + std::to_string(get_listen_port()) +
                        ", receiving into " + settings_.receive_dir.string());
    return true;
}

void TransferEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(acceptor_mutex_);
        asio::error_code ignored;
        acceptor_.close(ignored);
    }

    std::vector<std::shared_ptr<TransferHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(sessions_->mutex);
        for (const auto& [id, handler] : sessions_->handlers) {
            handlers.push_back(handler);
        }
    }
    for (const auto& handler : handlers) {
        handler->shutdown();
    }

    utilities::log_info("Transfer: Stopped (" + std::to_string(handlers.size()) + " sessions cancelled)");
}

bool TransferEngine::is_running() const {
    return running_.load();
}

uint16_t TransferEngine::get_listen_port() const {
    std::lock_guard<std::mutex> lock(acceptor_mutex_);
    return listen_port_;
}

// ============================================================================
// Accept Loop
// ============================================================================

void TransferEngine::start_accept() {
    std::lock_guard<std::mutex> lock(acceptor_mutex_);
    if (!running_.load() || !acceptor_.is_open()) {
        return;
    }

    // Each connection gets its own strand
    auto socket = std::make_shared<asio::ip::tcp::socket>(asio::make_strand(io_context_));

    acceptor_.async_accept(
        *socket,
        [this, socket](const asio::error_code& error) {
            handle_accept(error, socket);
        }
    );
}

void TransferEngine::handle_accept(
    const asio::error_code& error,
    std::shared_ptr<asio::ip::tcp::socket> socket
) {
    if (error == asio::error::operation_aborted || !running_.load()) {
        return;
    }

    if (error) {
        utilities::log_warn("Transfer: Accept failed: " + error.message());
    } else {
        try {
            asio::error_code endpoint_error;
            auto remote = socket->remote_endpoint(endpoint_error);
            std::string remote_address = endpoint_error ? "unknown" : remote.address().to_string();

            if (!connection_guard_.allow(remote_address)) {
                utilities::log_warn("Transfer: Connection rate exceeded by " + remote_address);
                asio::error_code ignored;
                socket->close(ignored);
            } else {
                std::string decline_reason;
                if (!options_.accept_inbound) {
                    decline_reason = "declined";
                } else if (count_active(TransferDirection::RECEIVE) >= options_.max_inbound_sessions) {
                    decline_reason = "receiver busy";
                }

                std::string session_id = utilities::generate_uuid();
                auto handler = std::make_shared<InboundTransfer>(
                    std::move(*socket),
                    session_id,
                    remote_address,
                    decline_reason,
                    master_key_,
                    settings_,
                    events_,
                    make_release_callback()
                );

                {
                    std::lock_guard<std::mutex> lock(sessions_->mutex);
                    sessions_->handlers[session_id] = handler;
                }
                handler->start();
            }
        } catch (const std::exception& e) {
            utilities::log_error("Transfer: Failed to set up inbound session: " + std::string(e.what()));
        }
    }

    // Continue accepting
    start_accept();
}

// ============================================================================
// Transfers
// ============================================================================

std::optional<std::string> TransferEngine::send_file(
    const std::string& peer_id,
    const std::string& file_path,
    const std::string& note
) {
    if (!running_.load()) {
        utilities::log_error("Transfer: Engine not running");
        return std::nullopt;
    }

    auto peer = registry_->lookup(peer_id);
    if (!peer) {
        utilities::log_warn("Transfer: Unknown peer " + peer_id);
        return std::nullopt;
    }

    std::error_code fs_error;
    std::filesystem::path path(file_path);
    if (!std::filesystem::is_regular_file(path, fs_error)) {
        utilities::log_error("Transfer: Not a regular file: " + file_path);
        return std::nullopt;
    }

    uint64_t file_size = std::filesystem::file_size(path, fs_error);
    if (fs_error) {
        utilities::log_error("Transfer: Cannot stat " + file_path + ": " + fs_error.message());
        return std::nullopt;
    }

    {
        std::ifstream readable(path, std::ios::binary);
        if (!readable.is_open()) {
            utilities::log_error("Transfer: Cannot read " + file_path);
            return std::nullopt;
        }
    }

    if (note.size() > security::MAX_NOTE_LENGTH) {
        utilities::log_error("Transfer: Note exceeds " + std::to_string(security::MAX_NOTE_LENGTH) + " bytes");
        return std::nullopt;
    }

    uint64_t chunk_count = (file_size + options_.chunk_size - 1) / options_.chunk_size;
    if (chunk_count > security::MAX_CHUNKS) {
        utilities::log_error("Transfer: " + file_path + " is too large for one session");
        return std::nullopt;
    }

    std::filesystem::path canonical = std::filesystem::weakly_canonical(path, fs_error);
    if (fs_error) {
        canonical = std::filesystem::absolute(path);
    }

    std::string session_id = utilities::generate_uuid();
    std::shared_ptr<OutboundTransfer> handler;

    {
        std::lock_guard<std::mutex> lock(sessions_->mutex);

        for (const auto& [id, existing] : sessions_->handlers) {
            auto snapshot = existing->get_snapshot();
            if (snapshot.direction == TransferDirection::SEND &&
                !is_terminal_state(snapshot.state) &&
                snapshot.peer_id == peer_id &&
                snapshot.local_path == canonical.string()) {
                utilities::log_warn("Transfer: " + canonical.filename().string() +
                                    " is already being sent to " + peer_id + " (session " + id + ")");
                return std::nullopt;
            }
        }

        try {
            handler = std::make_shared<OutboundTransfer>(
                io_context_,
                session_id,
                *peer,
                canonical,
                file_size,
                note,
                local_,
                master_key_,
                settings_,
                events_,
                make_release_callback()
            );
        } catch (const std::exception& e) {
            utilities::log_error("Transfer: Cannot start session to " + peer_id + ": " + e.what());
            return std::nullopt;
        }

        sessions_->handlers[session_id] = handler;
    }

    utilities::log_info("Transfer: " + session_id + " sending " + canonical.filename().string() +
                        " (" + utilities::format_file_size(file_size) + ") to " +
                        peer->display_name + " @ " + peer->address + ":" +
                        std::to_string(peer->transfer_port));
    handler->start();
    return session_id;
}

bool TransferEngine::cancel(const std::string& session_id) {
    std::shared_ptr<TransferHandler> handler;
    {
        std::lock_guard<std::mutex> lock(sessions_->mutex);
        auto it = sessions_->handlers.find(session_id);
        if (it == sessions_->handlers.end()) {
            return false;
        }
        handler = it->second;
    }

    if (is_terminal_state(handler->get_snapshot().state)) {
        return false;
    }

    handler->cancel();
    return true;
}

std::optional<TransferSnapshot> TransferEngine::get_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_->mutex);
    auto it = sessions_->handlers.find(session_id);
    if (it == sessions_->handlers.end()) {
        return std::nullopt;
    }
    return it->second->get_snapshot();
}

std::vector<TransferSnapshot> TransferEngine::get_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_->mutex);
    std::vector<TransferSnapshot> snapshots;
    snapshots.reserve(sessions_->handlers.size());
    for (const auto& [id, handler] : sessions_->handlers) {
        snapshots.push_back(handler->get_snapshot());
    }
    return snapshots;
}

size_t TransferEngine::get_active_session_count() const {
    std::lock_guard<std::mutex> lock(sessions_->mutex);
    size_t active = 0;
    for (const auto& [id, handler] : sessions_->handlers) {
        if (!is_terminal_state(handler->get_snapshot().state)) {
            active++;
        }
    }
    return active;
}

size_t TransferEngine::count_active(TransferDirection direction) const {
    std::lock_guard<std::mutex> lock(sessions_->mutex);
    size_t active = 0;
    for (const auto& [id, handler] : sessions_->handlers) {
        auto snapshot = handler->get_snapshot();
        if (snapshot.direction == direction && !is_terminal_state(snapshot.state)) {
            active++;
        }
    }
    return active;
}

SessionReleaseCallback TransferEngine::make_release_callback() const {
    std::weak_ptr<SessionTable> table = sessions_;
    return [table](const std::string& session_id) {
        if (auto sessions = table.lock()) {
            std::lock_guard<std::mutex> lock(sessions->mutex);
            sessions->handlers.erase(session_id);
        }
    };
}

} // namespace meshpulse
