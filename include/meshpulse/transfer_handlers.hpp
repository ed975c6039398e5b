/**
 * @file transfer_handlers.hpp
 * @brief Per-connection transfer protocol handlers
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * One handler drives one TCP connection through handshake, chunk
 * streaming and completion. Every handler runs on its own strand; its
 * socket, deadline timer, state machine and file handles are only touched
 * from that strand. Snapshots are copied out under a mutex for other
 * threads.
 */

#pragma once

#include "meshpulse/event_surface.hpp"
#include "meshpulse/message_types.hpp"
#include "meshpulse/peer_record.hpp"
#include "meshpulse/transfer_crypto.hpp"
#include "meshpulse/transfer_session.hpp"
#include "meshpulse/utilities.hpp"

#include <asio.hpp>
#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshpulse {

/**
 * @brief Tunables shared by all handlers of an engine
 */
struct TransferSettings {
    uint32_t chunk_size = static_cast<uint32_t>(security::CHUNK_SIZE);
    uint64_t max_file_size = security::MAX_FILE_SIZE;
    std::chrono::milliseconds handshake_timeout = security::HANDSHAKE_TIMEOUT;
    std::chrono::milliseconds stall_timeout = security::STALL_TIMEOUT;
    std::chrono::milliseconds progress_interval = security::PROGRESS_INTERVAL;
    std::chrono::milliseconds retention = security::SESSION_RETENTION;
    std::filesystem::path receive_dir = security::DEFAULT_RECEIVE_DIR;
};

/**
 * @brief This node as named in transfer headers
 */
struct LocalIdentity {
    std::string peer_id;
    std::string display_name;
};

/// Called once a terminal session's retention period has elapsed
using SessionReleaseCallback = std::function<void(const std::string& session_id)>;

/**
 * @brief TransferHandler - shared connection plumbing
 */
class TransferHandler : public std::enable_shared_from_this<TransferHandler> {
public:
    virtual ~TransferHandler();

    // Disable copy and move
    TransferHandler(const TransferHandler&) = delete;
    TransferHandler& operator=(const TransferHandler&) = delete;
    TransferHandler(TransferHandler&&) = delete;
    TransferHandler& operator=(TransferHandler&&) = delete;

    /**
     * @brief Begin the protocol on the handler's strand
     */
    void start();

    /**
     * @brief Request cancellation (asynchronous, on the handler's strand)
     *
     * Has effect in HANDSHAKING or TRANSFERRING. A request that arrives
     * before the handler has started is applied when it starts.
     */
    void cancel();

    /**
     * @brief Cancel for engine shutdown
     *
     * Like cancel(), but the session is released at once instead of after
     * the retention period, so no timer outlives the engine.
     */
    void shutdown();

    /**
     * @brief Copy of the current session state
     */
    TransferSnapshot get_snapshot() const;

    const std::string& get_session_id() const { return session_id_; }

protected:
    using FrameHandler = std::function<void(FrameType type, std::vector<uint8_t> payload)>;
    using WriteHandler = std::function<void()>;

    TransferHandler(
        asio::ip::tcp::socket socket,
        std::string session_id,
        TransferDirection direction,
        const MasterKey& master_key,
        const TransferSettings& settings,
        std::shared_ptr<EventSurface> events,
        SessionReleaseCallback release
    );

    /// Entry point on the strand
    virtual void run() = 0;

    /// Release per-direction resources once a terminal state is reached
    virtual void on_terminal(TransferState state) = 0;

    /// Write failures end the session unless a subclass knows better
    virtual void on_write_error(const asio::error_code& error);

    // ========================================================================
    // Protocol plumbing (strand only)
    // ========================================================================

    void read_frame(FrameHandler handler);
    void write_frame(std::vector<uint8_t> frame, WriteHandler handler);

    /// Write a frame and continue whether or not it was delivered
    void write_last_frame(std::vector<uint8_t> frame, WriteHandler handler);

    /// Fail with error (TIMEOUT unless stated) if the deadline passes first
    void arm_deadline(std::chrono::milliseconds timeout, const std::string& what,
                      TransferError error = TransferError::TIMEOUT);
    void disarm_deadline();

    bool begin_handshake();
    bool begin_transferring();
    void complete();
    void fail(TransferError error, const std::string& detail);
    void report_progress(uint64_t bytes_transferred);
    bool is_finished() const { return machine_.is_terminal(); }

    void establish_crypto(const SessionSeed& seed);

    template <typename Fn>
    void update_snapshot(Fn&& fn) {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        fn(snapshot_);
    }

    void publish(TransferEventType type);

    asio::ip::tcp::socket socket_;
    asio::steady_timer deadline_;
    const std::string session_id_;
    const TransferSettings settings_;
    MasterKey master_key_;
    std::unique_ptr<CryptoContext> crypto_;
    std::shared_ptr<EventSurface> events_;

    /// Chunk size agreed in the handshake
    uint32_t chunk_size_;

private:
    void handle_cancel();
    void finish(TransferState state, TransferError error, const std::string& detail);
    void on_read_error(const asio::error_code& error);
    void close_socket();
    void schedule_release();

    TransferStateMachine machine_;
    ProgressThrottle throttle_;
    SessionReleaseCallback release_;
    uint64_t deadline_generation_;
    bool cancel_pending_;
    bool shutting_down_;
    bool started_published_;

    std::array<uint8_t, FRAME_PREFIX_SIZE> read_prefix_;
    std::vector<uint8_t> read_payload_;
    std::vector<uint8_t> write_buffer_;

    TransferSnapshot snapshot_;
    mutable std::mutex snapshot_mutex_;
};

/**
 * @brief OutboundTransfer - connect, offer, stream and await the verdict
 */
class OutboundTransfer : public TransferHandler {
public:
    /**
     * @brief Construct an outbound transfer
     * @param io_context ASIO I/O context (a new strand is created on it)
     * @param session_id Session identifier
     * @param peer Target peer as resolved from the registry
     * @param file_path Source file
     * @param file_size Size of the source file when the request was made
     * @param note Optional text carried in the header
     * @param local This node's identity
     * @param master_key Key derived from the shared secret
     * @param settings Engine tunables
     * @param events Event surface for progress
     * @param release Retention expiry callback
     */
    OutboundTransfer(
        asio::io_context& io_context,
        std::string session_id,
        const PeerRecord& peer,
        std::filesystem::path file_path,
        uint64_t file_size,
        std::string note,
        LocalIdentity local,
        const MasterKey& master_key,
        const TransferSettings& settings,
        std::shared_ptr<EventSurface> events,
        SessionReleaseCallback release
    );

    ~OutboundTransfer() override = default;

protected:
    void run() override;
    void on_terminal(TransferState state) override;
    void on_write_error(const asio::error_code& error) override;

private:
    void send_header();
    void handle_reply(FrameType type, std::vector<uint8_t> payload);
    void await_result();
    void handle_result(FrameType type, std::vector<uint8_t> payload);
    void send_next_chunk();
    void send_end_of_stream();

    asio::ip::tcp::endpoint endpoint_;
    std::filesystem::path file_path_;
    uint64_t file_size_;
    std::string note_;
    LocalIdentity local_;
    SessionSeed seed_;

    std::ifstream source_;
    std::vector<uint8_t> chunk_buffer_;
    std::unique_ptr<utilities::Sha256Hasher> hasher_;
    uint64_t bytes_sent_;
    uint32_t next_index_;
    bool end_sent_;
    bool awaiting_result_;
};

/**
 * @brief InboundTransfer - validate, receive, verify and place the file
 */
class InboundTransfer : public TransferHandler {
public:
    /**
     * @brief Construct an inbound transfer on an accepted socket
     * @param socket Accepted connection (its executor must be a strand)
     * @param session_id Session identifier
     * @param remote_address Address of the connecting peer
     * @param decline_reason Non-empty to reject the handshake with this reason
     * @param master_key Key derived from the shared secret
     * @param settings Engine tunables
     * @param events Event surface for progress
     * @param release Retention expiry callback
     */
    InboundTransfer(
        asio::ip::tcp::socket socket,
        std::string session_id,
        std::string remote_address,
        std::string decline_reason,
        const MasterKey& master_key,
        const TransferSettings& settings,
        std::shared_ptr<EventSurface> events,
        SessionReleaseCallback release
    );

    ~InboundTransfer() override;

protected:
    void run() override;
    void on_terminal(TransferState state) override;

private:
    void handle_header(FrameType type, std::vector<uint8_t> payload);
    void reject(TransferError error, const std::string& reason);
    void read_next();
    void handle_stream_frame(FrameType type, std::vector<uint8_t> payload);
    void handle_chunk(std::vector<uint8_t> payload);
    void handle_end_of_stream(std::vector<uint8_t> payload);
    void fail_with_result(TransferError error, const std::string& detail);
    void discard_partial();

    std::string remote_address_;
    std::string decline_reason_;

    TransferHeader header_;
    std::string file_name_;
    std::filesystem::path part_path_;
    std::ofstream part_file_;
    std::unique_ptr<utilities::Sha256Hasher> hasher_;
    uint64_t bytes_received_;
    uint32_t expected_index_;
    bool placed_;
};

} // namespace meshpulse
