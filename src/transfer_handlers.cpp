/**
 * @file transfer_handlers.cpp
 * @brief Implementation of the transfer protocol handlers
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Frame sequence on one connection:
 *   sender   -> HEADER
 *   receiver -> HANDSHAKE_REPLY
 *   sender   -> CHUNK x N, END_OF_STREAM
 *   receiver -> RESULT
 */

#include "meshpulse/transfer_handlers.hpp"
#include "meshpulse/security_config.hpp"

#include <algorithm>
#include <stdexcept>

namespace meshpulse {

namespace {
    // Serializes final placement so concurrent receives never pick the same name
    std::mutex g_placement_mutex;

    // Time allowed for the receiver's verdict to arrive after a failed write
    constexpr auto WRITE_FAILURE_GRACE = std::chrono::milliseconds(2000);

    std::string payload_string(const std::vector<uint8_t>& payload) {
        return std::string(payload.begin(), payload.end());
    }
}

// ============================================================================
// TransferHandler
// ============================================================================

TransferHandler::TransferHandler(
    asio::ip::tcp::socket socket,
    std::string session_id,
    TransferDirection direction,
    const MasterKey& master_key,
    const TransferSettings& settings,
    std::shared_ptr<EventSurface> events,
    SessionReleaseCallback release
)
    : socket_(std::move(socket))
    , deadline_(socket_.get_executor())
    , session_id_(std::move(session_id))
    , settings_(settings)
    , master_key_(master_key)
    , events_(std::move(events))
    , chunk_size_(settings.chunk_size)
    , throttle_(settings.progress_interval)
    , release_(std::move(release))
    , deadline_generation_(0)
    , cancel_pending_(false)
    , shutting_down_(false)
    , started_published_(false)
{
    auto now = std::chrono::steady_clock::now();
    snapshot_.session_id = session_id_;
    snapshot_.direction = direction;
    snapshot_.start_time = now;
    snapshot_.last_update = now;
}

TransferHandler::~TransferHandler() {
    TransferCrypto::secure_zero(master_key_.data(), master_key_.size());
}

void TransferHandler::start() {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self]() {
        if (cancel_pending_) {
            begin_handshake();
            handle_cancel();
            return;
        }
        try {
            run();
        } catch (const std::exception& e) {
            fail(TransferError::PROTOCOL_ERROR, std::string("internal error: ") + e.what());
        }
    });
}

void TransferHandler::cancel() {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self]() {
        handle_cancel();
    });
}

void TransferHandler::shutdown() {
    auto self = shared_from_this();
    asio::post(socket_.get_executor(), [this, self]() {
        shutting_down_ = true;
        handle_cancel();
        if (is_finished()) {
            // Cut short a pending retention wait
            deadline_.cancel();
        }
    });
}

TransferSnapshot TransferHandler::get_snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

void TransferHandler::handle_cancel() {
    if (machine_.get_state() == TransferState::INIT) {
        cancel_pending_ = true;
        return;
    }
    if (!TransferStateMachine::can_transition(machine_.get_state(), TransferState::CANCELLED)) {
        return;
    }
    finish(TransferState::CANCELLED, TransferError::NONE, "cancelled");
}

// ============================================================================
// State transitions
// ============================================================================

bool TransferHandler::begin_handshake() {
    if (!machine_.transition(TransferState::HANDSHAKING)) {
        return false;
    }
    update_snapshot([](TransferSnapshot& s) {
        s.state = TransferState::HANDSHAKING;
    });
    return true;
}

bool TransferHandler::begin_transferring() {
    if (!machine_.transition(TransferState::TRANSFERRING)) {
        return false;
    }
    disarm_deadline();

    auto now = std::chrono::steady_clock::now();
    update_snapshot([now](TransferSnapshot& s) {
        s.state = TransferState::TRANSFERRING;
        s.start_time = now;
        s.last_update = now;
    });
    return true;
}

void TransferHandler::complete() {
    uint64_t total = 0;
    update_snapshot([&total](TransferSnapshot& s) { total = s.total_bytes; });
    report_progress(total);
    finish(TransferState::COMPLETE, TransferError::NONE, "");
}

void TransferHandler::fail(TransferError error, const std::string& detail) {
    finish(TransferState::FAILED, error, detail);
}

void TransferHandler::finish(TransferState state, TransferError error, const std::string& detail) {
    if (!machine_.transition(state)) {
        return;
    }

    // Sessions that end before their header is read still open with STARTED
    if (!started_published_) {
        publish(TransferEventType::STARTED);
    }

    disarm_deadline();
    close_socket();
    on_terminal(state);

    auto now = std::chrono::steady_clock::now();
    TransferSnapshot final_snapshot;
    update_snapshot([&](TransferSnapshot& s) {
        s.state = state;
        s.error = error;
        s.error_detail = detail;
        s.finish_time = now;
        final_snapshot = s;
    });

    const std::string label = "Transfer: " + session_id_ + " (" +
        transfer_direction_to_string(final_snapshot.direction) + " " +
        final_snapshot.file_name + ")";

    switch (state) {
        case TransferState::COMPLETE:
            utilities::log_info(label + " complete, " +
                utilities::format_file_size(final_snapshot.bytes_transferred) + " at " +
                utilities::format_rate(final_snapshot.average_rate_bps));
            publish(TransferEventType::COMPLETED);
            break;
        case TransferState::FAILED:
            utilities::log_warn(label + " failed [" + transfer_error_to_string(error) + "]: " + detail);
            publish(TransferEventType::FAILED);
            break;
        case TransferState::CANCELLED:
            utilities::log_info(label + " cancelled");
            publish(TransferEventType::CANCELLED);
            break;
        default:
            break;
    }

    schedule_release();
}

void TransferHandler::schedule_release() {
    if (!release_) {
        return;
    }

    auto self = shared_from_this();
    if (settings_.retention.count() <= 0 || shutting_down_) {
        asio::post(socket_.get_executor(), [this, self]() { release_(session_id_); });
        return;
    }

    deadline_.expires_after(settings_.retention);
    deadline_.async_wait([this, self](const asio::error_code&) {
        release_(session_id_);
    });
}

// ============================================================================
// Progress / Events
// ============================================================================

void TransferHandler::report_progress(uint64_t bytes_transferred) {
    auto now = std::chrono::steady_clock::now();
    uint64_t total = 0;
    update_snapshot([&](TransferSnapshot& s) {
        s.update_transfer_rates(bytes_transferred, now);
        total = s.total_bytes;
    });

    if (throttle_.should_emit(bytes_transferred, total, now)) {
        publish(TransferEventType::PROGRESS);
    }
}

void TransferHandler::publish(TransferEventType type) {
    if (type == TransferEventType::STARTED) {
        if (started_published_) {
            return;
        }
        started_published_ = true;
    }
    if (!events_) {
        return;
    }
    events_->publish(TransferEvent{type, get_snapshot()});
}

// ============================================================================
// Deadlines
// ============================================================================

void TransferHandler::arm_deadline(std::chrono::milliseconds timeout, const std::string& what,
                                   TransferError error) {
    auto generation = ++deadline_generation_;
    auto self = shared_from_this();

    deadline_.expires_after(timeout);
    deadline_.async_wait([this, self, generation, what, error](const asio::error_code& ec) {
        if (ec || generation != deadline_generation_ || is_finished()) {
            return;
        }
        fail(error, what + (error == TransferError::TIMEOUT ? " timed out" : ""));
    });
}

void TransferHandler::disarm_deadline() {
    ++deadline_generation_;
    deadline_.cancel();
}

// ============================================================================
// Frame I/O
// ============================================================================

void TransferHandler::read_frame(FrameHandler handler) {
    auto self = shared_from_this();

    asio::async_read(socket_, asio::buffer(read_prefix_),
        [this, self, handler](const asio::error_code& error, size_t) {
            if (is_finished()) {
                return;
            }
            if (error) {
                on_read_error(error);
                return;
            }

            auto prefix = FrameCodec::decode_prefix(read_prefix_.data(), chunk_size_);
            if (!prefix) {
                fail(TransferError::PROTOCOL_ERROR, "invalid or oversized frame");
                return;
            }

            FrameType type = prefix->type;
            read_payload_.assign(prefix->length, 0);

            asio::async_read(socket_, asio::buffer(read_payload_),
                [this, self, handler, type](const asio::error_code& error, size_t) {
                    if (is_finished()) {
                        return;
                    }
                    if (error) {
                        on_read_error(error);
                        return;
                    }

                    try {
                        handler(type, std::move(read_payload_));
                    } catch (const std::exception& e) {
                        fail(TransferError::PROTOCOL_ERROR, std::string("internal error: ") + e.what());
                    }
                });
        });
}

void TransferHandler::write_frame(std::vector<uint8_t> frame, WriteHandler handler) {
    auto self = shared_from_this();
    write_buffer_ = std::move(frame);

    asio::async_write(socket_, asio::buffer(write_buffer_),
        [this, self, handler](const asio::error_code& error, size_t) {
            if (is_finished()) {
                return;
            }
            if (error) {
                on_write_error(error);
                return;
            }

            try {
                handler();
            } catch (const std::exception& e) {
                fail(TransferError::PROTOCOL_ERROR, std::string("internal error: ") + e.what());
            }
        });
}

void TransferHandler::write_last_frame(std::vector<uint8_t> frame, WriteHandler handler) {
    auto self = shared_from_this();
    write_buffer_ = std::move(frame);

    asio::async_write(socket_, asio::buffer(write_buffer_),
        [this, self, handler](const asio::error_code& error, size_t) {
            if (is_finished()) {
                return;
            }
            if (error) {
                utilities::log_debug("Transfer: " + session_id_ + " final frame not delivered: " +
                                     error.message());
            }

            try {
                handler();
            } catch (const std::exception& e) {
                fail(TransferError::PROTOCOL_ERROR, std::string("internal error: ") + e.what());
            }
        });
}

void TransferHandler::on_read_error(const asio::error_code& error) {
    if (error == asio::error::eof) {
        fail(TransferError::CONNECTION_ERROR, "connection closed by peer");
    } else {
        fail(TransferError::CONNECTION_ERROR, error.message());
    }
}

void TransferHandler::on_write_error(const asio::error_code& error) {
    fail(TransferError::CONNECTION_ERROR, error.message());
}

void TransferHandler::close_socket() {
    asio::error_code ignored;
    if (socket_.is_open()) {
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

void TransferHandler::establish_crypto(const SessionSeed& seed) {
    crypto_ = std::make_unique<CryptoContext>(master_key_, seed);
}

// ============================================================================
// OutboundTransfer
// ============================================================================

OutboundTransfer::OutboundTransfer(
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
)
    : TransferHandler(
        asio::ip::tcp::socket(asio::make_strand(io_context)),
        std::move(session_id),
        TransferDirection::SEND,
        master_key,
        settings,
        std::move(events),
        std::move(release))
    , endpoint_(asio::ip::make_address(peer.address), peer.transfer_port)
    , file_path_(std::move(file_path))
    , file_size_(file_size)
    , note_(std::move(note))
    , local_(std::move(local))
    , seed_{}
    , bytes_sent_(0)
    , next_index_(0)
    , end_sent_(false)
    , awaiting_result_(false)
{
    update_snapshot([&](TransferSnapshot& s) {
        s.peer_id = peer.peer_id;
        s.peer_name = peer.display_name;
        s.file_name = file_path_.filename().string();
        s.local_path = file_path_.string();
        s.note = note_;
        s.total_bytes = file_size_;
    });
}

void OutboundTransfer::run() {
    if (!begin_handshake()) {
        return;
    }
    publish(TransferEventType::STARTED);

    source_.open(file_path_, std::ios::binary);
    if (!source_.is_open()) {
        fail(TransferError::FILE_ERROR, "cannot open " + file_path_.string());
        return;
    }
    hasher_ = std::make_unique<utilities::Sha256Hasher>();

    // One deadline covers connect, header and reply
    arm_deadline(settings_.handshake_timeout, "handshake");

    auto self = shared_from_this();
    socket_.async_connect(endpoint_, [this, self](const asio::error_code& error) {
        if (is_finished()) {
            return;
        }
        if (error) {
            fail(TransferError::CONNECTION_ERROR,
                 "connect to " + endpoint_.address().to_string() + ":" +
                 std::to_string(endpoint_.port()) + " failed: " + error.message());
            return;
        }
        send_header();
    });
}

void OutboundTransfer::send_header() {
    seed_ = TransferCrypto::generate_session_seed();

    TransferHeader header;
    header.file_name = file_path_.filename().string();
    header.file_size = file_size_;
    header.chunk_size = chunk_size_;
    header.seed = seed_;
    header.sender_id = local_.peer_id;
    header.sender_name = local_.display_name;
    header.note = note_;

    write_frame(FrameCodec::encode(FrameType::HEADER, header.to_json()), [this]() {
        read_frame([this](FrameType type, std::vector<uint8_t> payload) {
            handle_reply(type, std::move(payload));
        });
    });
}

void OutboundTransfer::handle_reply(FrameType type, std::vector<uint8_t> payload) {
    if (type != FrameType::HANDSHAKE_REPLY) {
        fail(TransferError::PROTOCOL_ERROR,
             "expected HANDSHAKE_REPLY, got " + FrameCodec::frame_type_to_string(type));
        return;
    }

    auto reply = HandshakeReply::from_json(payload_string(payload));
    if (!reply) {
        fail(TransferError::PROTOCOL_ERROR, "malformed handshake reply");
        return;
    }

    if (!reply->accepted) {
        TransferError error = reply->reason.rfind("version mismatch", 0) == 0
            ? TransferError::VERSION_MISMATCH
            : TransferError::REJECTED;
        fail(error, "rejected by peer: " + reply->reason);
        return;
    }

    if (!begin_transferring()) {
        return;
    }

    establish_crypto(seed_);
    chunk_buffer_.resize(chunk_size_);

    // The receiver may report a failure at any point while we stream
    await_result();
    send_next_chunk();
}

void OutboundTransfer::await_result() {
    awaiting_result_ = true;
    read_frame([this](FrameType type, std::vector<uint8_t> payload) {
        handle_result(type, std::move(payload));
    });
}

void OutboundTransfer::handle_result(FrameType type, std::vector<uint8_t> payload) {
    if (type != FrameType::RESULT) {
        fail(TransferError::PROTOCOL_ERROR,
             "expected RESULT, got " + FrameCodec::frame_type_to_string(type));
        return;
    }

    auto result = TransferResult::from_json(payload_string(payload));
    if (!result) {
        fail(TransferError::PROTOCOL_ERROR, "malformed result");
        return;
    }

    if (result->ok) {
        if (!end_sent_) {
            fail(TransferError::PROTOCOL_ERROR, "receiver reported success before end of stream");
            return;
        }
        complete();
        return;
    }

    TransferError error = string_to_transfer_error(result->error).value_or(TransferError::PROTOCOL_ERROR);
    if (error == TransferError::NONE) {
        error = TransferError::PROTOCOL_ERROR;
    }
    fail(error, "receiver reported: " + result->detail);
}

void OutboundTransfer::send_next_chunk() {
    if (bytes_sent_ >= file_size_) {
        send_end_of_stream();
        return;
    }

    const size_t to_read = static_cast<size_t>(
        std::min<uint64_t>(chunk_size_, file_size_ - bytes_sent_));

    source_.read(reinterpret_cast<char*>(chunk_buffer_.data()), static_cast<std::streamsize>(to_read));
    if (static_cast<size_t>(source_.gcount()) != to_read) {
        fail(TransferError::FILE_ERROR, "short read from " + file_path_.string() +
             " (file changed during transfer?)");
        return;
    }

    hasher_->update(chunk_buffer_.data(), to_read);

    auto sealed = crypto_->seal(next_index_, chunk_buffer_.data(), to_read);
    if (!sealed) {
        fail(TransferError::PROTOCOL_ERROR, "failed to seal chunk " + std::to_string(next_index_));
        return;
    }

    arm_deadline(settings_.stall_timeout, "chunk write");
    write_frame(FrameCodec::encode_chunk(next_index_, *sealed), [this, to_read]() {
        bytes_sent_ += to_read;
        ++next_index_;
        report_progress(bytes_sent_);
        send_next_chunk();
    });
}

void OutboundTransfer::send_end_of_stream() {
    EndOfStream end;
    end.chunk_count = next_index_;
    end.total_bytes = bytes_sent_;
    end.sha256 = hasher_->finish();

    // Set before writing: the verdict may be dispatched before our write completion
    end_sent_ = true;

    arm_deadline(settings_.stall_timeout, "end of stream write");
    write_frame(FrameCodec::encode(FrameType::END_OF_STREAM, end.to_json()), [this]() {
        arm_deadline(settings_.stall_timeout, "waiting for result");
    });
}

void OutboundTransfer::on_write_error(const asio::error_code& error) {
    if (!awaiting_result_) {
        TransferHandler::on_write_error(error);
        return;
    }

    // A receiver that fails sends RESULT before closing; let the pending read report it
    utilities::log_debug("Transfer: " + session_id_ + " write failed (" + error.message() +
                         "), waiting for receiver verdict");
    arm_deadline(std::min<std::chrono::milliseconds>(settings_.stall_timeout, WRITE_FAILURE_GRACE),
                 error.message(), TransferError::CONNECTION_ERROR);
}

void OutboundTransfer::on_terminal(TransferState) {
    if (source_.is_open()) {
        source_.close();
    }
    crypto_.reset();
}

// ============================================================================
// InboundTransfer
// ============================================================================

InboundTransfer::InboundTransfer(
    asio::ip::tcp::socket socket,
    std::string session_id,
    std::string remote_address,
    std::string decline_reason,
    const MasterKey& master_key,
    const TransferSettings& settings,
    std::shared_ptr<EventSurface> events,
    SessionReleaseCallback release
)
    : TransferHandler(
        std::move(socket),
        std::move(session_id),
        TransferDirection::RECEIVE,
        master_key,
        settings,
        std::move(events),
        std::move(release))
    , remote_address_(std::move(remote_address))
    , decline_reason_(std::move(decline_reason))
    , bytes_received_(0)
    , expected_index_(0)
    , placed_(false)
{
}

InboundTransfer::~InboundTransfer() {
    if (!placed_) {
        discard_partial();
    }
}

void InboundTransfer::run() {
    if (!begin_handshake()) {
        return;
    }

    utilities::log_debug("Transfer: " + session_id_ + " inbound connection from " + remote_address_);

    arm_deadline(settings_.handshake_timeout, "handshake");
    read_frame([this](FrameType type, std::vector<uint8_t> payload) {
        handle_header(type, std::move(payload));
    });
}

void InboundTransfer::handle_header(FrameType type, std::vector<uint8_t> payload) {
    if (type != FrameType::HEADER) {
        fail(TransferError::PROTOCOL_ERROR,
             "expected HEADER, got " + FrameCodec::frame_type_to_string(type));
        return;
    }

    auto header = TransferHeader::from_json(payload_string(payload));
    if (!header) {
        reject(TransferError::PROTOCOL_ERROR, "malformed header");
        return;
    }

    header_ = std::move(*header);
    file_name_ = security::sanitize_filename(header_.file_name);

    update_snapshot([this](TransferSnapshot& s) {
        s.peer_id = header_.sender_id;
        s.peer_name = header_.sender_name;
        s.file_name = file_name_;
        s.note = header_.note;
        s.total_bytes = header_.file_size;
    });
    publish(TransferEventType::STARTED);

    if (header_.version != security::PROTOCOL_VERSION) {
        reject(TransferError::VERSION_MISMATCH,
               "version mismatch: expected " + std::to_string(security::PROTOCOL_VERSION) +
               ", got " + std::to_string(header_.version));
        return;
    }

    if (!security::validate_identifier(header_.sender_id) ||
        !security::validate_display_name(header_.sender_name) ||
        header_.note.size() > security::MAX_NOTE_LENGTH ||
        header_.file_name.empty()) {
        reject(TransferError::PROTOCOL_ERROR, "malformed header");
        return;
    }

    if (!decline_reason_.empty()) {
        reject(TransferError::REJECTED, decline_reason_);
        return;
    }

    if (header_.chunk_size < security::MIN_CHUNK_SIZE ||
        header_.chunk_size > security::MAX_CHUNK_SIZE) {
        reject(TransferError::REJECTED, "unsupported chunk size " + std::to_string(header_.chunk_size));
        return;
    }

    if (header_.file_size > settings_.max_file_size) {
        reject(TransferError::REJECTED, "file too large (" +
               utilities::format_file_size(header_.file_size) + ")");
        return;
    }

    uint64_t chunk_count = (header_.file_size + header_.chunk_size - 1) / header_.chunk_size;
    if (chunk_count > security::MAX_CHUNKS) {
        reject(TransferError::REJECTED, "too many chunks");
        return;
    }

    part_path_ = settings_.receive_dir / ("." + session_id_ + security::PARTIAL_SUFFIX);
    part_file_.open(part_path_, std::ios::binary | std::ios::trunc);
    if (!part_file_.is_open()) {
        part_path_.clear();
        reject(TransferError::FILE_ERROR, "cannot create output file");
        return;
    }

    hasher_ = std::make_unique<utilities::Sha256Hasher>();
    chunk_size_ = header_.chunk_size;
    establish_crypto(header_.seed);

    HandshakeReply reply;
    reply.accepted = true;
    write_frame(FrameCodec::encode(FrameType::HANDSHAKE_REPLY, reply.to_json()), [this]() {
        if (!begin_transferring()) {
            return;
        }
        utilities::log_info("Transfer: " + session_id_ + " receiving " + file_name_ + " (" +
                            utilities::format_file_size(header_.file_size) + ") from " +
                            header_.sender_name);
        read_next();
    });
}

void InboundTransfer::reject(TransferError error, const std::string& reason) {
    HandshakeReply reply;
    reply.accepted = false;
    reply.reason = reason;

    write_last_frame(FrameCodec::encode(FrameType::HANDSHAKE_REPLY, reply.to_json()),
        [this, error, reason]() {
            fail(error, "rejected: " + reason);
        });
}

void InboundTransfer::read_next() {
    arm_deadline(settings_.stall_timeout, "chunk read");
    read_frame([this](FrameType type, std::vector<uint8_t> payload) {
        handle_stream_frame(type, std::move(payload));
    });
}

void InboundTransfer::handle_stream_frame(FrameType type, std::vector<uint8_t> payload) {
    switch (type) {
        case FrameType::CHUNK:
            handle_chunk(std::move(payload));
            break;
        case FrameType::END_OF_STREAM:
            handle_end_of_stream(std::move(payload));
            break;
        default:
            fail_with_result(TransferError::PROTOCOL_ERROR,
                             "unexpected " + FrameCodec::frame_type_to_string(type) + " frame");
            break;
    }
}

void InboundTransfer::handle_chunk(std::vector<uint8_t> payload) {
    auto chunk = FrameCodec::decode_chunk(payload);
    if (!chunk) {
        fail_with_result(TransferError::PROTOCOL_ERROR, "malformed chunk");
        return;
    }

    if (chunk->index != expected_index_) {
        fail_with_result(TransferError::PROTOCOL_ERROR,
                         "chunk " + std::to_string(chunk->index) + " out of order, expected " +
                         std::to_string(expected_index_));
        return;
    }

    const size_t size = chunk->ciphertext.size();
    if (size == 0 || size > chunk_size_) {
        fail_with_result(TransferError::PROTOCOL_ERROR, "invalid chunk length " + std::to_string(size));
        return;
    }

    if (bytes_received_ + size > header_.file_size) {
        fail_with_result(TransferError::SIZE_MISMATCH,
                         "received more than the declared " + std::to_string(header_.file_size) + " bytes");
        return;
    }

    auto plaintext = crypto_->open(chunk->index, chunk->ciphertext.data(), size, chunk->tag);
    if (!plaintext) {
        fail_with_result(TransferError::INTEGRITY_FAILURE,
                         "chunk " + std::to_string(chunk->index) + " failed authentication");
        return;
    }

    part_file_.write(reinterpret_cast<const char*>(plaintext->data()),
                     static_cast<std::streamsize>(plaintext->size()));
    if (!part_file_) {
        fail_with_result(TransferError::FILE_ERROR, "write to " + part_path_.string() + " failed");
        return;
    }

    hasher_->update(plaintext->data(), plaintext->size());
    bytes_received_ += size;
    ++expected_index_;

    report_progress(bytes_received_);
    read_next();
}

void InboundTransfer::handle_end_of_stream(std::vector<uint8_t> payload) {
    auto end = EndOfStream::from_json(payload_string(payload));
    if (!end) {
        fail_with_result(TransferError::PROTOCOL_ERROR, "malformed end of stream");
        return;
    }

    if (bytes_received_ != header_.file_size || end->total_bytes != bytes_received_) {
        fail_with_result(TransferError::SIZE_MISMATCH,
                         "received " + std::to_string(bytes_received_) + " bytes, declared " +
                         std::to_string(header_.file_size) + ", sender counted " +
                         std::to_string(end->total_bytes));
        return;
    }

    if (end->chunk_count != expected_index_) {
        fail_with_result(TransferError::PROTOCOL_ERROR, "chunk count mismatch");
        return;
    }

    std::string digest = hasher_->finish();
    if (digest.size() != end->sha256.size() ||
        !TransferCrypto::constant_time_compare(
            reinterpret_cast<const uint8_t*>(digest.data()),
            reinterpret_cast<const uint8_t*>(end->sha256.data()),
            digest.size())) {
        fail_with_result(TransferError::INTEGRITY_FAILURE, "file digest mismatch");
        return;
    }

    part_file_.flush();
    part_file_.close();
    if (part_file_.fail()) {
        fail_with_result(TransferError::FILE_ERROR, "failed to finalize " + part_path_.string());
        return;
    }

    std::filesystem::path final_path;
    std::error_code rename_error;
    bool contained = true;
    {
        std::lock_guard<std::mutex> lock(g_placement_mutex);
        final_path = security::unique_destination(settings_.receive_dir, file_name_);
        contained = security::is_safe_path(final_path, settings_.receive_dir);
        if (contained) {
            std::filesystem::rename(part_path_, final_path, rename_error);
        }
    }
    if (!contained) {
        fail_with_result(TransferError::FILE_ERROR, "destination " + final_path.string() +
                         " escapes the receive directory");
        return;
    }
    if (rename_error) {
        fail_with_result(TransferError::FILE_ERROR, "cannot place " + final_path.string() + ": " +
                         rename_error.message());
        return;
    }

    placed_ = true;
    update_snapshot([&final_path](TransferSnapshot& s) {
        s.local_path = final_path.string();
    });

    TransferResult result;
    result.ok = true;

    arm_deadline(settings_.stall_timeout, "result write");
    write_last_frame(FrameCodec::encode(FrameType::RESULT, result.to_json()), [this]() {
        complete();
    });
}

void InboundTransfer::fail_with_result(TransferError error, const std::string& detail) {
    // Stop writing to disk before telling the sender
    discard_partial();

    TransferResult result;
    result.ok = false;
    result.error = transfer_error_to_string(error);
    result.detail = detail;

    arm_deadline(settings_.stall_timeout, "result write");
    write_last_frame(FrameCodec::encode(FrameType::RESULT, result.to_json()), [this, error, detail]() {
        fail(error, detail);
    });
}

void InboundTransfer::on_terminal(TransferState state) {
    if (state != TransferState::COMPLETE && !placed_) {
        discard_partial();
    }
    crypto_.reset();
}

void InboundTransfer::discard_partial() {
    if (part_file_.is_open()) {
        part_file_.close();
    }
    if (!part_path_.empty()) {
        std::error_code ignored;
        std::filesystem::remove(part_path_, ignored);
        part_path_.clear();
    }
}

} // namespace meshpulse
