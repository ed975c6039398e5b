/**
 * @file transfer_session.hpp
 * @brief Transfer session state, errors and progress helpers
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Session lifecycle:
 *   INIT -> HANDSHAKING -> TRANSFERRING -> COMPLETE
 *   any non-terminal state -> FAILED
 *   HANDSHAKING | TRANSFERRING -> CANCELLED
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace meshpulse {

/**
 * @brief Direction of a transfer as seen by this node
 */
enum class TransferDirection {
    SEND,
    RECEIVE
};

/**
 * @brief Transfer session states
 */
enum class TransferState {
    INIT,
    HANDSHAKING,
    TRANSFERRING,
    COMPLETE,
    FAILED,
    CANCELLED
};

/**
 * @brief Failure kinds reported with TransferState::FAILED
 */
enum class TransferError {
    NONE,
    CONNECTION_ERROR,   ///< Connect failure, reset or EOF before completion
    TIMEOUT,            ///< Handshake deadline or stall timeout expired
    PROTOCOL_ERROR,     ///< Malformed or unexpected frame
    VERSION_MISMATCH,   ///< Peers speak different protocol versions
    REJECTED,           ///< Receiver declined the transfer
    INTEGRITY_FAILURE,  ///< Chunk authentication or digest check failed
    SIZE_MISMATCH,      ///< Byte total differs from the declared size
    FILE_ERROR          ///< Local file could not be read or written
};

std::string transfer_direction_to_string(TransferDirection direction);
std::string transfer_state_to_string(TransferState state);
std::string transfer_error_to_string(TransferError error);

/**
 * @brief Parse an error kind name as carried in RESULT frames
 * @return TransferError, or std::nullopt for unknown names
 */
std::optional<TransferError> string_to_transfer_error(const std::string& name);

/**
 * @brief Whether a state has no outgoing transitions
 */
bool is_terminal_state(TransferState state);

/**
 * @brief Point-in-time copy of a transfer session
 */
struct TransferSnapshot {
    std::string session_id;
    TransferDirection direction = TransferDirection::SEND;
    std::string peer_id;
    std::string peer_name;
    std::string file_name;
    std::string local_path;         ///< Source file, or final output once complete
    std::string note;               ///< Optional message from the sender
    uint64_t total_bytes = 0;
    uint64_t bytes_transferred = 0;
    TransferState state = TransferState::INIT;
    TransferError error = TransferError::NONE;
    std::string error_detail;

    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_update;
    std::optional<std::chrono::steady_clock::time_point> finish_time;

    double transfer_rate_bps = 0.0;     ///< Rate since the previous update
    double average_rate_bps = 0.0;      ///< Rate since start
    std::chrono::milliseconds estimated_time_remaining{0};

    /**
     * @brief Fraction complete in [0, 1] (1 for empty files)
     */
    double get_progress() const;

    /**
     * @brief Advance bytes_transferred and recompute rates
     */
    void update_transfer_rates(uint64_t new_bytes_transferred,
                               std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
};

/**
 * @brief TransferStateMachine - enforces the legal session transitions
 *
 * Not thread-safe; owned by a single transfer handler.
 */
class TransferStateMachine {
public:
    TransferStateMachine() = default;

    /**
     * @brief Check whether from -> to is a legal transition
     */
    static bool can_transition(TransferState from, TransferState to);

    /**
     * @brief Move to a new state
     * @return true if the transition was legal and applied, false otherwise
     */
    bool transition(TransferState to);

    TransferState get_state() const { return state_; }

    bool is_terminal() const { return is_terminal_state(state_); }

private:
    TransferState state_ = TransferState::INIT;
};

/**
 * @brief ProgressThrottle - coalesces progress notifications
 *
 * Emits at most once per interval, always emits the first update and
 * always emits the final value (bytes == total) exactly once.
 */
class ProgressThrottle {
public:
    explicit ProgressThrottle(std::chrono::milliseconds interval);

    /**
     * @brief Decide whether an update should be published
     * @param bytes Bytes transferred so far
     * @param total Total bytes expected
     * @param now Current time
     * @return true if the caller should publish a progress event
     */
    bool should_emit(uint64_t bytes, uint64_t total,
                     std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

private:
    std::chrono::milliseconds interval_;
    std::optional<std::chrono::steady_clock::time_point> last_emit_;
    uint64_t last_bytes_ = 0;
    bool final_emitted_ = false;
};

} // namespace meshpulse
