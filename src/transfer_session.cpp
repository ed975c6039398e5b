/**
 * @file transfer_session.cpp
 * @brief Implementation of transfer state machine and progress helpers
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshpulse/transfer_session.hpp"

namespace meshpulse {

// ============================================================================
// Names
// ============================================================================

std::string transfer_direction_to_string(TransferDirection direction) {
    return direction == TransferDirection::SEND ? "SEND" : "RECEIVE";
}

std::string transfer_state_to_string(TransferState state) {
    switch (state) {
        case TransferState::INIT:         return "INIT";
        case TransferState::HANDSHAKING:  return "HANDSHAKING";
        case TransferState::TRANSFERRING: return "TRANSFERRING";
        case TransferState::COMPLETE:     return "COMPLETE";
        case TransferState::FAILED:       return "FAILED";
        case TransferState::CANCELLED:    return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string transfer_error_to_string(TransferError error) {
    switch (error) {
        case TransferError::NONE:              return "none";
        case TransferError::CONNECTION_ERROR:  return "connection_error";
        case TransferError::TIMEOUT:           return "timeout";
        case TransferError::PROTOCOL_ERROR:    return "protocol_error";
        case TransferError::VERSION_MISMATCH:  return "version_mismatch";
        case TransferError::REJECTED:          return "rejected";
        case TransferError::INTEGRITY_FAILURE: return "integrity_failure";
        case TransferError::SIZE_MISMATCH:     return "size_mismatch";
        case TransferError::FILE_ERROR:        return "file_error";
    }
    return "unknown";
}

std::optional<TransferError> string_to_transfer_error(const std::string& name) {
    static const TransferError all_errors[] = {
        TransferError::NONE,
        TransferError::CONNECTION_ERROR,
        TransferError::TIMEOUT,
        TransferError::PROTOCOL_ERROR,
        TransferError::VERSION_MISMATCH,
        TransferError::REJECTED,
        TransferError::INTEGRITY_FAILURE,
        TransferError::SIZE_MISMATCH,
        TransferError::FILE_ERROR
    };

    for (TransferError error : all_errors) {
        if (transfer_error_to_string(error) == name) {
            return error;
        }
    }
    return std::nullopt;
}

bool is_terminal_state(TransferState state) {
    return state == TransferState::COMPLETE ||
           state == TransferState::FAILED ||
           state == TransferState::CANCELLED;
}

// ============================================================================
// TransferSnapshot
// ============================================================================

double TransferSnapshot::get_progress() const {
    if (total_bytes == 0) {
        return state == TransferState::COMPLETE ? 1.0 : 0.0;
    }
    return static_cast<double>(bytes_transferred) / static_cast<double>(total_bytes);
}

void TransferSnapshot::update_transfer_rates(uint64_t new_bytes_transferred,
                                             std::chrono::steady_clock::time_point now) {
    auto time_diff = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_update);

    if (time_diff.count() > 0) {
        uint64_t bytes_diff = new_bytes_transferred - bytes_transferred;
        transfer_rate_bps = (static_cast<double>(bytes_diff) * 1000.0) / time_diff.count();

        // Average rate since start
        auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time);
        if (total_time.count() > 0) {
            average_rate_bps = (static_cast<double>(new_bytes_transferred) * 1000.0) / total_time.count();
        }

        if (transfer_rate_bps > 0 && total_bytes > new_bytes_transferred) {
            uint64_t remaining_bytes = total_bytes - new_bytes_transferred;
            estimated_time_remaining = std::chrono::milliseconds(
                static_cast<int64_t>((remaining_bytes * 1000.0) / transfer_rate_bps)
            );
        } else {
            estimated_time_remaining = std::chrono::milliseconds(0);
        }

        last_update = now;
    }

    bytes_transferred = new_bytes_transferred;
}

// ============================================================================
// TransferStateMachine
// ============================================================================

bool TransferStateMachine::can_transition(TransferState from, TransferState to) {
    if (is_terminal_state(from)) {
        return false;
    }

    switch (to) {
        case TransferState::HANDSHAKING:
            return from == TransferState::INIT;
        case TransferState::TRANSFERRING:
            return from == TransferState::HANDSHAKING;
        case TransferState::COMPLETE:
            return from == TransferState::TRANSFERRING;
        case TransferState::FAILED:
            return true;
        case TransferState::CANCELLED:
            return from == TransferState::HANDSHAKING || from == TransferState::TRANSFERRING;
        case TransferState::INIT:
            return false;
    }
    return false;
}

bool TransferStateMachine::transition(TransferState to) {
    if (!can_transition(state_, to)) {
        return false;
    }
    state_ = to;
    return true;
}

// ============================================================================
// ProgressThrottle
// ============================================================================

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval)
    : interval_(interval)
{
}

bool ProgressThrottle::should_emit(uint64_t bytes, uint64_t total,
                                   std::chrono::steady_clock::time_point now) {
    if (final_emitted_) {
        return false;
    }

    if (bytes >= total) {
        final_emitted_ = true;
        last_emit_ = now;
        last_bytes_ = bytes;
        return true;
    }

    if (last_emit_ && (now - *last_emit_ < interval_ || bytes <= last_bytes_)) {
        return false;
    }

    last_emit_ = now;
    last_bytes_ = bytes;
    return true;
}

} // namespace meshpulse
