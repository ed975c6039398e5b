/**
 * @file test_transfer_session.cpp
 * @brief Unit tests for transfer state, snapshots and progress throttling
 */

#include <gtest/gtest.h>
#include "meshpulse/transfer_session.hpp"

using namespace meshpulse;
using namespace std::chrono_literals;

class TransferSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0_ = std::chrono::steady_clock::now();
    }

    std::chrono::steady_clock::time_point t0_;
};

// ============================================================================
// Names
// ============================================================================

TEST_F(TransferSessionTest, ErrorNamesParseBack) {
    TransferError errors[] = {
        TransferError::CONNECTION_ERROR, TransferError::TIMEOUT,
        TransferError::PROTOCOL_ERROR, TransferError::VERSION_MISMATCH,
        TransferError::REJECTED, TransferError::INTEGRITY_FAILURE,
        TransferError::SIZE_MISMATCH, TransferError::FILE_ERROR
    };
    for (auto error : errors) {
        EXPECT_EQ(string_to_transfer_error(transfer_error_to_string(error)), error);
    }
    EXPECT_EQ(transfer_error_to_string(TransferError::INTEGRITY_FAILURE), "integrity_failure");
}

TEST_F(TransferSessionTest, TerminalStates) {
    EXPECT_TRUE(is_terminal_state(TransferState::COMPLETE));
    EXPECT_TRUE(is_terminal_state(TransferState::FAILED));
    EXPECT_TRUE(is_terminal_state(TransferState::CANCELLED));
    EXPECT_FALSE(is_terminal_state(TransferState::TRANSFERRING));
}

// ============================================================================
// State Machine
// ============================================================================

TEST_F(TransferSessionTest, HappyPath) {
    TransferStateMachine machine;
    EXPECT_EQ(machine.get_state(), TransferState::INIT);
    EXPECT_TRUE(machine.transition(TransferState::HANDSHAKING));
    EXPECT_TRUE(machine.transition(TransferState::TRANSFERRING));
    EXPECT_TRUE(machine.transition(TransferState::COMPLETE));
    EXPECT_TRUE(machine.is_terminal());
}

TEST_F(TransferSessionTest, CannotSkipHandshake) {
    TransferStateMachine machine;
    EXPECT_FALSE(machine.transition(TransferState::TRANSFERRING));
    EXPECT_FALSE(machine.transition(TransferState::COMPLETE));
    EXPECT_EQ(machine.get_state(), TransferState::INIT);
}

TEST_F(TransferSessionTest, TerminalStatesAreFinal) {
    TransferState terminals[] = {TransferState::COMPLETE, TransferState::FAILED, TransferState::CANCELLED};
    TransferState all[] = {
        TransferState::INIT, TransferState::HANDSHAKING, TransferState::TRANSFERRING,
        TransferState::COMPLETE, TransferState::FAILED, TransferState::CANCELLED
    };
    for (auto from : terminals) {
        for (auto to : all) {
            EXPECT_FALSE(TransferStateMachine::can_transition(from, to));
        }
    }
}

TEST_F(TransferSessionTest, FailureAllowedFromAnyActiveState) {
    EXPECT_TRUE(TransferStateMachine::can_transition(TransferState::INIT, TransferState::FAILED));
    EXPECT_TRUE(TransferStateMachine::can_transition(TransferState::HANDSHAKING, TransferState::FAILED));
    EXPECT_TRUE(TransferStateMachine::can_transition(TransferState::TRANSFERRING, TransferState::FAILED));
}

TEST_F(TransferSessionTest, CancelOnlyWhileActive) {
    EXPECT_FALSE(TransferStateMachine::can_transition(TransferState::INIT, TransferState::CANCELLED));
    EXPECT_TRUE(TransferStateMachine::can_transition(TransferState::HANDSHAKING, TransferState::CANCELLED));
    EXPECT_TRUE(TransferStateMachine::can_transition(TransferState::TRANSFERRING, TransferState::CANCELLED));
}

// ============================================================================
// Snapshot
// ============================================================================

TEST_F(TransferSessionTest, ProgressFraction) {
    TransferSnapshot snapshot;
    snapshot.total_bytes = 1000;
    snapshot.bytes_transferred = 250;
    EXPECT_DOUBLE_EQ(snapshot.get_progress(), 0.25);

    TransferSnapshot empty;
    EXPECT_DOUBLE_EQ(empty.get_progress(), 0.0);
    empty.state = TransferState::COMPLETE;
    EXPECT_DOUBLE_EQ(empty.get_progress(), 1.0);
}

TEST_F(TransferSessionTest, RatesAndEstimate) {
    TransferSnapshot snapshot;
    snapshot.total_bytes = 4000;
    snapshot.start_time = t0_;
    snapshot.last_update = t0_;

    snapshot.update_transfer_rates(1000, t0_ + 1s);
    EXPECT_DOUBLE_EQ(snapshot.transfer_rate_bps, 1000.0);
    EXPECT_DOUBLE_EQ(snapshot.average_rate_bps, 1000.0);
    EXPECT_EQ(snapshot.estimated_time_remaining, 3000ms);
    EXPECT_EQ(snapshot.bytes_transferred, 1000u);

    snapshot.update_transfer_rates(3000, t0_ + 2s);
    EXPECT_DOUBLE_EQ(snapshot.transfer_rate_bps, 2000.0);
    EXPECT_DOUBLE_EQ(snapshot.average_rate_bps, 1500.0);
    EXPECT_EQ(snapshot.estimated_time_remaining, 500ms);
}

// ============================================================================
// Progress Throttle
// ============================================================================

TEST_F(TransferSessionTest, ThrottleEmitsFirstUpdate) {
    ProgressThrottle throttle(100ms);
    EXPECT_TRUE(throttle.should_emit(10, 1000, t0_));
}

TEST_F(TransferSessionTest, ThrottleLimitsRate) {
    ProgressThrottle throttle(100ms);
    EXPECT_TRUE(throttle.should_emit(10, 1000, t0_));
    EXPECT_FALSE(throttle.should_emit(20, 1000, t0_ + 50ms));
    EXPECT_TRUE(throttle.should_emit(30, 1000, t0_ + 100ms));
}

TEST_F(TransferSessionTest, ThrottleAlwaysEmitsFinalValueOnce) {
    ProgressThrottle throttle(100ms);
    EXPECT_TRUE(throttle.should_emit(10, 1000, t0_));
    EXPECT_TRUE(throttle.should_emit(1000, 1000, t0_ + 1ms));
    EXPECT_FALSE(throttle.should_emit(1000, 1000, t0_ + 500ms));
}

TEST_F(TransferSessionTest, ThrottleSkipsRepeatedByteCounts) {
    ProgressThrottle throttle(100ms);
    EXPECT_TRUE(throttle.should_emit(10, 1000, t0_));
    EXPECT_FALSE(throttle.should_emit(10, 1000, t0_ + 200ms));
}
