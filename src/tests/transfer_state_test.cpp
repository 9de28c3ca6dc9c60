#include <gtest/gtest.h>
#include <sstream>
#include "tessera/transfer/transfer_state.hpp"

using namespace tessera::transfer;

class TransferStateTest : public ::testing::Test {
protected:
    TransferState state;
};

TEST_F(TransferStateTest, InitialState) {
    EXPECT_EQ(state.get_state(), TransferState::State::PENDING);
    EXPECT_FALSE(state.is_terminal());
}

TEST_F(TransferStateTest, ValidTransitions) {
    EXPECT_TRUE(state.transition_to(TransferState::State::ACTIVE));
    EXPECT_EQ(state.get_state(), TransferState::State::ACTIVE);

    EXPECT_TRUE(state.transition_to(TransferState::State::COMPLETE));
    EXPECT_EQ(state.get_state(), TransferState::State::COMPLETE);
    EXPECT_TRUE(state.is_terminal());
}

TEST_F(TransferStateTest, PendingCanBeCancelledOrFailed) {
    EXPECT_TRUE(TransferState::is_valid_transition(TransferState::State::PENDING, TransferState::State::CANCELLED));
    EXPECT_TRUE(TransferState::is_valid_transition(TransferState::State::PENDING, TransferState::State::FAILED));
    EXPECT_FALSE(TransferState::is_valid_transition(TransferState::State::PENDING, TransferState::State::COMPLETE));
}

TEST_F(TransferStateTest, TerminalStatesAcceptNothing) {
    for (auto terminal : {TransferState::State::COMPLETE, TransferState::State::FAILED,
                          TransferState::State::CANCELLED}) {
        for (auto next : {TransferState::State::PENDING, TransferState::State::ACTIVE,
                          TransferState::State::COMPLETE, TransferState::State::FAILED,
                          TransferState::State::CANCELLED}) {
            EXPECT_FALSE(TransferState::is_valid_transition(terminal, next))
                << terminal << " -> " << next;
        }
    }
}

TEST_F(TransferStateTest, InvalidTransitionKeepsState) {
    EXPECT_FALSE(state.transition_to(TransferState::State::COMPLETE));
    EXPECT_EQ(state.get_state(), TransferState::State::PENDING);

    ASSERT_TRUE(state.transition_to(TransferState::State::ACTIVE));
    ASSERT_TRUE(state.transition_to(TransferState::State::CANCELLED));
    EXPECT_FALSE(state.transition_to(TransferState::State::ACTIVE));
    EXPECT_EQ(state.get_state(), TransferState::State::CANCELLED);
}

TEST_F(TransferStateTest, StateStrings) {
    EXPECT_EQ(state.get_state_string(), "PENDING");
    EXPECT_EQ(TransferState::state_to_string(TransferState::State::FAILED), "FAILED");

    std::ostringstream os;
    os << TransferState::State::CANCELLED;
    EXPECT_EQ(os.str(), "CANCELLED");

    EXPECT_EQ(to_string(Direction::UPLOAD), "upload");
    EXPECT_EQ(to_string(Direction::DOWNLOAD), "download");
}
