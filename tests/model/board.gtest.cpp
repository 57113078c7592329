#include "model/board.hpp"
#include "model/turnState.hpp"

#include <gtest/gtest.h>

namespace dicetrail::gtest {

TEST(Board, Empty) {
	Board board;
	EXPECT_TRUE(board.empty());
	EXPECT_EQ(board.size(), 0u);
	EXPECT_EQ(board.cell(0u), nullptr);
	EXPECT_FALSE(board.position(0u).has_value());
}

TEST(Board, PositionLookup) {
	Board board({
	        Cell{.position = {100, 200}, .role = Cell::Role::Home, .owner = 1u},
	        Cell{.position = {160, 200}, .role = Cell::Role::Reward},
	        Cell{.position = {220, 200}, .role = Cell::Role::Penalty},
	});

	ASSERT_EQ(board.size(), 3u);
	EXPECT_EQ(board.position(0u), (Point{100, 200}));
	EXPECT_EQ(board.position(2u), (Point{220, 200}));
	EXPECT_FALSE(board.position(3u).has_value());

	// Indices follow the sequence.
	for (std::size_t i = 0; i != board.size(); ++i) {
		ASSERT_NE(board.cell(i), nullptr);
		EXPECT_EQ(board.cell(i)->index, i);
	}

	EXPECT_TRUE(board.cell(0u)->isHome());
	EXPECT_EQ(board.cell(0u)->owner, 1u);
	EXPECT_TRUE(board.cell(1u)->isReward());
	EXPECT_TRUE(board.cell(2u)->isPenalty());
	EXPECT_FALSE(board.cell(2u)->isReward());
}

TEST(TurnState, CurrentPlayer) {
	TurnState state;
	EXPECT_EQ(state.current(), nullptr);

	state.players       = {Player{.id = 0u}, Player{.id = 1u, .isAi = true}};
	state.currentPlayer = 1u;
	ASSERT_NE(state.current(), nullptr);
	EXPECT_EQ(state.current()->id, 1u);

	state.currentPlayer = 2u;
	EXPECT_EQ(state.current(), nullptr);
}

TEST(TurnState, SessionMode) {
	TurnState state;
	EXPECT_FALSE(state.isNetworked());

	state.mode = SessionMode::Networked;
	EXPECT_TRUE(state.isNetworked());
}

} // namespace dicetrail::gtest
