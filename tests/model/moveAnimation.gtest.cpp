#include "model/moveAnimation.hpp"

#include <gtest/gtest.h>

namespace dicetrail::gtest {

using namespace std::chrono_literals;

static Board lineBoard() {
	return Board({
	        Cell{.position = {0, 0}},
	        Cell{.position = {100, 0}},
	        Cell{.position = {100, 50}},
	});
}

TEST(MoveAnimation, Idle) {
	const auto board = lineBoard();
	MoveAnimation animation;
	EXPECT_FALSE(animation.playerMoving());
	EXPECT_EQ(animation.animatedPosition(0u, board), (Point{0, 0}));
}

TEST(MoveAnimation, RejectsShortPath) {
	MoveAnimation animation;
	EXPECT_FALSE(animation.start(1u, {}));
	EXPECT_FALSE(animation.start(1u, {2u}));
	EXPECT_FALSE(animation.playerMoving());
}

TEST(MoveAnimation, Interpolates) {
	const auto board = lineBoard();
	MoveAnimation animation(100ms);
	ASSERT_TRUE(animation.start(3u, {0u, 1u, 2u}));
	EXPECT_TRUE(animation.playerMoving());
	EXPECT_EQ(animation.movingPlayerId(), 3u);

	EXPECT_EQ(animation.animatedPosition(3u, board), (Point{0, 0}));

	animation.advance(25ms);
	EXPECT_EQ(animation.animatedPosition(3u, board), (Point{25, 0}));

	animation.advance(75ms); // Reached second cell
	EXPECT_EQ(animation.animatedPosition(3u, board), (Point{100, 0}));
	EXPECT_TRUE(animation.playerMoving());

	animation.advance(50ms);
	EXPECT_EQ(animation.animatedPosition(3u, board), (Point{100, 25}));
}

TEST(MoveAnimation, StopsAtEnd) {
	const auto board = lineBoard();
	MoveAnimation animation(100ms);
	ASSERT_TRUE(animation.start(0u, {0u, 1u, 2u}));

	animation.advance(1s);
	EXPECT_FALSE(animation.playerMoving());
	EXPECT_EQ(animation.animatedPosition(0u, board), (Point{100, 50}));

	// Clock does not move while idle.
	animation.advance(100ms);
	EXPECT_EQ(animation.animatedPosition(0u, board), (Point{100, 50}));
}

TEST(MoveAnimation, Stop) {
	MoveAnimation animation(100ms);
	ASSERT_TRUE(animation.start(0u, {0u, 1u}));
	animation.stop();
	EXPECT_FALSE(animation.playerMoving());
}

TEST(MoveAnimation, OtherPlayerNotAnimated) {
	const auto board = lineBoard();
	MoveAnimation animation(100ms);
	ASSERT_TRUE(animation.start(0u, {1u, 2u}));
	EXPECT_EQ(animation.animatedPosition(1u, board), (Point{0, 0}));
}

TEST(MoveAnimation, PathLeavingBoard) {
	const auto board = lineBoard();
	MoveAnimation animation(100ms);
	ASSERT_TRUE(animation.start(0u, {2u, 7u}));

	animation.advance(50ms);
	EXPECT_EQ(animation.animatedPosition(0u, board), (Point{100, 50}));
}

} // namespace dicetrail::gtest
