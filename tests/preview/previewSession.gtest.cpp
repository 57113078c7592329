#include "previewSession.hpp"

#include <gtest/gtest.h>

namespace dicetrail::gui::gtest {

using namespace std::chrono_literals;

//! Everything a click may change in the session.
static void expectSameTurn(const TurnState& before, const TurnState& after) {
	EXPECT_EQ(before.currentPlayer, after.currentPlayer);
	EXPECT_EQ(before.diceResult, after.diceResult);
	EXPECT_EQ(before.effectDiceResult, after.effectDiceResult);
	EXPECT_EQ(before.waitingForEffectDice, after.waitingForEffectDice);
	EXPECT_EQ(before.gameOver, after.gameOver);
	ASSERT_EQ(before.players.size(), after.players.size());
	for (std::size_t i = 0; i != before.players.size(); ++i) {
		EXPECT_EQ(before.players[i].position, after.players[i].position) << "player " << i;
		EXPECT_EQ(before.players[i].money, after.players[i].money) << "player " << i;
	}
}

TEST(PreviewSession, StartState) {
	const PreviewSession session;
	EXPECT_EQ(session.board().size(), 18u);
	EXPECT_EQ(session.state().players.size(), 3u);
	EXPECT_EQ(session.state().currentPlayer, 0u);
	EXPECT_FALSE(session.state().waitingForEffectDice);
	EXPECT_FALSE(session.state().gameOver);
	EXPECT_FALSE(session.animation().playerMoving());
}

TEST(PreviewSession, RollStartsMove) {
	PreviewSession session;
	session.onAction(render::ButtonRegion::Kind::RollDie);

	const auto& state = session.state();
	EXPECT_GE(state.diceResult, 1);
	EXPECT_LE(state.diceResult, 6);
	EXPECT_EQ(state.players[0].position, static_cast<std::size_t>(state.diceResult));
	ASSERT_TRUE(session.animation().playerMoving());
	EXPECT_EQ(session.animation().movingPlayerId(), 0u);
}

TEST(PreviewSession, ClicksIgnoredWhileMoving) {
	PreviewSession session;
	session.onAction(render::ButtonRegion::Kind::RollDie);
	ASSERT_TRUE(session.animation().playerMoving());

	const auto before = session.state();
	session.onAction(render::ButtonRegion::Kind::RollDie);
	session.onAction(render::ButtonRegion::Kind::RollEffectDie);

	expectSameTurn(before, session.state());
	EXPECT_TRUE(session.animation().playerMoving());
	EXPECT_EQ(session.animation().movingPlayerId(), 0u);
}

TEST(PreviewSession, ComputerMoveNotInterrupted) {
	PreviewSession session;

	// Play a while. Whenever a token moves, clicks must neither change the turn nor restart the animation.
	for (int frame = 0; frame != 2000 && !session.state().gameOver; ++frame) {
		if (session.animation().playerMoving()) {
			const auto moving = session.animation().movingPlayerId();
			const auto before = session.state();

			session.onAction(render::ButtonRegion::Kind::RollDie);
			session.onAction(render::ButtonRegion::Kind::RollEffectDie);

			expectSameTurn(before, session.state());
			ASSERT_TRUE(session.animation().playerMoving()) << "frame " << frame;
			ASSERT_EQ(session.animation().movingPlayerId(), moving) << "frame " << frame;
		} else if (const auto* player = session.state().current(); player && !player->isAi) {
			session.onAction(session.state().waitingForEffectDice ? render::ButtonRegion::Kind::RollEffectDie
			                                                      : render::ButtonRegion::Kind::RollDie);
		}

		session.tick(50ms);
	}
}

TEST(PreviewSession, ComputerActsWhenIdle) {
	PreviewSession session;
	session.onAction(render::ButtonRegion::Kind::RollDie);

	// Let the move finish. The computer player acts on the first idle tick.
	session.tick(10s);
	if (session.state().waitingForEffectDice) {
		session.onAction(render::ButtonRegion::Kind::RollEffectDie);
		session.tick(0ms);
	}

	ASSERT_FALSE(session.state().gameOver);
	EXPECT_TRUE(session.animation().playerMoving());
	EXPECT_EQ(session.animation().movingPlayerId(), 1u);
}

TEST(PreviewSession, Restart) {
	PreviewSession session;
	session.onAction(render::ButtonRegion::Kind::RollDie);
	session.onAction(render::ButtonRegion::Kind::Restart);

	EXPECT_FALSE(session.animation().playerMoving());
	EXPECT_EQ(session.state().currentPlayer, 0u);
	EXPECT_EQ(session.state().diceResult, 0);
	EXPECT_EQ(session.state().players[0].position, 0u);
}

TEST(EffectDie, Reward) {
	Player player{.money = 100u};
	EXPECT_EQ(applyEffectDie(player, true, 3), "Won 30 coins.");
	EXPECT_EQ(player.money, 130u);
}

TEST(EffectDie, Penalty) {
	Player player{.money = 100u};
	EXPECT_EQ(applyEffectDie(player, false, 2), "Lost 20 coins.");
	EXPECT_EQ(player.money, 80u);
}

TEST(EffectDie, PenaltyClampedToBalance) {
	Player player{.money = 15u};
	EXPECT_EQ(applyEffectDie(player, false, 3), "Lost 15 coins.");
	EXPECT_EQ(player.money, 0u);

	EXPECT_EQ(applyEffectDie(player, false, 6), "Lost 0 coins.");
	EXPECT_EQ(player.money, 0u);
}

} // namespace dicetrail::gui::gtest
