#pragma once

#include "model/board.hpp"
#include "model/moveAnimation.hpp"
#include "model/turnState.hpp"
#include "render/buttonRegion.hpp"

#include <string>

namespace dicetrail::gui {

//! Win coins on a reward cell or lose them on a penalty cell. Money does not drop below zero.
//! Returns the message for the status panel.
std::string applyEffectDie(Player& player, bool reward, int roll);

//! Sample game shown by the preview window.
//! Stands in for the turn engine so every renderer state can be clicked through.
class PreviewSession {
public:
	PreviewSession();

	const Board& board() const;
	const TurnState& state() const;
	const MoveAnimation& animation() const;

	void tick(MoveAnimation::Duration elapsed);     //!< Advance the animation. Computer players act once it is idle.
	void onAction(render::ButtonRegion::Kind kind); //!< Handle a click on the action button. Ignored while a token moves.

private:
	void reset();
	void rollDie();
	void rollEffectDie();
	void finishTurn();

private:
	Board m_board;
	TurnState m_state;
	MoveAnimation m_animation;
};

} // namespace dicetrail::gui
