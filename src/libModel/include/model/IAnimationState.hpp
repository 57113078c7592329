#pragma once

#include "model/board.hpp"

namespace dicetrail {

//! Per-frame view of the token movement animation.
class IAnimationState {
public:
	virtual ~IAnimationState() = default;

	virtual bool playerMoving() const       = 0; //!< A player token is currently moving.
	virtual unsigned movingPlayerId() const = 0; //!< Id of the moving player. Only valid while playerMoving().

	//! Interpolated position of the given player for the current frame.
	virtual Point animatedPosition(unsigned playerId, const Board& board) const = 0;
};

} // namespace dicetrail
