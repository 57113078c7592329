#pragma once

#include "model/IAnimationState.hpp"

#include <chrono>
#include <vector>

namespace dicetrail {

//! Moves a single token cell by cell along a path.
//! The position between two consecutive cells is linearly interpolated.
class MoveAnimation : public IAnimationState {
public:
	using Duration = std::chrono::milliseconds;

	explicit MoveAnimation(Duration stepDuration = Duration{200});

	//! Start moving a player along the cell indices of path. False if the path has less than two cells.
	bool start(unsigned playerId, std::vector<std::size_t> path);
	void advance(Duration elapsed); //!< Move the animation clock forward. Stops at the end of the path.
	void stop();                    //!< Cancel the running animation.

	bool playerMoving() const override;
	unsigned movingPlayerId() const override;
	Point animatedPosition(unsigned playerId, const Board& board) const override;

private:
	Duration totalDuration() const;

private:
	Duration m_stepDuration;            //!< Time needed to go from one cell to the next.
	Duration m_elapsed{0};              //!< Time since start.
	unsigned m_playerId{0u};            //!< Moving player.
	std::vector<std::size_t> m_path{}; //!< Cells visited in order. First entry is the start cell.
	bool m_moving{false};
};

} // namespace dicetrail
