#pragma once

#include <cstddef>

namespace dicetrail {

//! Pixel position on the drawing surface.
struct Point {
	int x, y;

	friend constexpr bool operator==(const Point&, const Point&) = default;
};

//! A single field of the board. The role decides how the field is presented.
struct Cell {
	enum class Role {
		Plain,  //!< Nothing happens when landing here.
		Home,   //!< Start field owned by a player.
		Reward, //!< Grants coins on landing.
		Penalty //!< Removes coins on landing.
	};

	std::size_t index{0u}; //!< Position in the board sequence.
	Point position{0, 0};  //!< Center of the cell [px].
	Role role{Role::Plain};
	unsigned owner{0u}; //!< Owning player slot. Only meaningful for Role::Home.

	bool isHome() const {
		return role == Role::Home;
	}
	bool isReward() const {
		return role == Role::Reward;
	}
	bool isPenalty() const {
		return role == Role::Penalty;
	}
};

} // namespace dicetrail
