#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace dicetrail {

//! Token color of a player.
struct Rgb {
	std::uint8_t r, g, b;

	friend constexpr bool operator==(const Rgb&, const Rgb&) = default;
};

//! A participant of the game as seen by the presentation layer.
struct Player {
	unsigned id{0u};                 //!< Slot id. Equals the index in the player list.
	unsigned money{0u};              //!< Coin balance.
	Rgb color{0, 0, 0};              //!< Token color.
	bool isAi{false};                //!< Controlled by the computer.
	std::string aiType{"AI"};        //!< Type name shown for computer players.
	std::optional<std::string> name; //!< Display name announced by a network participant.
	std::size_t position{0u};        //!< Index of the board cell the player stands on.
};

} // namespace dicetrail
