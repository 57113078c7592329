#pragma once

#include "model/player.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dicetrail {

//! How the game is being played.
enum class SessionMode {
	Local,    //!< All players sit at this machine (humans and AI).
	Networked //!< Players are distributed over several clients.
};

//! Read-only snapshot of the turn engine for a single frame.
struct TurnState {
	std::vector<Player> players{};
	std::size_t currentPlayer{0u}; //!< Index of the player whose turn it is.
	int diceResult{0};             //!< Last movement die. 0 if not rolled yet.
	int effectDiceResult{0};       //!< Last effect die. 0 if not rolled yet.
	std::string message{};         //!< Pending message of the game logic.
	bool waitingForEffectDice{false};
	bool gameOver{false};

	SessionMode mode{SessionMode::Local};
	bool localPlayerTurn{false};             //!< Networked: the turn is held by this client. Ignored in local mode.
	std::optional<std::size_t> localSlot{}; //!< Networked: slot assigned to this client. Ignored in local mode.

	bool isNetworked() const;
	const Player* current() const; //!< Player at currentPlayer. Nullptr if the index is not valid.
};

} // namespace dicetrail
