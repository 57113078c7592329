#include "model/turnState.hpp"

namespace dicetrail {

bool TurnState::isNetworked() const {
	return mode == SessionMode::Networked;
}

const Player* TurnState::current() const {
	if (currentPlayer >= players.size()) {
		return nullptr;
	}
	return &players[currentPlayer];
}

} // namespace dicetrail
