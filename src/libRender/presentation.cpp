#include "render/presentation.hpp"
#include "render/layout.hpp"
#include "render/palette.hpp"

#include <format>

namespace dicetrail::render {

QColor fillColor(const Cell& cell) {
	switch (cell.role) {
	case Cell::Role::Home:
		return palette::HOME[cell.owner % palette::HOME.size()];
	case Cell::Role::Reward:
		return palette::REWARD;
	case Cell::Role::Penalty:
		return palette::PENALTY;
	case Cell::Role::Plain:
	default:
		return palette::NEUTRAL;
	}
}

std::string cellTypeLabel(const Cell& cell) {
	switch (cell.role) {
	case Cell::Role::Home:
		return std::format("H{}", cell.owner + 1u);
	case Cell::Role::Reward:
		return "Reward";
	case Cell::Role::Penalty:
		return "Discard";
	case Cell::Role::Plain:
	default:
		return "Normal";
	}
}

Point staggerOffset(const std::size_t index) {
	const auto column = static_cast<int>(index % 2u);
	const auto row    = static_cast<int>(index / 2u);
	return {column * STAGGER_STEP - STAGGER_BIAS, row * STAGGER_STEP - STAGGER_BIAS};
}

bool isMoving(const Player& player, const IAnimationState& animation) {
	return animation.playerMoving() && animation.movingPlayerId() == player.id;
}

std::optional<Point> tokenPosition(const Player& player, const std::size_t index, const Board& board, const IAnimationState& animation) {
	std::optional<Point> base;
	if (isMoving(player, animation)) {
		base = animation.animatedPosition(player.id, board);
	} else {
		base = board.position(player.position);
	}

	if (!base) {
		return std::nullopt;
	}

	const auto offset = staggerOffset(index);
	return Point{base->x + offset.x, base->y + offset.y};
}

bool isLocalSlot(const TurnState& state, const std::size_t index) {
	if (state.isNetworked()) {
		return state.localSlot.has_value() && *state.localSlot == index;
	}

	// Local game: The first human player sits in front of the screen.
	for (std::size_t i = 0; i != state.players.size(); ++i) {
		if (!state.players[i].isAi) {
			return i == index;
		}
	}
	return false;
}

std::string humanName(const TurnState& state, const Player& player, const std::string& nickname) {
	// A remote participant announcing the same name as ours is shown with our nickname.
	if (state.isNetworked() && player.name.has_value() && *player.name != nickname) {
		return *player.name;
	}
	return nickname;
}

std::string playerLine(const TurnState& state, const std::size_t index, const std::string& nickname) {
	if (index >= state.players.size()) {
		return {};
	}

	const auto& player = state.players[index];
	const auto number  = index + 1u;

	auto text = player.isAi ? std::format("{}{}: {} coins", player.aiType, number, player.money)
	                        : std::format("Player{}({}): {} coins", number, humanName(state, player, nickname), player.money);

	if (isLocalSlot(state, index)) {
		text = "[You] " + text;
	}
	if (index == state.currentPlayer) {
		text = std::format(">>> {} <<<", text);
	}
	return text;
}

std::string currentPlayerName(const TurnState& state, const std::string& nickname) {
	const auto* player = state.current();
	if (!player) {
		return {};
	}

	if (player->isAi) {
		return std::format("{}{}", player->aiType, player->id + 1u);
	}
	return std::format("Player{}({})", player->id + 1u, humanName(state, *player, nickname));
}

std::string statusLine(const TurnState& state, const std::string& nickname) {
	const auto name = currentPlayerName(state, nickname);
	if (name.empty()) {
		return {};
	}

	if (state.waitingForEffectDice) {
		return std::format("Waiting for {} to roll the effect die...", name);
	}
	return std::format("{}'s turn", name);
}

std::vector<std::string> diceLines(const TurnState& state) {
	std::vector<std::string> lines;
	if (state.diceResult > 0) {
		lines.push_back(std::format("Move die: {}", state.diceResult));
	}
	if (state.effectDiceResult > 0) {
		lines.push_back(std::format("Effect die: {}", state.effectDiceResult));
	}
	return lines;
}

bool canAct(const TurnState& state) {
	if (state.isNetworked()) {
		return state.localPlayerTurn;
	}

	const auto* player = state.current();
	return player && !player->isAi;
}

std::optional<ButtonRegion::Kind> selectButton(const TurnState& state) {
	if (state.gameOver) {
		return ButtonRegion::Kind::Restart;
	}

	const auto authorized = canAct(state);
	if (state.waitingForEffectDice && authorized) {
		return ButtonRegion::Kind::RollEffectDie;
	}
	if (authorized) {
		return ButtonRegion::Kind::RollDie;
	}
	return std::nullopt;
}

std::string buttonLabel(const ButtonRegion::Kind kind) {
	switch (kind) {
	case ButtonRegion::Kind::Restart:
		return "Restart";
	case ButtonRegion::Kind::RollEffectDie:
		return "Roll Effect Die";
	case ButtonRegion::Kind::RollDie:
		return "Roll Die";
	}
	return {};
}

QColor buttonColor(const ButtonRegion::Kind kind) {
	switch (kind) {
	case ButtonRegion::Kind::Restart:
		return palette::BUTTON_RESTART;
	case ButtonRegion::Kind::RollEffectDie:
		return palette::BUTTON_EFFECT_DICE;
	case ButtonRegion::Kind::RollDie:
		return palette::BUTTON_DICE;
	}
	return palette::NEUTRAL;
}

} // namespace dicetrail::render
