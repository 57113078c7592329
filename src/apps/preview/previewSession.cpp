#include "previewSession.hpp"
#include "Logging.hpp"

#include <QRandomGenerator>

#include <algorithm>
#include <format>
#include <utility>
#include <vector>

namespace dicetrail::gui {

namespace {
constexpr unsigned START_MONEY  = 100u;
constexpr unsigned EFFECT_COINS = 10u; //!< Coins won or lost per pip of the effect die.

//! Loop of 18 cells around the center of the default surface.
Board makeBoard() {
	std::vector<Cell> cells;
	const auto add = [&cells](int x, int y) { cells.push_back(Cell{.index = cells.size(), .position = {x, y}}); };

	for (int x = 200; x <= 800; x += 100) { // Top row
		add(x, 200);
	}
	for (int y = 300; y <= 400; y += 100) { // Right column
		add(800, y);
	}
	for (int x = 800; x >= 200; x -= 100) { // Bottom row
		add(x, 500);
	}
	for (int y = 400; y >= 300; y -= 100) { // Left column
		add(200, y);
	}

	const auto home = [&cells](std::size_t index, unsigned owner) {
		cells[index].role  = Cell::Role::Home;
		cells[index].owner = owner;
	};
	home(0u, 0u);
	home(6u, 1u);
	home(12u, 2u);
	for (const auto index: {3u, 9u, 15u}) {
		cells[index].role = Cell::Role::Reward;
	}
	for (const auto index: {5u, 11u, 17u}) {
		cells[index].role = Cell::Role::Penalty;
	}

	return Board{std::move(cells)};
}

int rollDice() {
	return QRandomGenerator::global()->bounded(1, 7);
}
} // namespace

std::string applyEffectDie(Player& player, const bool reward, const int roll) {
	const auto coins = static_cast<unsigned>(std::max(roll, 0)) * EFFECT_COINS;
	if (reward) {
		player.money += coins;
		return std::format("Won {} coins.", coins);
	}

	const auto lost = std::min(player.money, coins);
	player.money -= lost;
	return std::format("Lost {} coins.", lost);
}

PreviewSession::PreviewSession() : m_board{makeBoard()} {
	reset();
}

const Board& PreviewSession::board() const {
	return m_board;
}

const TurnState& PreviewSession::state() const {
	return m_state;
}

const MoveAnimation& PreviewSession::animation() const {
	return m_animation;
}

void PreviewSession::tick(const MoveAnimation::Duration elapsed) {
	m_animation.advance(elapsed);

	const auto* player = m_state.current();
	if (m_state.gameOver || m_animation.playerMoving() || !player || !player->isAi) {
		return;
	}

	if (m_state.waitingForEffectDice) {
		rollEffectDie();
	} else {
		rollDie();
	}
}

void PreviewSession::onAction(const render::ButtonRegion::Kind kind) {
	switch (kind) {
	case render::ButtonRegion::Kind::Restart:
		Logger().Log(Logging::LogLevel::Info, "Restart requested.");
		reset();
		break;
	case render::ButtonRegion::Kind::RollEffectDie:
		rollEffectDie();
		break;
	case render::ButtonRegion::Kind::RollDie:
		rollDie();
		break;
	}
}

void PreviewSession::reset() {
	m_animation.stop();
	m_state = TurnState{
	        .players =
	                {
	                        Player{.id = 0u, .money = START_MONEY, .color = {220, 60, 60}, .isAi = false, .position = 0u},
	                        Player{.id = 1u, .money = START_MONEY, .color = {60, 90, 220}, .isAi = true, .aiType = "AI", .position = 6u},
	                        Player{.id = 2u, .money = START_MONEY, .color = {60, 170, 60}, .isAi = false, .position = 12u},
	                },
	        .message = "Roll the die to start.",
	};
}

void PreviewSession::rollDie() {
	if (m_animation.playerMoving() || m_state.waitingForEffectDice || m_state.gameOver || m_board.empty()) {
		return;
	}
	auto& player = m_state.players[m_state.currentPlayer];

	const auto roll          = rollDice();
	m_state.diceResult       = roll;
	m_state.effectDiceResult = 0;

	std::vector<std::size_t> path{player.position};
	for (int i = 0; i != roll; ++i) {
		path.push_back((path.back() + 1u) % m_board.size());
	}
	player.position = path.back();
	m_animation.start(player.id, std::move(path));
	Logger().Log(Logging::LogLevel::Info, std::format("Player {} rolled {} and moves to cell {}.", player.id + 1u, roll, player.position));

	const auto* cell = m_board.cell(player.position);
	if (cell && (cell->isReward() || cell->isPenalty())) {
		m_state.waitingForEffectDice = true;
		m_state.message              = cell->isReward() ? "Reward cell! Roll the effect die." : "Discard cell! Roll the effect die.";
		return;
	}

	m_state.message.clear();
	finishTurn();
}

void PreviewSession::rollEffectDie() {
	if (m_animation.playerMoving() || !m_state.waitingForEffectDice || m_state.gameOver) {
		return;
	}
	auto& player = m_state.players[m_state.currentPlayer];

	const auto roll          = rollDice();
	m_state.effectDiceResult = roll;

	const auto* cell = m_board.cell(player.position);
	m_state.message  = applyEffectDie(player, cell && cell->isReward(), roll);

	m_state.waitingForEffectDice = false;
	finishTurn();
}

void PreviewSession::finishTurn() {
	const auto& player = m_state.players[m_state.currentPlayer];
	if (player.money == 0u) {
		m_state.gameOver = true;
		m_state.message  = std::format("Player {} is out of coins. Game over.", player.id + 1u);
		Logger().Log(Logging::LogLevel::Info, m_state.message);
		return;
	}

	m_state.currentPlayer = (m_state.currentPlayer + 1u) % m_state.players.size();
}

} // namespace dicetrail::gui
