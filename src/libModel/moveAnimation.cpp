#include "model/moveAnimation.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace dicetrail {

MoveAnimation::MoveAnimation(const Duration stepDuration) : m_stepDuration{std::max(stepDuration, Duration{1})} {
}

bool MoveAnimation::start(const unsigned playerId, std::vector<std::size_t> path) {
	if (path.size() < 2u) {
		return false;
	}

	m_playerId = playerId;
	m_path     = std::move(path);
	m_elapsed  = Duration{0};
	m_moving   = true;
	return true;
}

void MoveAnimation::advance(const Duration elapsed) {
	if (!m_moving || elapsed <= Duration{0}) {
		return;
	}

	m_elapsed += elapsed;
	if (m_elapsed >= totalDuration()) {
		m_elapsed = totalDuration();
		m_moving  = false;
	}
}

void MoveAnimation::stop() {
	m_moving = false;
	m_path.clear();
	m_elapsed = Duration{0};
}

bool MoveAnimation::playerMoving() const {
	return m_moving;
}

unsigned MoveAnimation::movingPlayerId() const {
	return m_playerId;
}

Point MoveAnimation::animatedPosition(const unsigned playerId, const Board& board) const {
	if (m_path.empty() || playerId != m_playerId) {
		return {0, 0};
	}

	const auto step = static_cast<std::size_t>(m_elapsed / m_stepDuration);
	if (step + 1u >= m_path.size()) {
		return board.position(m_path.back()).value_or(Point{0, 0});
	}

	const auto from = board.position(m_path[step]);
	const auto to   = board.position(m_path[step + 1u]);
	if (!from || !to) {
		return from.value_or(to.value_or(Point{0, 0}));
	}

	// Fraction of the current step already done.
	const auto t = static_cast<double>((m_elapsed % m_stepDuration).count()) / static_cast<double>(m_stepDuration.count());
	return {from->x + static_cast<int>(std::lround((to->x - from->x) * t)), from->y + static_cast<int>(std::lround((to->y - from->y) * t))};
}

MoveAnimation::Duration MoveAnimation::totalDuration() const {
	if (m_path.size() < 2u) {
		return Duration{0};
	}
	return m_stepDuration * static_cast<Duration::rep>(m_path.size() - 1u);
}

} // namespace dicetrail
