#include "model/board.hpp"

#include <utility>

namespace dicetrail {

Board::Board(std::vector<Cell> cells) : m_cells{std::move(cells)} {
	for (std::size_t i = 0; i != m_cells.size(); ++i) {
		m_cells[i].index = i;
	}
}

std::size_t Board::size() const {
	return m_cells.size();
}

bool Board::empty() const {
	return m_cells.empty();
}

const Cell* Board::cell(const std::size_t index) const {
	if (index >= m_cells.size()) {
		return nullptr;
	}
	return &m_cells[index];
}

std::optional<Point> Board::position(const std::size_t index) const {
	const auto* c = cell(index);
	if (!c) {
		return std::nullopt;
	}
	return c->position;
}

const std::vector<Cell>& Board::cells() const {
	return m_cells;
}

} // namespace dicetrail
