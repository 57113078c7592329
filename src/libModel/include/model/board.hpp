#pragma once

#include "model/cell.hpp"

#include <optional>
#include <vector>

namespace dicetrail {

//! Ordered sequence of cells with fixed pixel positions.
//! The board is laid out by the game logic. This class only provides lookups for rendering.
class Board {
public:
	Board() = default;
	explicit Board(std::vector<Cell> cells); //!< Cell indices are renumbered to their position in the sequence.

	std::size_t size() const; //!< Number of cells.
	bool empty() const;

	const Cell* cell(std::size_t index) const;              //!< Get the cell at index. Nullptr if not on the board.
	std::optional<Point> position(std::size_t index) const; //!< Pixel center of the cell at index.

	const std::vector<Cell>& cells() const;

private:
	std::vector<Cell> m_cells{};
};

} // namespace dicetrail
