#pragma once

#include "config/INicknameProvider.hpp"
#include "model/IAnimationState.hpp"
#include "model/board.hpp"
#include "model/turnState.hpp"
#include "render/buttonRegion.hpp"
#include "render/fontSet.hpp"
#include "render/layout.hpp"

#include <QPainter>
#include <QSize>

#include <optional>
#include <vector>

namespace dicetrail::render {

//! Draws a frame of the game onto a painter.
//! Holds no game state. Every call reads the snapshot it is given.
class Renderer {
public:
	explicit Renderer(FontSet fonts, QSize surface = {WINDOW_WIDTH, WINDOW_HEIGHT});

	//! Clear the surface and draw all cells in board order.
	void drawBoard(QPainter& painter, const Board& board) const;
	//! Draw the player tokens in list order. The moving player is highlighted.
	void drawPlayers(QPainter& painter, const std::vector<Player>& players, const Board& board, const IAnimationState& animation) const;
	//! Draw the status panel and the action button.
	//! Returns the region of the drawn button. Only valid for this frame.
	std::optional<ButtonRegion> drawUi(QPainter& painter, const TurnState& state, const config::INicknameProvider& nicknames) const;

	const FontSet& fonts() const;
	QSize surfaceSize() const;
	QRect buttonRect() const; //!< Fixed position of the action button.

private:
	void drawCell(QPainter& painter, const Cell& cell) const;
	void drawToken(QPainter& painter, const Point& center, const QColor& color, bool highlight) const;

	//! Draw the player list and the dice results. Returns the y coordinate below the last line.
	int drawPlayerInfo(QPainter& painter, const TurnState& state, const std::string& nickname) const;
	void drawDice(QPainter& painter, const TurnState& state, int y) const;
	void drawStatus(QPainter& painter, const TurnState& state, const std::string& nickname) const;
	std::optional<ButtonRegion> drawButton(QPainter& painter, const TurnState& state) const;

	void drawText(QPainter& painter, const QPoint& topLeft, const std::string& text, const QColor& color) const;
	void drawCenteredText(QPainter& painter, const QPoint& center, const std::string& text, const QColor& color) const;

private:
	FontSet m_fonts;
	QSize m_surface; //!< Size of the drawing surface [px].
};

} // namespace dicetrail::render
