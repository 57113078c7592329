#include "render/renderer.hpp"
#include "Logging.hpp"
#include "render/palette.hpp"
#include "render/presentation.hpp"

#include <QFontMetrics>
#include <QPen>
#include <QPointF>
#include <QString>

#include <format>
#include <string>
#include <utility>

namespace dicetrail::render {

Renderer::Renderer(FontSet fonts, const QSize surface) : m_fonts{std::move(fonts)}, m_surface{surface} {
	Logger().Log(Logging::LogLevel::Info, std::format("Renderer ready for {}x{} px using font '{}'.", m_surface.width(), m_surface.height(),
	                                                  m_fonts.family().toStdString()));
}

void Renderer::drawBoard(QPainter& painter, const Board& board) const {
	painter.fillRect(QRect{QPoint{0, 0}, m_surface}, palette::BACKGROUND);

	for (const auto& cell: board.cells()) {
		drawCell(painter, cell);
	}
}

void Renderer::drawCell(QPainter& painter, const Cell& cell) const {
	const auto& [x, y] = cell.position;
	const QRect square{x - CELL_SIZE / 2, y - CELL_SIZE / 2, CELL_SIZE, CELL_SIZE};

	painter.fillRect(square, fillColor(cell));

	painter.save();
	painter.setPen(QPen(palette::BLACK, OUTLINE_WIDTH));
	painter.setBrush(Qt::NoBrush);
	painter.drawRect(square);
	painter.restore();

	drawCenteredText(painter, {x, y + INDEX_LABEL_DY}, std::to_string(cell.index), palette::TEXT);
	drawCenteredText(painter, {x, y + TYPE_LABEL_DY}, cellTypeLabel(cell), palette::TEXT);
}

void Renderer::drawPlayers(QPainter& painter, const std::vector<Player>& players, const Board& board, const IAnimationState& animation) const {
	for (std::size_t i = 0; i != players.size(); ++i) {
		const auto& player = players[i];

		const auto center = tokenPosition(player, i, board, animation);
		if (!center) {
			Logger().Log(Logging::LogLevel::Debug, std::format("Player {} stands on cell {} outside the board.", player.id, player.position));
			continue;
		}

		const auto& [r, g, b] = player.color;
		drawToken(painter, *center, QColor{r, g, b}, isMoving(player, animation));
	}
}

void Renderer::drawToken(QPainter& painter, const Point& center, const QColor& color, const bool highlight) const {
	const QPointF c{static_cast<qreal>(center.x), static_cast<qreal>(center.y)};

	painter.save();
	painter.setRenderHint(QPainter::Antialiasing, true);

	if (highlight) {
		painter.setPen(QPen(palette::ATTENTION, OUTLINE_WIDTH));
		painter.setBrush(Qt::NoBrush);
		painter.drawEllipse(c, HIGHLIGHT_RADIUS, HIGHLIGHT_RADIUS);
	}

	painter.setPen(QPen(palette::BLACK, OUTLINE_WIDTH));
	painter.setBrush(color);
	painter.drawEllipse(c, TOKEN_RADIUS, TOKEN_RADIUS);
	painter.restore();
}

std::optional<ButtonRegion> Renderer::drawUi(QPainter& painter, const TurnState& state, const config::INicknameProvider& nicknames) const {
	const auto nickname = nicknames.nickname();

	const auto y = drawPlayerInfo(painter, state, nickname);
	drawDice(painter, state, y);
	drawText(painter, {PANEL_X, m_surface.height() - MESSAGE_BOTTOM}, state.message, palette::TEXT);
	drawStatus(painter, state, nickname);

	return drawButton(painter, state);
}

int Renderer::drawPlayerInfo(QPainter& painter, const TurnState& state, const std::string& nickname) const {
	int y = PANEL_Y;
	for (std::size_t i = 0; i != state.players.size(); ++i) {
		const auto& color = i == state.currentPlayer ? palette::ALERT : palette::TEXT;
		drawText(painter, {PANEL_X, y}, playerLine(state, i, nickname), color);
		y += PLAYER_LINE_SPACING;
	}
	return y;
}

void Renderer::drawDice(QPainter& painter, const TurnState& state, const int y) const {
	int lineY = y + DICE_GAP;
	for (const auto& line: diceLines(state)) {
		drawText(painter, {PANEL_X, lineY}, line, palette::TEXT);
		lineY += DICE_LINE_SPACING;
	}
}

void Renderer::drawStatus(QPainter& painter, const TurnState& state, const std::string& nickname) const {
	const auto text = statusLine(state, nickname);
	if (text.empty()) {
		return;
	}

	const auto& color = state.waitingForEffectDice ? palette::ATTENTION : palette::TEXT;
	drawCenteredText(painter, {m_surface.width() / 2, m_surface.height() - STATUS_BOTTOM}, text, color);
}

std::optional<ButtonRegion> Renderer::drawButton(QPainter& painter, const TurnState& state) const {
	const auto kind = selectButton(state);
	if (!kind) {
		return std::nullopt;
	}

	const auto rect = buttonRect();
	painter.fillRect(rect, buttonColor(*kind));

	painter.save();
	painter.setPen(QPen(palette::BLACK, OUTLINE_WIDTH));
	painter.setBrush(Qt::NoBrush);
	painter.drawRect(rect);
	painter.restore();

	drawCenteredText(painter, rect.center(), buttonLabel(*kind), palette::TEXT);
	return ButtonRegion{*kind, rect};
}

void Renderer::drawText(QPainter& painter, const QPoint& topLeft, const std::string& text, const QColor& color) const {
	if (text.empty()) {
		return;
	}

	const QFontMetrics metrics{m_fonts.normal()};

	painter.save();
	painter.setFont(m_fonts.normal());
	painter.setPen(color);
	painter.drawText(topLeft.x(), topLeft.y() + metrics.ascent(), QString::fromStdString(text));
	painter.restore();
}

void Renderer::drawCenteredText(QPainter& painter, const QPoint& center, const std::string& text, const QColor& color) const {
	const auto qText = QString::fromStdString(text);
	const QFontMetrics metrics{m_fonts.normal()};

	auto bounds = metrics.boundingRect(qText);
	bounds.moveCenter(center);

	painter.save();
	painter.setFont(m_fonts.normal());
	painter.setPen(color);
	painter.drawText(bounds, Qt::AlignCenter, qText);
	painter.restore();
}

const FontSet& Renderer::fonts() const {
	return m_fonts;
}

QSize Renderer::surfaceSize() const {
	return m_surface;
}

QRect Renderer::buttonRect() const {
	return {m_surface.width() - BUTTON_RIGHT, m_surface.height() - BUTTON_BOTTOM, BUTTON_WIDTH, BUTTON_HEIGHT};
}

} // namespace dicetrail::render
