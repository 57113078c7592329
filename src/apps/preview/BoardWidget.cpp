#include "BoardWidget.hpp"

#include "Logging.hpp"

#include <QMouseEvent>
#include <QPainter>

#include <chrono>
#include <format>

namespace dicetrail::gui {

namespace {
constexpr int FRAME_INTERVAL_MS = 16;
}

BoardWidget::BoardWidget(PreviewSession& session, const render::Renderer& renderer, const config::INicknameProvider& nicknames, QWidget* parent)
    : QWidget(parent), m_session{session}, m_renderer{renderer}, m_nicknames{nicknames} {
	setFixedSize(m_renderer.surfaceSize());
	setMouseTracking(false);

	connect(&m_frameTimer, &QTimer::timeout, this, &BoardWidget::onFrame);
	m_frameTimer.start(FRAME_INTERVAL_MS);
	m_clock.start();
}

void BoardWidget::onFrame() {
	const auto elapsed = std::chrono::milliseconds{m_clock.restart()};
	m_session.tick(elapsed);
	update();
}

void BoardWidget::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	m_renderer.drawBoard(painter, m_session.board());
	m_renderer.drawPlayers(painter, m_session.state().players, m_session.board(), m_session.animation());
	m_button = m_renderer.drawUi(painter, m_session.state(), m_nicknames);
}

void BoardWidget::mouseReleaseEvent(QMouseEvent* event) {
	const auto pos = event->position().toPoint();
#ifndef NDEBUG
	Logger().Log(Logging::LogLevel::Debug, std::format("Mouse click at: ({}, {})", pos.x(), pos.y()));
#endif

	if (event->button() != Qt::LeftButton) {
		QWidget::mouseReleaseEvent(event);
		return;
	}

	if (m_button && m_button->contains(pos.x(), pos.y())) {
		const auto kind = m_button->kind;
		m_button.reset(); // Region is consumed. The next frame provides a new one.
		m_session.onAction(kind);
		update();
	}
	event->accept();
}

} // namespace dicetrail::gui
