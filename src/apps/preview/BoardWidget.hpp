#pragma once

#include "config/INicknameProvider.hpp"
#include "previewSession.hpp"
#include "render/renderer.hpp"

#include <QElapsedTimer>
#include <QTimer>
#include <QWidget>

#include <optional>

namespace dicetrail::gui {

//! Paints the session through the renderer and forwards clicks on the action button.
class BoardWidget : public QWidget {
	Q_OBJECT

public:
	BoardWidget(PreviewSession& session, const render::Renderer& renderer, const config::INicknameProvider& nicknames, QWidget* parent = nullptr);

protected:
	void paintEvent(QPaintEvent* event) override;
	void mouseReleaseEvent(QMouseEvent* event) override;

private:
	void onFrame(); //!< Advance the session and schedule a repaint.

private:
	PreviewSession& m_session;
	const render::Renderer& m_renderer;
	const config::INicknameProvider& m_nicknames;

	std::optional<render::ButtonRegion> m_button; //!< Button of the last painted frame.

	QTimer m_frameTimer;
	QElapsedTimer m_clock; //!< Time since the last frame.
};

} // namespace dicetrail::gui
