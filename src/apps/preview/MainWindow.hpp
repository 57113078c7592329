#pragma once

#include "BoardWidget.hpp"
#include "config/configManager.hpp"
#include "previewSession.hpp"
#include "render/renderer.hpp"

#include <QMainWindow>

namespace dicetrail::gui {

class MainWindow : public QMainWindow {
	Q_OBJECT

public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

private:
	//! Initial setup constructing the layout of the window.
	void buildLayout();

private:
	config::ConfigManager m_config;
	render::Renderer m_renderer;
	PreviewSession m_session;

	BoardWidget* m_boardWidget = nullptr;
};

} // namespace dicetrail::gui
