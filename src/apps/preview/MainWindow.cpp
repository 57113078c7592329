#include "MainWindow.hpp"

#include "Logging.hpp"

#include <format>

namespace dicetrail::gui {

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent),
      m_renderer{render::FontSet::load(render::FontSet::fromFiles(m_config.fontCandidates()), m_config.systemFontFamily())} {
	setWindowTitle("Dicetrail");
	buildLayout();

	Logger().Log(Logging::LogLevel::Info, std::format("Preview started for '{}'.", m_config.nickname()));
}

MainWindow::~MainWindow() {
	m_config.sync();
}

void MainWindow::buildLayout() {
	m_boardWidget = new BoardWidget(m_session, m_renderer, m_config, this);
	setCentralWidget(m_boardWidget);
}

} // namespace dicetrail::gui
