#include "MainWindow.hpp"

#include <QApplication>

int main(int argc, char* argv[]) {
	QApplication application(argc, argv);

	// Setup and show UI
	dicetrail::gui::MainWindow window;
	window.show();

	const auto exitCode = application.exec();
	return exitCode;
}
