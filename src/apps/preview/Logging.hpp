#pragma once

#include "Logger/Logger.hpp"

namespace dicetrail::gui {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace dicetrail::gui
