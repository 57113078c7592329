#pragma once

#include "Logger/Logger.hpp"

namespace dicetrail::config {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace dicetrail::config
