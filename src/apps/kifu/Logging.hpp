#pragma once

#include "Logger/Logger.hpp"

namespace kifu::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace kifu::app
