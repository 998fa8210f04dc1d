#pragma once

#include "Logger/Logger.hpp"

namespace kifu::sgf {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace kifu::sgf
