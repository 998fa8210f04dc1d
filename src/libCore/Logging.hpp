#pragma once

#include "Logger/Logger.hpp"

namespace kifu::core {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace kifu::core
