#pragma once

#include "Logger/Logger.hpp"

namespace kifu::library {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace kifu::library
