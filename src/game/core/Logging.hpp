#pragma once

#include "Logger/Logger.hpp"

namespace monopoly {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace monopoly
