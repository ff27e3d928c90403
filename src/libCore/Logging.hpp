#pragma once

#include "Logger/Logger.hpp"

namespace ftf {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace ftf
