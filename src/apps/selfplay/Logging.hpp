#pragma once

#include "Logger/Logger.hpp"

namespace vhex::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace vhex::app
