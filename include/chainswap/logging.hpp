// Chainswap - Logging
// Engine logs go through the spdlog default logger

#pragma once

#include <string_view>

namespace chainswap {

// Applies a level name (trace, debug, info, warn, error, critical, off).
// Unknown names fall back to info with a warning.
void configure_logging(std::string_view level);

}  // namespace chainswap
