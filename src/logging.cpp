// Chainswap - Logging Implementation

#include <chainswap/logging.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace chainswap {

void configure_logging(std::string_view level) {
    std::string name(level);
    auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', using info", name);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

}  // namespace chainswap
