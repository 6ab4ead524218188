// Chainswap - Venue Registry Implementation

#include <chainswap/registry.hpp>
#include <chainswap/venues/jupiter.hpp>
#include <chainswap/venues/uniswap_v2.hpp>
#include <chainswap/venues/uniswap_v3.hpp>
#include <spdlog/spdlog.h>

namespace chainswap {

VenueRegistry VenueRegistry::with_builtin_venues() {
    VenueRegistry registry;
    registry.register_venue(UNISWAP_V2, [](const VenueContext& ctx) -> std::unique_ptr<DexVenue> {
        return std::make_unique<UniswapV2Venue>(ctx);
    });
    registry.register_venue(UNISWAP_V3, [](const VenueContext& ctx) -> std::unique_ptr<DexVenue> {
        return std::make_unique<UniswapV3Venue>(ctx);
    });
    registry.register_venue(JUPITER, [](const VenueContext& ctx) -> std::unique_ptr<DexVenue> {
        return std::make_unique<JupiterVenue>(ctx);
    });
    return registry;
}

VenueRegistry& VenueRegistry::register_venue(std::string_view name, VenueFactory factory) {
    auto it = factories_.find(name);
    if (it != factories_.end()) {
        spdlog::debug("Replacing venue factory {}", name);
        it->second = std::move(factory);
    } else {
        factories_.emplace(std::string(name), std::move(factory));
    }
    return *this;
}

std::unique_ptr<DexVenue> VenueRegistry::create(std::string_view name,
                                                const VenueContext& context) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        throw UnknownVenue(std::string(name));
    }
    spdlog::debug("Creating venue {} on {}", name, context.chain);
    return it->second(context);
}

bool VenueRegistry::contains(std::string_view name) const {
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> VenueRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        out.push_back(name);
    }
    return out;
}

}  // namespace chainswap
