// Chainswap - Venue Registry
// Maps venue identifiers to factories; built once at startup and passed by reference

#pragma once

#include <chainswap/venue.hpp>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chainswap {

inline constexpr const char* UNISWAP_V2 = "uniswap_v2";
inline constexpr const char* UNISWAP_V3 = "uniswap_v3";
inline constexpr const char* JUPITER = "jupiter";

class VenueRegistry {
public:
    VenueRegistry() = default;

    // Registry with uniswap_v2, uniswap_v3 and jupiter
    static VenueRegistry with_builtin_venues();

    // Replaces any factory already registered under `name`
    VenueRegistry& register_venue(std::string_view name, VenueFactory factory);

    // Throws UnknownVenue for unregistered names
    [[nodiscard]] std::unique_ptr<DexVenue> create(std::string_view name,
                                                   const VenueContext& context) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    std::map<std::string, VenueFactory, std::less<>> factories_;
};

}  // namespace chainswap
