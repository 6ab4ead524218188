// Chainswap - Venue Registry Tests

#include <catch2/catch_test_macros.hpp>
#include <chainswap/registry.hpp>
#include "support/scripted_rpc.hpp"
#include "support/stub_venue.hpp"

using namespace chainswap;
using namespace chainswap::testing;

TEST_CASE("Builtin venues", "[registry]") {
    VenueRegistry registry = VenueRegistry::with_builtin_venues();

    SECTION("Names are listed in order") {
        REQUIRE(registry.names() == std::vector<std::string>{"jupiter", "uniswap_v2", "uniswap_v3"});
        REQUIRE(registry.contains(UNISWAP_V2));
        REQUIRE(registry.contains(UNISWAP_V3));
        REQUIRE(registry.contains(JUPITER));
        REQUIRE_FALSE(registry.contains("sushiswap"));
    }

    SECTION("Factories build the named venue") {
        Config config;
        ScriptedHttp http;
        auto venue = registry.create(JUPITER, VenueContext{config, "solana", nullptr, nullptr, &http});
        REQUIRE(venue->name() == "jupiter");
        REQUIRE(venue->chain() == "solana");
    }

    SECTION("Venue construction errors propagate") {
        Config config;
        REQUIRE_THROWS_AS(registry.create(UNISWAP_V2, VenueContext{config, "solana"}),
                          UnsupportedChain);
    }

    SECTION("Unknown names") {
        Config config;
        try {
            (void)registry.create("sushiswap", VenueContext{config, "ethereum"});
            FAIL("expected UnknownVenue");
        } catch (const UnknownVenue& e) {
            REQUIRE(std::string(e.what()).find("sushiswap") != std::string::npos);
        }
    }
}

TEST_CASE("Custom venue factories", "[registry]") {
    Config config;
    VenueRegistry registry;
    REQUIRE(registry.names().empty());

    registry.register_venue("stub", [](const VenueContext& ctx) -> std::unique_ptr<DexVenue> {
        return std::make_unique<StubVenue>("stub", ctx.chain, Decimal::from_integer(2));
    });
    REQUIRE(registry.create("stub", VenueContext{config, "base"})->chain() == "base");

    SECTION("Registering again replaces the factory") {
        registry.register_venue("stub", [](const VenueContext& ctx) -> std::unique_ptr<DexVenue> {
            return std::make_unique<StubVenue>("replacement", ctx.chain, std::nullopt);
        });
        REQUIRE(registry.names().size() == 1);
        REQUIRE(registry.create("stub", VenueContext{config, "base"})->name() == "replacement");
    }

    SECTION("Builtins can be overridden") {
        VenueRegistry builtins = VenueRegistry::with_builtin_venues();
        builtins.register_venue(UNISWAP_V2, [](const VenueContext& ctx) -> std::unique_ptr<DexVenue> {
            return std::make_unique<StubVenue>("fake_v2", ctx.chain, std::nullopt);
        });
        REQUIRE(builtins.names().size() == 3);
        REQUIRE(builtins.create(UNISWAP_V2, VenueContext{config, "solana"})->name() == "fake_v2");
    }
}
