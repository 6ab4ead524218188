// Chainswap - Types Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <chainswap/types.hpp>

using namespace chainswap;
using Catch::Approx;

TEST_CASE("Decimal parsing and formatting", "[types]") {
    SECTION("Trailing zeros are dropped") {
        REQUIRE(Decimal::from_string("1.50").to_string() == "1.5");
        REQUIRE(Decimal::from_string("100").to_string() == "100");
        REQUIRE(Decimal::from_string("0.000").to_string() == "0");
    }

    SECTION("Leading zeros and signs") {
        REQUIRE(Decimal::from_string("007.25").to_string() == "7.25");
        REQUIRE(Decimal::from_string("-0.5").to_string() == "-0.5");
        REQUIRE(Decimal::from_string("+3").to_string() == "3");
    }

    SECTION("Exponents") {
        REQUIRE(Decimal::from_string("1.23e2") == Decimal::from_integer(123));
        REQUIRE(Decimal::from_string("5e-3").to_string() == "0.005");
    }

    SECTION("Invalid input") {
        REQUIRE_THROWS_AS(Decimal::from_string(""), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("abc"), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("1.2.3"), std::invalid_argument);
    }

    SECTION("Small values keep their leading zeros") {
        REQUIRE(Decimal::from_base_units(5, 6).to_string() == "0.000005");
    }
}

TEST_CASE("Decimal arithmetic", "[types]") {
    Decimal a = Decimal::from_string("1.25");
    Decimal b = Decimal::from_string("0.75");

    SECTION("Exact addition and subtraction") {
        REQUIRE((a + b) == Decimal::from_integer(2));
        REQUIRE((a - b).to_string() == "0.5");
        REQUIRE((b - a).to_string() == "-0.5");
    }

    SECTION("Exact multiplication") {
        REQUIRE((a * b).to_string() == "0.9375");
    }

    SECTION("Division truncates at fixed precision") {
        Decimal third = Decimal::one() / Decimal::from_integer(3);
        REQUIRE(third.scale() == Decimal::DIVISION_PRECISION);
        REQUIRE(third.to_double() == Approx(0.3333333));
        REQUIRE((a / b).to_double() == Approx(1.6666667));
    }

    SECTION("Division by zero") {
        REQUIRE_THROWS_AS(a / Decimal::zero(), std::domain_error);
    }

    SECTION("Comparisons across scales") {
        REQUIRE(Decimal::from_string("2.0") == Decimal::from_integer(2));
        REQUIRE(b < a);
        REQUIRE(a >= a);
        REQUIRE(Decimal::from_string("-1").is_negative());
        REQUIRE(Decimal::zero().is_zero());
        REQUIRE(Decimal::from_string("-2.5").abs().to_string() == "2.5");
    }
}

TEST_CASE("Base unit conversion", "[types]") {
    SECTION("Whole units scale by decimals") {
        REQUIRE(Decimal::from_string("1.5").to_base_units(6) == BigInt(1500000));
        REQUIRE(Decimal::from_integer(1).to_base_units(18) == BigInt("1000000000000000000"));
        REQUIRE(Decimal::from_integer(7).to_base_units(0) == BigInt(7));
    }

    SECTION("Excess precision truncates toward zero") {
        REQUIRE(Decimal::from_string("1.2345678").to_base_units(6) == BigInt(1234567));
        REQUIRE(Decimal::from_string("0.0000001").to_base_units(6) == BigInt(0));
    }

    SECTION("Round trip through raw amounts") {
        for (unsigned decimals : {0u, 6u, 9u, 18u}) {
            BigInt raw("123456789012345678901");
            REQUIRE(Decimal::from_base_units(raw, decimals).to_base_units(decimals) == raw);
        }
    }

    SECTION("Token helpers") {
        TokenInfo usdc{"USDC", "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48", 6, "ethereum"};
        REQUIRE(usdc.to_base_units(Decimal::from_string("2.5")) == BigInt(2500000));
        REQUIRE(usdc.from_base_units(BigInt(1)).to_string() == "0.000001");

        TokenAmount amount = TokenAmount::from_base_units(usdc, BigInt(3000000));
        REQUIRE(amount.value == Decimal::from_integer(3));
        REQUIRE(amount.base_units() == BigInt(3000000));
    }
}

TEST_CASE("Token identity", "[types]") {
    TokenInfo weth{"WETH", "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2", 18, "ethereum"};
    TokenInfo lower = weth;
    lower.address = "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2";
    lower.symbol = "Wrapped Ether";

    SECTION("Address comparison ignores case and symbol") {
        REQUIRE(weth == lower);
    }

    SECTION("Same address on another chain is a different token") {
        TokenInfo other = weth;
        other.chain = "base";
        REQUIRE(weth != other);
    }

    SECTION("Base58 addresses are case sensitive") {
        REQUIRE(normalize_address("So11111111111111111111111111111111111111112") ==
                "So11111111111111111111111111111111111111112");
        REQUIRE(normalize_address("0xABCDEF") == "0xabcdef");
    }

    SECTION("Canonical order sorts by address") {
        TokenInfo usdc{"USDC", "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48", 6, "ethereum"};
        auto [first, second] = canonical_order(weth, usdc);
        REQUIRE(first.symbol == "USDC");
        REQUIRE(second.symbol == "WETH");
        auto [first2, second2] = canonical_order(usdc, weth);
        REQUIRE(first2.symbol == "USDC");
        REQUIRE(second2.symbol == "WETH");
    }
}

TEST_CASE("Slippage", "[types]") {
    SECTION("Bounds") {
        REQUIRE_THROWS_AS(Slippage(-1), InvalidSlippage);
        REQUIRE_THROWS_AS(Slippage(10001), InvalidSlippage);
        REQUIRE_NOTHROW(Slippage(0));
        REQUIRE_NOTHROW(Slippage(10000));
        REQUIRE(Slippage().bps() == 100);
    }

    SECTION("Minimum amount floors") {
        REQUIRE(Slippage(100).minimum_amount(BigInt(10000)) == BigInt(9900));
        REQUIRE(Slippage(50).minimum_amount(BigInt(999)) == BigInt(994));
        REQUIRE(Slippage(0).minimum_amount(BigInt(12345)) == BigInt(12345));
        REQUIRE(Slippage(10000).minimum_amount(BigInt(12345)) == BigInt(0));
    }

    SECTION("Minimum never exceeds the input") {
        for (long long bps : {0LL, 1LL, 30LL, 100LL, 9999LL, 10000LL}) {
            BigInt raw("1000000000000000001");
            REQUIRE(Slippage(bps).minimum_amount(raw) <= raw);
        }
    }

    SECTION("Percentage conversions") {
        REQUIRE(Slippage::from_percentage(Decimal::from_string("1.5")).bps() == 150);
        REQUIRE(Slippage(250).to_percentage().to_string() == "2.5");
        REQUIRE(Slippage(100).to_multiplier().to_string() == "0.99");
        REQUIRE_THROWS_AS(Slippage::from_percentage(Decimal::from_integer(101)), InvalidSlippage);
    }
}

TEST_CASE("SwapResult builders", "[types]") {
    SECTION("Success") {
        SwapResult r = SwapResult::build_success(Decimal::from_integer(10),
                                                 Decimal::from_string("0.004"), "0xabc");
        REQUIRE(r.success);
        REQUIRE(r.stage == SwapStage::Confirmed);
        REQUIRE(r.tx_hash == std::optional<std::string>("0xabc"));
        REQUIRE_FALSE(r.error.has_value());
    }

    SECTION("Error keeps the hash when one exists") {
        SwapResult r = SwapResult::build_error(Decimal::zero(), "STF", std::string("0xdef"));
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error == std::optional<std::string>("STF"));
        REQUIRE(r.amount_received.is_zero());
        REQUIRE(r.tx_hash == std::optional<std::string>("0xdef"));
    }

    SECTION("Stage names") {
        REQUIRE(std::string(to_string(SwapStage::TimedOut)) == "timed_out");
        REQUIRE(std::string(to_string(SwapStage::NotApproved)) == "not_approved");
    }
}
