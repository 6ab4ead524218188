// Chainswap - AMM Math Implementation

#include <chainswap/amm.hpp>
#include <utility>

namespace chainswap::amm {

namespace {

const BigInt& q192() {
    static const BigInt value = BigInt(1) << 192;
    return value;
}

}  // namespace

Decimal v2_mid_price(const BigInt& reserve0, const BigInt& reserve1,
                     unsigned decimals0, unsigned decimals1, bool reverse) {
    if (reserve0.is_zero() || reserve1.is_zero()) {
        throw NoMarket("Pair has empty reserves");
    }
    Decimal amount0 = Decimal::from_base_units(reserve0, decimals0);
    Decimal amount1 = Decimal::from_base_units(reserve1, decimals1);
    return reverse ? amount0 / amount1 : amount1 / amount0;
}

namespace {

// Both orientations divide exact integers once; a price that truncates to zero
// is below Decimal precision and has no usable market
Decimal pool_price(const BigInt& sqrt_price_x96, unsigned decimals0, unsigned decimals1,
                   bool reverse) {
    if (sqrt_price_x96.is_zero()) {
        throw NoMarket("Pool is not initialized");
    }
    BigInt numerator = sqrt_price_x96 * sqrt_price_x96;
    BigInt denominator = q192();
    if (decimals0 >= decimals1) {
        numerator *= Decimal::pow10(decimals0 - decimals1);
    } else {
        denominator *= Decimal::pow10(decimals1 - decimals0);
    }
    if (reverse) std::swap(numerator, denominator);

    Decimal price = Decimal::from_integer(numerator) / Decimal::from_integer(denominator);
    if (price.is_zero()) {
        throw NoMarket("Pool price at sqrtPriceX96 " + sqrt_price_x96.str() +
                       " is below representable precision");
    }
    return price;
}

}  // namespace

Decimal sqrt_price_x96_to_price(const BigInt& sqrt_price_x96, unsigned decimals0,
                                unsigned decimals1) {
    return pool_price(sqrt_price_x96, decimals0, decimals1, false);
}

Decimal v3_price(const BigInt& sqrt_price_x96, unsigned decimals0, unsigned decimals1,
                 bool reverse) {
    return pool_price(sqrt_price_x96, decimals0, decimals1, reverse);
}

std::optional<BigInt> estimate_price_impact_bps(const BigInt& raw_input, const BigInt& liquidity) {
    if (liquidity.is_zero()) {
        return std::nullopt;
    }
    BigInt impact = raw_input * 10000 / liquidity;
    return impact;
}

bool impact_exceeds_tolerance(const BigInt& impact_bps, long long slippage_bps) {
    return impact_bps * 3 > BigInt(slippage_bps) * 2;
}

std::optional<PoolCandidate> select_deepest_pool(const std::vector<PoolCandidate>& candidates) {
    std::optional<PoolCandidate> best;
    for (const auto& candidate : candidates) {
        if (!best || candidate.liquidity > best->liquidity) {
            best = candidate;
        }
    }
    return best;
}

}  // namespace chainswap::amm
