// Chainswap - AMM Math
// Pure pricing functions for constant-product and concentrated-liquidity pools

#pragma once

#include <chainswap/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chainswap::amm {

// Both price functions report quote per base. Pools store token0/token1 in ascending
// address order; `reverse` is set when the base token is the pool's token1.

// Mid price from reserves (reserve0 of token0, reserve1 of token1).
// Throws NoMarket when either reserve is empty.
Decimal v2_mid_price(const BigInt& reserve0, const BigInt& reserve1,
                     unsigned decimals0, unsigned decimals1, bool reverse);

// token1 per token0 = (sqrtPriceX96 / 2^96)^2 * 10^(decimals0 - decimals1)
Decimal sqrt_price_x96_to_price(const BigInt& sqrt_price_x96, unsigned decimals0,
                                unsigned decimals1);

Decimal v3_price(const BigInt& sqrt_price_x96, unsigned decimals0, unsigned decimals1,
                 bool reverse);

// Linear approximation: raw_input * 10000 / liquidity.
// Ignores tick crossings, so it understates impact on thin pools. nullopt for zero liquidity.
std::optional<BigInt> estimate_price_impact_bps(const BigInt& raw_input, const BigInt& liquidity);

// True when impact leaves less than a third of the slippage tolerance as margin
bool impact_exceeds_tolerance(const BigInt& impact_bps, long long slippage_bps);

struct PoolCandidate {
    std::string address;
    uint32_t fee = 0;
    BigInt liquidity;
};

// Highest liquidity wins; ties keep the earlier candidate
std::optional<PoolCandidate> select_deepest_pool(const std::vector<PoolCandidate>& candidates);

}  // namespace chainswap::amm
