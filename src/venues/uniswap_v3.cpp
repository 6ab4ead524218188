// Chainswap - Uniswap V3 Venue Implementation

#include <chainswap/venues/uniswap_v3.hpp>
#include <chainswap/abi.hpp>
#include <spdlog/spdlog.h>

namespace chainswap {

namespace {

uniswap_deployments::V3Deployment require_v3(const std::string& chain) {
    auto deployment = uniswap_deployments::v3(chain);
    if (!deployment) {
        throw UnsupportedChain(chain, "Uniswap V3 is not deployed on " + chain);
    }
    return *deployment;
}

std::string pool_key(const TokenInfo& a, const TokenInfo& b) {
    auto [first, second] = canonical_order(a, b);
    return first.address_key() + ":" + second.address_key();
}

}  // namespace

UniswapV3Venue::UniswapV3Venue(const VenueContext& context)
    : UniswapVenue(context, require_v3(context.chain).router),
      deployment_(require_v3(context.chain)),
      fee_tiers_(context.config.uniswap_v3.fee_tiers) {
    if (fee_tiers_.empty()) {
        throw EngineError("Uniswap V3 needs at least one fee tier");
    }
}

void UniswapV3Venue::clear_markets() {
    std::lock_guard<std::mutex> lock(markets_mutex_);
    pools_.clear();
}

BigInt UniswapV3Venue::read_liquidity(const std::string& pool) {
    return abi::Decoder(evm_.call(pool, abi::Encoder(abi::selector::LIQUIDITY).build())).uint_at(0);
}

std::optional<amm::PoolCandidate> UniswapV3Venue::find_pool(const TokenInfo& a, const TokenInfo& b) {
    std::string key = pool_key(a, b);
    {
        std::lock_guard<std::mutex> lock(markets_mutex_);
        auto it = pools_.find(key);
        if (it != pools_.end()) return it->second;
    }

    std::vector<amm::PoolCandidate> candidates;
    for (uint32_t fee : fee_tiers_) {
        Bytes data = abi::Encoder(abi::selector::GET_POOL)
                         .add_address(a.address)
                         .add_address(b.address)
                         .add_uint(BigInt(fee))
                         .build();
        std::string pool = abi::Decoder(evm_.call(deployment_.factory, data)).address_at(0);
        if (pool == abi::ZERO_ADDRESS) {
            spdlog::debug("No V3 pool for {}/{} at fee {}", a.symbol, b.symbol, fee);
            continue;
        }
        BigInt liquidity = read_liquidity(pool);
        spdlog::debug("V3 pool {} for {}/{} at fee {} has liquidity {}", pool, a.symbol, b.symbol,
                      fee, liquidity.str());
        candidates.push_back(amm::PoolCandidate{pool, fee, liquidity});
    }

    std::optional<amm::PoolCandidate> best = amm::select_deepest_pool(candidates);
    if (best) {
        spdlog::info("Selected V3 pool {} (fee {}) for {}/{}", best->address, best->fee,
                     a.symbol, b.symbol);
    }
    std::lock_guard<std::mutex> lock(markets_mutex_);
    pools_[key] = best;
    return best;
}

amm::PoolCandidate UniswapV3Venue::require_pool(const TokenInfo& a, const TokenInfo& b) {
    std::optional<amm::PoolCandidate> pool = find_pool(a, b);
    if (!pool) {
        throw NoMarket("No Uniswap V3 pool for " + a.to_string() + "/" + b.to_string() +
                       " in any fee tier");
    }
    return *pool;
}

bool UniswapV3Venue::has_market(const TokenInfo& a, const TokenInfo& b) {
    return find_pool(a, b).has_value();
}

Decimal UniswapV3Venue::read_price(const TokenInfo& token_out, const TokenInfo& token_in) {
    amm::PoolCandidate pool = require_pool(token_out, token_in);
    BigInt sqrt_price_x96 =
        abi::Decoder(evm_.call(pool.address, abi::Encoder(abi::selector::SLOT0).build())).uint_at(0);

    bool in_is_token0 = address_less(token_in.address, token_out.address);
    const TokenInfo& token0 = in_is_token0 ? token_in : token_out;
    const TokenInfo& token1 = in_is_token0 ? token_out : token_in;
    spdlog::debug("V3 pool {} sqrtPriceX96 {}", pool.address, sqrt_price_x96.str());

    return amm::v3_price(sqrt_price_x96, token0.decimals, token1.decimals, !in_is_token0);
}

void UniswapV3Venue::before_swap(const TokenInfo& base_token, const TokenInfo& quote_token,
                                 const BigInt& raw_in, const Slippage& slippage) {
    amm::PoolCandidate pool = require_pool(base_token, quote_token);
    BigInt liquidity = read_liquidity(pool.address);

    std::optional<BigInt> impact = amm::estimate_price_impact_bps(raw_in, liquidity);
    if (!impact) {
        spdlog::warn("V3 pool {} reports zero liquidity; price impact cannot be estimated",
                     pool.address);
        return;
    }
    spdlog::info("Estimated price impact {} bps (linear approximation)", impact->str());
    if (amm::impact_exceeds_tolerance(*impact, slippage.bps())) {
        spdlog::warn("Estimated price impact {} bps is above two thirds of the {} bps slippage "
                     "tolerance; little margin remains for price movement before execution",
                     impact->str(), slippage.bps());
    }
}

EvmCall UniswapV3Venue::build_swap_call(const TokenInfo& base_token, const TokenInfo& quote_token,
                                        const BigInt& raw_in, const BigInt& min_out,
                                        const std::string& recipient, uint64_t deadline) {
    amm::PoolCandidate pool = require_pool(base_token, quote_token);

    if (deployment_.router_kind == uniswap_deployments::RouterKind::SwapRouter) {
        Bytes data = abi::Encoder(abi::selector::EXACT_INPUT_SINGLE)
                         .add_address(quote_token.address)
                         .add_address(base_token.address)
                         .add_uint(BigInt(pool.fee))
                         .add_address(recipient)
                         .add_uint(BigInt(deadline))
                         .add_uint(raw_in)
                         .add_uint(min_out)
                         .add_uint(0)  // sqrtPriceLimitX96
                         .build();
        return EvmCall{deployment_.router, std::move(data)};
    }

    Bytes inner = abi::Encoder(abi::selector::EXACT_INPUT_SINGLE_02)
                      .add_address(quote_token.address)
                      .add_address(base_token.address)
                      .add_uint(BigInt(pool.fee))
                      .add_address(recipient)
                      .add_uint(raw_in)
                      .add_uint(min_out)
                      .add_uint(0)  // sqrtPriceLimitX96
                      .build();
    Bytes data = abi::Encoder(abi::selector::MULTICALL_WITH_DEADLINE)
                     .add_uint(BigInt(deadline))
                     .add_bytes_array({inner})
                     .build();
    return EvmCall{deployment_.router, std::move(data)};
}

}  // namespace chainswap
