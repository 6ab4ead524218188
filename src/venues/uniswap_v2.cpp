// Chainswap - Uniswap V2 Venue Implementation

#include <chainswap/venues/uniswap_v2.hpp>
#include <chainswap/abi.hpp>
#include <chainswap/amm.hpp>
#include <spdlog/spdlog.h>

namespace chainswap {

namespace {

uniswap_deployments::V2Deployment require_v2(const std::string& chain) {
    auto deployment = uniswap_deployments::v2(chain);
    if (!deployment) {
        throw UnsupportedChain(chain, "Uniswap V2 is not deployed on " + chain);
    }
    return *deployment;
}

std::string pair_key(const TokenInfo& a, const TokenInfo& b) {
    auto [first, second] = canonical_order(a, b);
    return first.address_key() + ":" + second.address_key();
}

}  // namespace

UniswapV2Venue::UniswapV2Venue(const VenueContext& context)
    : UniswapVenue(context, require_v2(context.chain).router),
      deployment_(require_v2(context.chain)) {}

void UniswapV2Venue::clear_markets() {
    std::lock_guard<std::mutex> lock(markets_mutex_);
    pairs_.clear();
}

std::optional<std::string> UniswapV2Venue::get_pair(const TokenInfo& a, const TokenInfo& b) {
    std::string key = pair_key(a, b);
    {
        std::lock_guard<std::mutex> lock(markets_mutex_);
        auto it = pairs_.find(key);
        if (it != pairs_.end()) return it->second;
    }

    Bytes data = abi::Encoder(abi::selector::GET_PAIR)
                     .add_address(a.address)
                     .add_address(b.address)
                     .build();
    std::string pair = abi::Decoder(evm_.call(deployment_.factory, data)).address_at(0);

    std::optional<std::string> found;
    if (pair != abi::ZERO_ADDRESS) {
        found = pair;
        spdlog::debug("V2 pair for {}/{}: {}", a.symbol, b.symbol, pair);
    }
    std::lock_guard<std::mutex> lock(markets_mutex_);
    pairs_[key] = found;
    return found;
}

bool UniswapV2Venue::has_market(const TokenInfo& a, const TokenInfo& b) {
    return get_pair(a, b).has_value();
}

Decimal UniswapV2Venue::read_price(const TokenInfo& token_out, const TokenInfo& token_in) {
    std::optional<std::string> pair = get_pair(token_out, token_in);
    if (!pair) {
        throw NoMarket("No Uniswap V2 pair for " + token_out.to_string() + "/" +
                       token_in.to_string());
    }

    abi::Decoder reserves(evm_.call(*pair, abi::Encoder(abi::selector::GET_RESERVES).build()));
    if (reserves.word_count() < 2) {
        throw DecodeError("getReserves returned " + std::to_string(reserves.data().size()) +
                          " bytes");
    }
    BigInt reserve0 = reserves.uint_at(0);
    BigInt reserve1 = reserves.uint_at(1);

    // The priced token is the pricing base: out per in
    bool in_is_token0 = address_less(token_in.address, token_out.address);
    const TokenInfo& token0 = in_is_token0 ? token_in : token_out;
    const TokenInfo& token1 = in_is_token0 ? token_out : token_in;
    spdlog::debug("V2 reserves of {}: {} {} / {} {}", *pair, reserve0.str(), token0.symbol,
                  reserve1.str(), token1.symbol);

    return amm::v2_mid_price(reserve0, reserve1, token0.decimals, token1.decimals,
                             !in_is_token0);
}

EvmCall UniswapV2Venue::build_swap_call(const TokenInfo& base_token, const TokenInfo& quote_token,
                                        const BigInt& raw_in, const BigInt& min_out,
                                        const std::string& recipient, uint64_t deadline) {
    Bytes data = abi::Encoder(abi::selector::SWAP_EXACT_TOKENS_FOR_TOKENS)
                     .add_uint(raw_in)
                     .add_uint(min_out)
                     .add_address_array({quote_token.address, base_token.address})
                     .add_address(recipient)
                     .add_uint(BigInt(deadline))
                     .build();
    return EvmCall{deployment_.router, std::move(data)};
}

}  // namespace chainswap
