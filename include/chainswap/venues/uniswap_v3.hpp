// Chainswap - Uniswap V3 Venue
// Concentrated-liquidity pools: deepest fee tier wins, swaps through SwapRouter or SwapRouter02

#pragma once

#include <chainswap/amm.hpp>
#include <chainswap/venues/deployments.hpp>
#include <chainswap/venues/uniswap.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chainswap {

class UniswapV3Venue : public UniswapVenue {
public:
    explicit UniswapV3Venue(const VenueContext& context);

    [[nodiscard]] std::string_view name() const override { return "uniswap_v3"; }
    [[nodiscard]] const std::vector<uint32_t>& fee_tiers() const noexcept { return fee_tiers_; }
    [[nodiscard]] uniswap_deployments::RouterKind router_kind() const noexcept {
        return deployment_.router_kind;
    }

    // Pool with the highest liquidity across the configured fee tiers
    std::optional<amm::PoolCandidate> find_pool(const TokenInfo& a, const TokenInfo& b);

protected:
    void clear_markets() override;
    bool has_market(const TokenInfo& a, const TokenInfo& b) override;
    Decimal read_price(const TokenInfo& token_out, const TokenInfo& token_in) override;
    EvmCall build_swap_call(const TokenInfo& base_token, const TokenInfo& quote_token,
                            const BigInt& raw_in, const BigInt& min_out,
                            const std::string& recipient, uint64_t deadline) override;
    void before_swap(const TokenInfo& base_token, const TokenInfo& quote_token,
                     const BigInt& raw_in, const Slippage& slippage) override;

private:
    amm::PoolCandidate require_pool(const TokenInfo& a, const TokenInfo& b);
    BigInt read_liquidity(const std::string& pool);

    uniswap_deployments::V3Deployment deployment_;
    std::vector<uint32_t> fee_tiers_;

    std::mutex markets_mutex_;
    std::map<std::string, std::optional<amm::PoolCandidate>> pools_;
};

}  // namespace chainswap
