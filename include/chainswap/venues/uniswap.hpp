// Chainswap - Uniswap Venue Base
// Shared approve-then-swap sequence, balance pre-flight and market scanning

#pragma once

#include <chainswap/chains/evm.hpp>
#include <chainswap/venue.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace chainswap {

inline constexpr uint64_t SWAP_DEADLINE_SECONDS = 300;

class UniswapVenue : public DexVenue {
public:
    [[nodiscard]] const std::string& chain() const override { return chain_; }
    [[nodiscard]] const std::string& router() const noexcept { return router_; }

    Decimal get_token_price(const TokenInfo& token_out, const TokenInfo& token_in) override;

    SwapResult swap(const TokenInfo& base_token, const TokenInfo& quote_token,
                    const Decimal& quote_amount,
                    long long slippage_bps = Slippage::DEFAULT_BPS) override;

    std::vector<Market> get_markets_for_tokens(const std::vector<TokenInfo>& tokens) override;

protected:
    // Throws UnsupportedChain when the context has no EVM client for a supported chain
    UniswapVenue(const VenueContext& context, std::string router);

    // Drops cached market references; called at the start of each operation
    virtual void clear_markets() = 0;

    // Whether a pool exists for the pair, caching the reference
    virtual bool has_market(const TokenInfo& a, const TokenInfo& b) = 0;

    // token_out per token_in from freshly read pool state; NoMarket without a pool
    virtual Decimal read_price(const TokenInfo& token_out, const TokenInfo& token_in) = 0;

    // Router call spending raw_in of quote for at least min_out of base
    virtual EvmCall build_swap_call(const TokenInfo& base_token, const TokenInfo& quote_token,
                                    const BigInt& raw_in, const BigInt& min_out,
                                    const std::string& recipient, uint64_t deadline) = 0;

    // Hook run after the minimum output is fixed and before the swap is broadcast
    virtual void before_swap(const TokenInfo& base_token, const TokenInfo& quote_token,
                             const BigInt& raw_in, const Slippage& slippage) {
        (void)base_token; (void)quote_token; (void)raw_in; (void)slippage;
    }

    EvmClient& evm_;

private:
    std::string chain_;
    std::string router_;
};

}  // namespace chainswap
