// Chainswap - Uniswap V2 Venue
// Constant-product pairs priced from reserves, swaps through Router02

#pragma once

#include <chainswap/venues/deployments.hpp>
#include <chainswap/venues/uniswap.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace chainswap {

class UniswapV2Venue : public UniswapVenue {
public:
    explicit UniswapV2Venue(const VenueContext& context);

    [[nodiscard]] std::string_view name() const override { return "uniswap_v2"; }
    [[nodiscard]] const std::string& factory() const noexcept { return deployment_.factory; }

    // Pair contract for the tokens, or nullopt when the factory has none
    std::optional<std::string> get_pair(const TokenInfo& a, const TokenInfo& b);

protected:
    void clear_markets() override;
    bool has_market(const TokenInfo& a, const TokenInfo& b) override;
    Decimal read_price(const TokenInfo& token_out, const TokenInfo& token_in) override;
    EvmCall build_swap_call(const TokenInfo& base_token, const TokenInfo& quote_token,
                            const BigInt& raw_in, const BigInt& min_out,
                            const std::string& recipient, uint64_t deadline) override;

private:
    uniswap_deployments::V2Deployment deployment_;

    std::mutex markets_mutex_;
    std::map<std::string, std::optional<std::string>> pairs_;  // "a:b" -> pair
};

}  // namespace chainswap
