// Chainswap - Jupiter Venue
// Quote-only client for the Jupiter aggregator on Solana mainnet

#pragma once

#include <chainswap/transport.hpp>
#include <chainswap/venue.hpp>
#include <string>
#include <vector>

namespace chainswap {

struct JupiterSwapInfo {
    std::string amm_key;
    std::string label;
    std::string input_mint;
    std::string output_mint;
    std::string in_amount;
    std::string out_amount;
    std::string fee_amount;
    std::string fee_mint;
};

struct JupiterRouteStep {
    JupiterSwapInfo swap_info;
    int percent = 0;
};

struct JupiterQuoteResponse {
    BigInt out_amount;
    std::vector<JupiterRouteStep> route_plan;

    // Throws ApiError when required fields are missing
    static JupiterQuoteResponse from_json(const json& j);

    // ammKey of every hop joined by '/'
    [[nodiscard]] std::string route_to_string() const;
};

class JupiterVenue : public DexVenue {
public:
    explicit JupiterVenue(const VenueContext& context);

    [[nodiscard]] std::string_view name() const override { return "jupiter"; }
    [[nodiscard]] const std::string& chain() const override { return chain_; }

    // Quotes exactly 1 token_in
    Decimal get_token_price(const TokenInfo& token_out, const TokenInfo& token_in) override;

    Quote quote(const TokenInfo& token_out, const TokenInfo& token_in,
                const Decimal& amount_in) override;

    // Always throws NotImplemented
    SwapResult swap(const TokenInfo& base_token, const TokenInfo& quote_token,
                    const Decimal& quote_amount,
                    long long slippage_bps = Slippage::DEFAULT_BPS) override;

    // Pairs for which the aggregator finds a route
    std::vector<Market> get_markets_for_tokens(const std::vector<TokenInfo>& tokens) override;

private:
    std::string chain_;
    HttpTransport& http_;
    JupiterSettings settings_;
};

}  // namespace chainswap
