// Chainswap - DEX Venue Interface
// Uniform pricing, quoting and swapping contract implemented by every venue

#pragma once

#include <chainswap/config.hpp>
#include <chainswap/types.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chainswap {

class EvmClient;
class SolanaClient;
class HttpTransport;

// Chain-scoped construction inputs. Clients are borrowed and must outlive the venue.
struct VenueContext {
    const Config& config;
    std::string chain;
    EvmClient* evm = nullptr;
    SolanaClient* solana = nullptr;
    HttpTransport* http = nullptr;
};

class DexVenue {
public:
    virtual ~DexVenue() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual const std::string& chain() const = 0;

    // Amount of token_out received per 1 unit of token_in
    virtual Decimal get_token_price(const TokenInfo& token_out, const TokenInfo& token_in) = 0;

    // Expected output for amount_in; venues with routing override this
    virtual Quote quote(const TokenInfo& token_out, const TokenInfo& token_in,
                        const Decimal& amount_in) {
        Decimal price = get_token_price(token_out, token_in);
        return Quote{token_out, token_in, amount_in, amount_in * price, price, {}};
    }

    // Spends quote_amount of quote_token to acquire base_token
    virtual SwapResult swap(const TokenInfo& base_token, const TokenInfo& quote_token,
                            const Decimal& quote_amount,
                            long long slippage_bps = Slippage::DEFAULT_BPS) = 0;

    // Tradable pairs among `tokens`, each once, in ascending address order
    virtual std::vector<Market> get_markets_for_tokens(const std::vector<TokenInfo>& tokens) = 0;

protected:
    // Throws UnsupportedChain for tokens from another chain
    void require_chain(const TokenInfo& token) const {
        if (token.chain != chain()) {
            throw UnsupportedChain(token.chain, std::string(name()) + " on " + chain() +
                                                    " cannot trade " + token.to_string());
        }
    }
};

// Venue factory type
using VenueFactory = std::function<std::unique_ptr<DexVenue>(const VenueContext&)>;

}  // namespace chainswap
