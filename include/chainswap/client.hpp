// Chainswap - Unified Client
// Owns chain clients and venues per chain; routes pricing and swaps by venue name

#pragma once

#include <chainswap/chains/evm.hpp>
#include <chainswap/chains/solana.hpp>
#include <chainswap/config.hpp>
#include <chainswap/registry.hpp>
#include <chainswap/transport.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chainswap {

struct VenuePrice {
    std::string venue;
    Decimal price;
};

class Client {
public:
    explicit Client(Config config);
    Client(Config config, VenueRegistry registry,
           std::unique_ptr<TransportFactory> transports = nullptr);
    ~Client();

    // Disallow copy
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] const VenueRegistry& registry() const noexcept { return registry_; }

    // Chain clients, created on first use. Throw UnsupportedChain for unconfigured
    // chains or chains of the other family.
    EvmClient& evm(std::string_view chain);
    SolanaClient& solana(std::string_view chain);

    // Venue bound to a chain, created on first use
    DexVenue& venue(std::string_view name, std::string_view chain);

    // =========================================================================
    // Market Data
    // =========================================================================

    // token_out per token_in on the named venue
    Decimal get_token_price(const TokenInfo& token_out, const TokenInfo& token_in,
                            std::string_view venue_name);

    // Prices from every venue configured for the tokens' chain; failing venues are
    // logged and skipped, NoMarket when none succeeds
    std::vector<VenuePrice> get_token_price(const TokenInfo& token_out, const TokenInfo& token_in);

    Quote quote(std::string_view venue_name, const TokenInfo& token_out,
                const TokenInfo& token_in, const Decimal& amount_in);

    std::vector<Market> get_markets_for_tokens(std::string_view venue_name,
                                               const std::vector<TokenInfo>& tokens);

    // Native or token balance of the chain's configured wallet
    Decimal get_token_balance(const TokenInfo& token);

    // =========================================================================
    // Trading
    // =========================================================================

    // Slippage defaults to GeneralConfig::default_slippage_bps
    SwapResult swap(std::string_view venue_name, const TokenInfo& base_token,
                    const TokenInfo& quote_token, const Decimal& quote_amount,
                    std::optional<long long> slippage_bps = std::nullopt);

private:
    EvmClient& evm_locked(const std::string& chain);
    SolanaClient& solana_locked(const std::string& chain);
    HttpTransport& http_locked();

    Config config_;
    VenueRegistry registry_;
    std::unique_ptr<TransportFactory> transports_;

    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<EvmClient>> evm_clients_;
    std::map<std::string, std::unique_ptr<SolanaClient>> solana_clients_;
    std::unique_ptr<HttpTransport> http_;
    std::map<std::pair<std::string, std::string>, std::unique_ptr<DexVenue>> venues_;
};

}  // namespace chainswap
