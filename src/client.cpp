// Chainswap - Unified Client Implementation

#include <chainswap/client.hpp>
#include <chainswap/logging.hpp>
#include <spdlog/spdlog.h>

namespace chainswap {

namespace {

const std::string& common_chain(const TokenInfo& a, const TokenInfo& b) {
    if (a.chain != b.chain) {
        throw UnsupportedChain(b.chain, "Tokens are on different chains: " + a.to_string() +
                                            " and " + b.to_string());
    }
    return a.chain;
}

}  // namespace

Client::Client(Config config)
    : Client(std::move(config), VenueRegistry::with_builtin_venues()) {}

Client::Client(Config config, VenueRegistry registry, std::unique_ptr<TransportFactory> transports)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      transports_(transports ? std::move(transports) : std::make_unique<TransportFactory>()) {
    configure_logging(config_.general.log_level);
    std::string venues;
    for (const auto& name : registry_.names()) {
        venues += venues.empty() ? name : ", " + name;
    }
    spdlog::info("Client configured with {} chains and venues {}", config_.chains.size(), venues);
}

Client::~Client() = default;

EvmClient& Client::evm_locked(const std::string& chain) {
    auto it = evm_clients_.find(chain);
    if (it != evm_clients_.end()) return *it->second;

    if (EvmClient::supported_chains().count(chain) == 0) {
        throw UnsupportedChain(chain, "Chain " + chain + " is not an EVM chain");
    }
    const ChainConfig& chain_config = config_.chain(chain);
    auto client = std::make_unique<EvmClient>(
        chain_config, transports_->rpc(chain_config.rpc_url, config_.general.rpc_timeout_ms),
        config_.transactions);
    spdlog::debug("Created EVM client for {}", chain);
    return *evm_clients_.emplace(chain, std::move(client)).first->second;
}

SolanaClient& Client::solana_locked(const std::string& chain) {
    auto it = solana_clients_.find(chain);
    if (it != solana_clients_.end()) return *it->second;

    if (SolanaClient::supported_chains().count(chain) == 0) {
        throw UnsupportedChain(chain, "Chain " + chain + " is not a Solana chain");
    }
    const ChainConfig& chain_config = config_.chain(chain);
    auto client = std::make_unique<SolanaClient>(
        chain_config, transports_->rpc(chain_config.rpc_url, config_.general.rpc_timeout_ms),
        config_.solana_confirmation);
    spdlog::debug("Created Solana client for {}", chain);
    return *solana_clients_.emplace(chain, std::move(client)).first->second;
}

HttpTransport& Client::http_locked() {
    if (!http_) {
        http_ = transports_->http(config_.general.rpc_timeout_ms);
    }
    return *http_;
}

EvmClient& Client::evm(std::string_view chain) {
    std::lock_guard<std::mutex> lock(mutex_);
    return evm_locked(std::string(chain));
}

SolanaClient& Client::solana(std::string_view chain) {
    std::lock_guard<std::mutex> lock(mutex_);
    return solana_locked(std::string(chain));
}

DexVenue& Client::venue(std::string_view name, std::string_view chain) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = std::make_pair(std::string(name), std::string(chain));
    auto it = venues_.find(key);
    if (it != venues_.end()) return *it->second;

    if (!registry_.contains(name)) {
        throw UnknownVenue(key.first);
    }
    VenueContext context{config_, key.second};
    if (EvmClient::supported_chains().count(key.second) > 0) {
        context.evm = &evm_locked(key.second);
    } else if (SolanaClient::supported_chains().count(key.second) > 0) {
        context.solana = &solana_locked(key.second);
    } else {
        throw UnsupportedChain(key.second);
    }
    context.http = &http_locked();

    std::unique_ptr<DexVenue> created = registry_.create(name, context);
    return *venues_.emplace(std::move(key), std::move(created)).first->second;
}

Decimal Client::get_token_price(const TokenInfo& token_out, const TokenInfo& token_in,
                                std::string_view venue_name) {
    const std::string& chain = common_chain(token_out, token_in);
    return venue(venue_name, chain).get_token_price(token_out, token_in);
}

std::vector<VenuePrice> Client::get_token_price(const TokenInfo& token_out,
                                                const TokenInfo& token_in) {
    const std::string& chain = common_chain(token_out, token_in);
    std::vector<VenuePrice> prices;
    for (const auto& name : config_.venues_for_chain(chain)) {
        try {
            Decimal price = venue(name, chain).get_token_price(token_out, token_in);
            spdlog::info("{} on {}: 1 {} = {} {}", name, chain, token_in.symbol,
                         price.to_string(), token_out.symbol);
            prices.push_back(VenuePrice{name, price});
        } catch (const EngineError& e) {
            spdlog::warn("Skipping {} on {} for {}/{}: {}", name, chain, token_out.symbol,
                         token_in.symbol, e.what());
        }
    }
    if (prices.empty()) {
        throw NoMarket("No venue on " + chain + " prices " + token_out.symbol + "/" +
                       token_in.symbol);
    }
    return prices;
}

Quote Client::quote(std::string_view venue_name, const TokenInfo& token_out,
                    const TokenInfo& token_in, const Decimal& amount_in) {
    const std::string& chain = common_chain(token_out, token_in);
    return venue(venue_name, chain).quote(token_out, token_in, amount_in);
}

std::vector<Market> Client::get_markets_for_tokens(std::string_view venue_name,
                                                   const std::vector<TokenInfo>& tokens) {
    if (tokens.empty()) return {};
    const std::string& chain = tokens.front().chain;
    for (const auto& token : tokens) {
        common_chain(tokens.front(), token);
    }
    return venue(venue_name, chain).get_markets_for_tokens(tokens);
}

Decimal Client::get_token_balance(const TokenInfo& token) {
    if (SolanaClient::supported_chains().count(token.chain) > 0) {
        SolanaClient& client = solana(token.chain);
        return client.get_token_balance(token, client.wallet_address());
    }
    EvmClient& client = evm(token.chain);
    return client.get_token_balance(token.is_native ? EVM_NATIVE_TOKEN_ADDRESS : token.address,
                                    client.wallet_address());
}

SwapResult Client::swap(std::string_view venue_name, const TokenInfo& base_token,
                        const TokenInfo& quote_token, const Decimal& quote_amount,
                        std::optional<long long> slippage_bps) {
    const std::string& chain = common_chain(base_token, quote_token);
    long long bps = slippage_bps.value_or(config_.general.default_slippage_bps);
    SwapResult result = venue(venue_name, chain).swap(base_token, quote_token, quote_amount, bps);
    if (result.success) {
        spdlog::info("Swap on {} confirmed: spent {} {}, received {} {}", venue_name,
                     result.amount_spent.to_string(), quote_token.symbol,
                     result.amount_received.to_string(), base_token.symbol);
    } else {
        spdlog::error("Swap on {} failed: {}", venue_name, result.error.value_or("unknown"));
    }
    return result;
}

}  // namespace chainswap
