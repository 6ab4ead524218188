// Chainswap - Configuration
// Builder pattern for fluent, already-validated engine configuration

#pragma once

#include <chainswap/types.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chainswap {

// General engine settings
struct GeneralConfig {
    std::string log_level = "info";
    int rpc_timeout_ms = 30000;
    int default_slippage_bps = 100;
};

// EVM receipt polling
struct TransactionPolicy {
    std::chrono::milliseconds receipt_timeout{150000};
    std::chrono::milliseconds poll_interval{1000};
    uint64_t confirmation_blocks = 1;
    uint64_t approval_confirmation_blocks = 2;
};

// Solana signature-status polling; a hard deadline, never retried forever
struct SolanaConfirmPolicy {
    std::chrono::milliseconds timeout{10000};
    std::chrono::milliseconds poll_interval{1000};
};

// Per-chain connection, wallet and token registry
class ChainConfig {
public:
    std::string chain;
    std::string rpc_url;
    std::optional<std::string> private_key;
    std::optional<std::string> wallet_address;
    std::optional<uint64_t> gas_limit;
    std::unordered_map<std::string, TokenInfo> tokens;  // keyed by symbol

    ChainConfig() = default;

    static ChainConfig create(std::string_view chain_name, std::string_view rpc) {
        ChainConfig cfg;
        cfg.chain = std::string(chain_name);
        cfg.rpc_url = std::string(rpc);
        return cfg;
    }

    ChainConfig& with_private_key(std::string_view key) {
        private_key = std::string(key);
        return *this;
    }

    ChainConfig& with_wallet(std::string_view address, std::string_view key) {
        wallet_address = std::string(address);
        private_key = std::string(key);
        return *this;
    }

    ChainConfig& with_gas_limit(uint64_t limit) {
        gas_limit = limit;
        return *this;
    }

    ChainConfig& with_token(std::string_view symbol, std::string_view address,
                            unsigned decimals, bool is_native = false) {
        tokens[std::string(symbol)] =
            TokenInfo{std::string(symbol), std::string(address), decimals, chain, is_native};
        return *this;
    }

    // Well-known native, wrapped-native and USDC tokens for the chain
    ChainConfig& with_default_tokens();

    [[nodiscard]] TokenInfo get_token(std::string_view symbol) const;
    [[nodiscard]] std::optional<TokenInfo> find_token_by_address(std::string_view address) const;
};

struct UniswapV3Settings {
    std::vector<uint32_t> fee_tiers{100, 500, 3000, 10000};
};

struct JupiterSettings {
    int slippage_bps = 100;
    std::string quote_api_url = "https://quote-api.jup.ag/v6/quote";
};

// Main engine configuration
class Config {
public:
    GeneralConfig general;
    TransactionPolicy transactions;
    SolanaConfirmPolicy solana_confirmation;
    std::unordered_map<std::string, ChainConfig> chains;
    std::map<std::string, std::set<std::string>> trading_venues;  // venue -> chains
    UniswapV3Settings uniswap_v3;
    JupiterSettings jupiter;

    Config() = default;

    Config& with_chain(ChainConfig cfg) {
        std::string name = cfg.chain;
        chains[name] = std::move(cfg);
        return *this;
    }

    Config& with_venue(std::string_view venue, std::string_view chain_name) {
        trading_venues[std::string(venue)].insert(std::string(chain_name));
        return *this;
    }

    Config& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    // Throws UnsupportedChain when the chain has no configuration
    [[nodiscard]] const ChainConfig& chain(std::string_view name) const;

    // Venues enabled on a chain, in name order
    [[nodiscard]] std::vector<std::string> venues_for_chain(std::string_view chain_name) const;
};

}  // namespace chainswap
