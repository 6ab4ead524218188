// Chainswap - Configuration Implementation

#include <chainswap/config.hpp>
#include <chainswap/chains/evm.hpp>
#include <chainswap/chains/solana.hpp>

namespace chainswap {

namespace {

struct KnownToken {
    const char* chain;
    const char* symbol;
    const char* address;
    unsigned decimals;
    bool is_native;
};

constexpr KnownToken KNOWN_TOKENS[] = {
    {"ethereum", "ETH", EVM_NATIVE_TOKEN_ADDRESS, 18, true},
    {"ethereum", "WETH", "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2", 18, false},
    {"ethereum", "USDC", "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48", 6, false},
    {"ethereum_sepolia", "ETH", EVM_NATIVE_TOKEN_ADDRESS, 18, true},
    {"ethereum_sepolia", "WETH", "0xfFf9976782d46CC05630D1f6eBAb18b2324d6B14", 18, false},
    {"ethereum_sepolia", "USDC", "0x1c7D4B196Cb0C7B01d743Fbc6116a902379C7238", 6, false},
    {"base", "ETH", EVM_NATIVE_TOKEN_ADDRESS, 18, true},
    {"base", "WETH", "0x4200000000000000000000000000000000000006", 18, false},
    {"base", "USDC", "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913", 6, false},
    {"base_sepolia", "ETH", EVM_NATIVE_TOKEN_ADDRESS, 18, true},
    {"base_sepolia", "WETH", "0x4200000000000000000000000000000000000006", 18, false},
    {"base_sepolia", "USDC", "0x036CbD53842c5426634e7929541eC2318f3dCF7e", 6, false},
    {"solana", "SOL", SOLANA_NATIVE_MINT, 9, true},
    {"solana", "USDC", "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v", 6, false},
    {"solana_devnet", "SOL", SOLANA_NATIVE_MINT, 9, true},
    {"solana_devnet", "USDC", "4zMMC9srt5Ri5X14GAgXhaHii3GnPAEERYPJgZJDncDU", 6, false},
};

}  // namespace

ChainConfig& ChainConfig::with_default_tokens() {
    bool any = false;
    for (const auto& t : KNOWN_TOKENS) {
        if (chain == t.chain) {
            with_token(t.symbol, t.address, t.decimals, t.is_native);
            any = true;
        }
    }
    if (!any) {
        throw UnsupportedChain(chain);
    }
    return *this;
}

TokenInfo ChainConfig::get_token(std::string_view symbol) const {
    auto it = tokens.find(std::string(symbol));
    if (it == tokens.end()) {
        throw EngineError("Token " + std::string(symbol) + " not configured on chain " + chain);
    }
    return it->second;
}

std::optional<TokenInfo> ChainConfig::find_token_by_address(std::string_view address) const {
    std::string key = normalize_address(address);
    for (const auto& [symbol, token] : tokens) {
        if (token.address_key() == key) {
            return token;
        }
    }
    return std::nullopt;
}

const ChainConfig& Config::chain(std::string_view name) const {
    auto it = chains.find(std::string(name));
    if (it == chains.end()) {
        throw UnsupportedChain(std::string(name), "Chain " + std::string(name) + " is not configured");
    }
    return it->second;
}

std::vector<std::string> Config::venues_for_chain(std::string_view chain_name) const {
    std::vector<std::string> out;
    for (const auto& [venue, chain_set] : trading_venues) {
        if (chain_set.count(std::string(chain_name)) > 0) {
            out.push_back(venue);
        }
    }
    return out;
}

}  // namespace chainswap
