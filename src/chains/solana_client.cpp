// Chainswap - Solana Chain Client Implementation

#include <chainswap/chains/solana.hpp>
#include <chainswap/encoding.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <thread>

namespace chainswap {

namespace {

// Unwraps the {"context": ..., "value": ...} envelope of Solana RPC results
const json& result_value(const json& result, const std::string& method) {
    if (!result.is_object() || !result.contains("value")) {
        throw RpcError(method + ": malformed result " + result.dump());
    }
    return result["value"];
}

struct ParsedTokenAccount {
    std::string pubkey;
    std::string mint;
    BigInt amount;
    unsigned decimals = 0;
};

ParsedTokenAccount parse_token_account(const json& entry) {
    try {
        const json& info = entry.at("account").at("data").at("parsed").at("info");
        const json& token_amount = info.at("tokenAmount");
        ParsedTokenAccount account;
        account.pubkey = entry.value("pubkey", std::string());
        account.mint = info.at("mint").get<std::string>();
        account.amount = BigInt(token_amount.at("amount").get<std::string>());
        account.decimals = token_amount.at("decimals").get<unsigned>();
        return account;
    } catch (const json::exception& e) {
        throw RpcError(std::string("getTokenAccountsByOwner: unexpected account layout: ") +
                       e.what());
    }
}

}  // namespace

bool is_solana_native(std::string_view mint) {
    return mint == "SOL" || mint == SOLANA_NATIVE_MINT;
}

Bytes encode_compact_u16(uint16_t value) {
    Bytes out;
    uint32_t rest = value;
    while (true) {
        uint8_t byte = rest & 0x7f;
        rest >>= 7;
        if (rest == 0) {
            out.push_back(byte);
            return out;
        }
        out.push_back(byte | 0x80);
    }
}

// =============================================================================
// SolanaClient
// =============================================================================

const std::set<std::string>& SolanaClient::supported_chains() {
    static const std::set<std::string> chains = {"solana", "solana_devnet"};
    return chains;
}

SolanaClient::SolanaClient(ChainConfig config, std::unique_ptr<JsonRpcTransport> transport,
                           SolanaConfirmPolicy policy)
    : config_(std::move(config)), transport_(std::move(transport)), policy_(policy) {
    if (supported_chains().count(config_.chain) == 0) {
        throw UnsupportedChain(config_.chain);
    }
    if (config_.private_key) {
        keypair_ = std::make_unique<SolanaKeypair>(SolanaKeypair::from_base58(*config_.private_key));
        if (config_.wallet_address && *config_.wallet_address != keypair_->address()) {
            spdlog::warn("Configured wallet {} does not match keypair {} on {}",
                         *config_.wallet_address, keypair_->address(), config_.chain);
        }
    }
}

const SolanaKeypair& SolanaClient::keypair() const {
    if (!keypair_) {
        throw EngineError("No private key configured for chain " + config_.chain);
    }
    return *keypair_;
}

std::string SolanaClient::wallet_address() const {
    if (keypair_) return keypair_->address();
    if (config_.wallet_address) return *config_.wallet_address;
    throw EngineError("No wallet configured for chain " + config_.chain);
}

json SolanaClient::rpc(const std::string& method, const json& params) {
    return transport_->call(method, params);
}

Decimal SolanaClient::get_native_balance(std::string_view owner) {
    json result = rpc("getBalance", json::array({std::string(owner)}));
    const json& lamports = result_value(result, "getBalance");
    if (!lamports.is_number_unsigned()) {
        throw RpcError("getBalance: expected lamports, got " + lamports.dump());
    }
    return Decimal::from_base_units(BigInt(lamports.get<uint64_t>()), LAMPORTS_DECIMALS);
}

Decimal SolanaClient::get_token_balance(std::string_view mint, std::string_view owner) {
    if (is_solana_native(mint)) {
        return get_native_balance(owner);
    }

    json params = json::array({std::string(owner),
                               {{"mint", std::string(mint)}},
                               {{"encoding", "jsonParsed"}}});
    json result = rpc("getTokenAccountsByOwner", params);
    const json& accounts = result_value(result, "getTokenAccountsByOwner");
    if (accounts.empty()) {
        spdlog::debug("No {} token account for {}", mint, owner);
        return Decimal::zero();
    }

    BigInt total = 0;
    unsigned decimals = 0;
    for (const auto& entry : accounts) {
        ParsedTokenAccount account = parse_token_account(entry);
        total += account.amount;
        decimals = account.decimals;
    }
    return Decimal::from_base_units(total, decimals);
}

Decimal SolanaClient::get_token_balance(const TokenInfo& token, std::string_view owner) {
    if (token.chain != config_.chain) {
        throw UnsupportedChain(token.chain, "Token " + token.to_string() + " is not on " +
                                                config_.chain);
    }
    if (token.is_native) {
        return get_native_balance(owner);
    }
    return get_token_balance(token.address, owner);
}

std::vector<SplTokenBalance> SolanaClient::get_all_token_balances(std::string_view owner) {
    json params = json::array({std::string(owner),
                               {{"programId", SPL_TOKEN_PROGRAM_ID}},
                               {{"encoding", "jsonParsed"}}});
    json result = rpc("getTokenAccountsByOwner", params);
    const json& accounts = result_value(result, "getTokenAccountsByOwner");

    std::vector<SplTokenBalance> balances;
    for (const auto& entry : accounts) {
        ParsedTokenAccount account = parse_token_account(entry);
        if (account.amount.is_zero()) continue;
        balances.push_back(SplTokenBalance{
            account.mint, account.pubkey,
            Decimal::from_base_units(account.amount, account.decimals), account.decimals});
    }
    return balances;
}

std::string SolanaClient::submit_and_confirm(const Bytes& signed_transaction) {
    json params = json::array({base64::encode(signed_transaction), {{"encoding", "base64"}}});
    json sent = rpc("sendTransaction", params);
    if (!sent.is_string()) {
        throw RpcError("sendTransaction: expected a signature, got " + sent.dump());
    }
    std::string signature = sent.get<std::string>();
    spdlog::info("Sent transaction {} on {}", signature, config_.chain);

    auto deadline = std::chrono::steady_clock::now() + policy_.timeout;
    while (true) {
        json statuses = rpc("getSignatureStatuses",
                            json::array({json::array({signature}),
                                         {{"searchTransactionHistory", true}}}));
        const json& value = result_value(statuses, "getSignatureStatuses");
        if (value.is_array() && !value.empty() && value[0].is_object()) {
            const json& status = value[0];
            if (status.contains("err") && !status["err"].is_null()) {
                spdlog::error("Transaction {} failed: {}", signature, status["err"].dump());
                throw TransactionReverted(signature, status["err"].dump());
            }
            std::string confirmation = status.value("confirmationStatus", std::string());
            if (confirmation == "finalized") {
                spdlog::info("Transaction {} finalized", signature);
                return signature;
            }
            spdlog::debug("Transaction {} is {}", signature, confirmation);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::error("Transaction {} not finalized within {} ms", signature,
                          policy_.timeout.count());
            throw ConfirmationTimeout(signature);
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(policy_.poll_interval, remaining));
    }
}

std::string SolanaClient::sign_and_submit(const Bytes& message, const SolanaKeypair& keypair) {
    Bytes transaction = encode_compact_u16(1);
    Bytes signature = keypair.sign(message);
    transaction.insert(transaction.end(), signature.begin(), signature.end());
    transaction.insert(transaction.end(), message.begin(), message.end());
    return submit_and_confirm(transaction);
}

}  // namespace chainswap
