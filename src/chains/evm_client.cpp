// Chainswap - EVM Chain Client Implementation

#include <chainswap/chains/evm.hpp>
#include <chainswap/abi.hpp>
#include <chainswap/encoding.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace chainswap {

namespace {

std::string as_string(const json& value, const std::string& method) {
    if (!value.is_string()) {
        throw RpcError(method + ": expected a string result, got " + value.dump());
    }
    return value.get<std::string>();
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string decode_symbol(const Bytes& data) {
    // Legacy tokens (MKR, SAI) return bytes32 instead of string
    if (data.size() == 32) {
        auto end = std::find(data.begin(), data.end(), 0);
        return std::string(data.begin(), end);
    }
    return abi::Decoder(data).string_at(0);
}

}  // namespace

void validate_evm_address(std::string_view address) {
    if (!crypto::is_hex_address(address)) {
        throw InvalidAddress(std::string(address));
    }
}

bool is_evm_native(std::string_view token_address) {
    return iequals(token_address, "ETH") || iequals(token_address, EVM_NATIVE_TOKEN_ADDRESS);
}

// =============================================================================
// EvmClient
// =============================================================================

const std::set<std::string>& EvmClient::supported_chains() {
    static const std::set<std::string> chains = {
        "ethereum", "ethereum_sepolia", "base", "base_sepolia"};
    return chains;
}

EvmClient::EvmClient(ChainConfig config, std::unique_ptr<JsonRpcTransport> transport,
                     TransactionPolicy policy)
    : config_(std::move(config)), transport_(std::move(transport)), policy_(policy) {
    if (supported_chains().count(config_.chain) == 0) {
        throw UnsupportedChain(config_.chain);
    }
    if (config_.private_key) {
        signer_ = std::make_unique<EvmSigner>(*config_.private_key);
        if (config_.wallet_address &&
            normalize_address(*config_.wallet_address) != normalize_address(signer_->address())) {
            spdlog::warn("Configured wallet {} does not match signer {} on {}",
                         *config_.wallet_address, signer_->address(), config_.chain);
        }
    }
}

const EvmSigner& EvmClient::signer() const {
    if (!signer_) {
        throw EngineError("No private key configured for chain " + config_.chain);
    }
    return *signer_;
}

std::string EvmClient::wallet_address() const {
    if (signer_) return signer_->address();
    if (config_.wallet_address) return *config_.wallet_address;
    throw EngineError("No wallet configured for chain " + config_.chain);
}

json EvmClient::rpc(const std::string& method, const json& params) {
    return transport_->call(method, params);
}

uint64_t EvmClient::chain_id() {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (chain_id_) return *chain_id_;
    }
    uint64_t id = hex::to_uint64(as_string(rpc("eth_chainId", json::array()), "eth_chainId"));
    std::lock_guard<std::mutex> lock(cache_mutex_);
    chain_id_ = id;
    return id;
}

uint64_t EvmClient::block_number() {
    return hex::to_uint64(as_string(rpc("eth_blockNumber", json::array()), "eth_blockNumber"));
}

BlockHeader EvmClient::get_latest_block() {
    json block = rpc("eth_getBlockByNumber", json::array({"latest", false}));
    if (!block.is_object()) {
        throw RpcError("eth_getBlockByNumber: no latest block");
    }
    BlockHeader header;
    header.number = hex::to_uint64(block.value("number", std::string("0x0")));
    header.timestamp = hex::to_uint64(block.value("timestamp", std::string("0x0")));
    header.base_fee_per_gas = hex::to_bigint(block.value("baseFeePerGas", std::string("0x0")));
    return header;
}

BigInt EvmClient::max_priority_fee() {
    return hex::to_bigint(
        as_string(rpc("eth_maxPriorityFeePerGas", json::array()), "eth_maxPriorityFeePerGas"));
}

Decimal EvmClient::get_native_balance(std::string_view address) {
    return Decimal::from_base_units(get_native_balance_raw(address), 18);
}

BigInt EvmClient::get_native_balance_raw(std::string_view address) {
    validate_evm_address(address);
    json result = rpc("eth_getBalance", json::array({std::string(address), "latest"}));
    return hex::to_bigint(as_string(result, "eth_getBalance"));
}

Decimal EvmClient::get_token_balance(std::string_view token_address, std::string_view owner) {
    if (is_evm_native(token_address)) {
        return get_native_balance(owner);
    }
    TokenInfo token = get_token_info(token_address);
    return token.from_base_units(get_token_balance_raw(token_address, owner));
}

BigInt EvmClient::get_token_balance_raw(std::string_view token_address, std::string_view owner) {
    if (is_evm_native(token_address)) {
        return get_native_balance_raw(owner);
    }
    validate_evm_address(token_address);
    Bytes data = abi::Encoder(abi::selector::BALANCE_OF).add_address(owner).build();
    return abi::Decoder(call(token_address, data)).uint_at(0);
}

BigInt EvmClient::get_allowance(std::string_view token, std::string_view owner,
                                std::string_view spender) {
    validate_evm_address(token);
    Bytes data =
        abi::Encoder(abi::selector::ALLOWANCE).add_address(owner).add_address(spender).build();
    return abi::Decoder(call(token, data)).uint_at(0);
}

TokenInfo EvmClient::get_token_info(std::string_view token_address) {
    validate_evm_address(token_address);
    std::string key = normalize_address(token_address);
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = token_cache_.find(key);
        if (it != token_cache_.end()) return it->second;
    }

    std::string symbol = decode_symbol(call(token_address, abi::Encoder(abi::selector::SYMBOL).build()));
    BigInt decimals =
        abi::Decoder(call(token_address, abi::Encoder(abi::selector::DECIMALS).build())).uint_at(0);
    if (decimals > 255) {
        throw DecodeError("Token " + std::string(token_address) + " reports invalid decimals");
    }

    TokenInfo info{symbol, crypto::to_checksum_address(token_address),
                   decimals.convert_to<unsigned>(), config_.chain, false};
    spdlog::debug("Token {} has {} decimals", info.to_string(), info.decimals);

    std::lock_guard<std::mutex> lock(cache_mutex_);
    token_cache_.emplace(key, info);
    return info;
}

void EvmClient::clear_token_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    token_cache_.clear();
}

Bytes EvmClient::call(std::string_view to, const Bytes& data, const std::string& block) {
    validate_evm_address(to);
    json tx = {{"to", std::string(to)}, {"data", hex::encode(data)}};
    return hex::decode(as_string(rpc("eth_call", json::array({tx, block})), "eth_call"));
}

// =============================================================================
// Transactions
// =============================================================================

Eip1559Transaction EvmClient::build_transaction(const EvmCall& call, const std::string& from) {
    Eip1559Transaction tx;
    tx.chain_id = chain_id();
    tx.nonce = hex::to_uint64(as_string(
        rpc("eth_getTransactionCount", json::array({from, "pending"})), "eth_getTransactionCount"));

    BlockHeader latest = get_latest_block();
    BigInt priority_fee = max_priority_fee();
    if (latest.base_fee_per_gas.is_zero()) {
        spdlog::warn("Base fee is 0 on {}; max fee falls back to the priority fee", config_.chain);
    }
    tx.max_priority_fee_per_gas = priority_fee;
    tx.max_fee_per_gas = latest.base_fee_per_gas * 2 + priority_fee;
    tx.gas_limit = config_.gas_limit.value_or(DEFAULT_GAS_LIMIT);
    tx.to = call.to;
    tx.value = call.value;
    tx.data = call.data;
    return tx;
}

std::string EvmClient::send_transaction(const EvmCall& call, const EvmSigner& signer) {
    std::lock_guard<std::mutex> lock(nonce_mutex_);

    Eip1559Transaction tx = build_transaction(call, signer.address());
    EvmSigner::SignedTransaction signed_tx = signer.sign(tx);
    spdlog::debug("Transaction fees on {}: max_fee={} priority_fee={} gas_limit={}",
                  config_.chain, tx.max_fee_per_gas.str(), tx.max_priority_fee_per_gas.str(),
                  tx.gas_limit);

    std::string hash = as_string(
        rpc("eth_sendRawTransaction", json::array({hex::encode(signed_tx.raw)})),
        "eth_sendRawTransaction");
    if (normalize_address(hash) != signed_tx.hash) {
        spdlog::warn("Node returned hash {} for locally computed {}", hash, signed_tx.hash);
    }
    spdlog::info("Sent transaction {} (nonce {}) to {} on {}", hash, tx.nonce, tx.to,
                 config_.chain);
    return hash;
}

std::optional<TransactionReceipt> EvmClient::get_receipt(const std::string& tx_hash) {
    json result = rpc("eth_getTransactionReceipt", json::array({tx_hash}));
    if (result.is_null()) {
        return std::nullopt;
    }
    TransactionReceipt receipt = TransactionReceipt::from_json(result);
    if (receipt.tx_hash.empty()) receipt.tx_hash = tx_hash;
    return receipt;
}

TransactionReceipt EvmClient::wait_for_receipt(const std::string& tx_hash,
                                               uint64_t confirmations) {
    auto deadline = std::chrono::steady_clock::now() + policy_.receipt_timeout;
    while (true) {
        std::optional<TransactionReceipt> receipt = get_receipt(tx_hash);
        if (receipt) {
            if (confirmations <= 1 ||
                block_number() + 1 >= receipt->block_number + confirmations) {
                spdlog::debug("Transaction {} included in block {}", tx_hash,
                              receipt->block_number);
                return *receipt;
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            spdlog::error("Transaction {} not confirmed within {} ms", tx_hash,
                          policy_.receipt_timeout.count());
            throw TransactionTimeout(tx_hash);
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(policy_.poll_interval, remaining));
    }
}

TransactionReceipt EvmClient::confirm(const std::string& tx_hash, uint64_t confirmations) {
    TransactionReceipt receipt = wait_for_receipt(tx_hash, confirmations);
    if (!receipt.status) {
        std::string reason = get_revert_reason(tx_hash);
        spdlog::error("Transaction {} reverted: {}", tx_hash, reason);
        throw TransactionReverted(tx_hash, reason);
    }
    return receipt;
}

std::string EvmClient::get_revert_reason(const std::string& tx_hash) {
    json tx = rpc("eth_getTransactionByHash", json::array({tx_hash}));
    if (!tx.is_object()) {
        return "transaction not found";
    }

    json replay = {
        {"from", tx.value("from", std::string())},
        {"to", tx.value("to", std::string())},
        {"data", tx.value("input", std::string("0x"))},
        {"value", tx.value("value", std::string("0x0"))},
        {"gas", tx.value("gas", std::string("0x0"))},
    };
    // Replay on the state the transaction executed against
    std::string block = "latest";
    if (tx.contains("blockNumber") && tx["blockNumber"].is_string()) {
        uint64_t mined_in = hex::to_uint64(tx["blockNumber"].get<std::string>());
        if (mined_in > 0) block = hex::from_bigint(BigInt(mined_in - 1));
    }

    try {
        Bytes output =
            hex::decode(as_string(rpc("eth_call", json::array({replay, block})), "eth_call"));
        if (auto reason = abi::decode_revert_reason(output)) {
            return *reason;
        }
        return "unknown (replay did not revert)";
    } catch (const RpcError& e) {
        // Only JSON-RPC error objects carry revert data; transport failures propagate
        if (!e.code()) throw;
        if (e.data()) {
            try {
                if (auto reason = abi::decode_revert_reason(hex::decode(*e.data()))) {
                    return *reason;
                }
            } catch (const DecodeError& decode_error) {
                spdlog::debug("Revert data for {} is not ABI encoded: {}", tx_hash,
                              decode_error.what());
            }
        }
        return e.what();
    }
}

TransactionReceipt EvmClient::approve(std::string_view token, std::string_view spender,
                                      const BigInt& amount, const EvmSigner& signer) {
    validate_evm_address(token);
    Bytes data =
        abi::Encoder(abi::selector::APPROVE).add_address(spender).add_uint(amount).build();
    spdlog::info("Approving {} of {} for {}", amount.str(), token, spender);
    std::string hash = send_transaction(EvmCall{std::string(token), std::move(data)}, signer);
    return confirm(hash, policy_.approval_confirmation_blocks);
}

}  // namespace chainswap
