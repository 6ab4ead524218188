// Chainswap - EVM Chain Client
// Balances, ERC-20 calls and the EIP-1559 transaction lifecycle over JSON-RPC

#pragma once

#include <chainswap/config.hpp>
#include <chainswap/crypto.hpp>
#include <chainswap/transport.hpp>
#include <chainswap/types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chainswap {

// Placeholder address standing for the chain's gas token
inline constexpr const char* EVM_NATIVE_TOKEN_ADDRESS = "0xEeeeeEeeeEeEeeEeEeEeeEEEeeeeEeeeeeeeEEeE";

inline constexpr uint64_t DEFAULT_GAS_LIMIT = 200000;

// A contract interaction to be sent as a transaction
struct EvmCall {
    std::string to;
    Bytes data;
    BigInt value = 0;
};

// Type-2 (EIP-1559) transaction fields
struct Eip1559Transaction {
    uint64_t chain_id = 0;
    uint64_t nonce = 0;
    BigInt max_priority_fee_per_gas;
    BigInt max_fee_per_gas;
    uint64_t gas_limit = DEFAULT_GAS_LIMIT;
    std::string to;
    BigInt value;
    Bytes data;

    // 0x02 || rlp([chain_id, nonce, tip, max_fee, gas, to, value, data, access_list])
    [[nodiscard]] Bytes signing_payload() const;
    [[nodiscard]] Bytes encode_signed(const crypto::RecoverableSignature& signature) const;
};

struct LogEntry {
    std::string address;
    std::vector<std::string> topics;
    std::string data;
    uint64_t block_number = 0;
    std::string transaction_hash;
    uint64_t log_index = 0;

    static LogEntry from_json(const json& j);
};

struct TransactionReceipt {
    std::string tx_hash;
    bool status = false;
    uint64_t block_number = 0;
    uint64_t gas_used = 0;
    std::vector<LogEntry> logs;

    static TransactionReceipt from_json(const json& j);
};

// Raw amount of `token` moved to `recipient` by ERC-20 Transfer events in the receipt
BigInt sum_transfers_to(const TransactionReceipt& receipt, std::string_view token,
                        std::string_view recipient);

struct BlockHeader {
    uint64_t number = 0;
    uint64_t timestamp = 0;
    BigInt base_fee_per_gas;
};

class EvmSigner {
public:
    struct SignedTransaction {
        Bytes raw;
        std::string hash;
    };

    explicit EvmSigner(std::string_view private_key_hex);

    // EIP-55 checksummed
    [[nodiscard]] const std::string& address() const noexcept { return address_; }

    [[nodiscard]] SignedTransaction sign(const Eip1559Transaction& tx) const;

private:
    crypto::Secp256k1PrivateKey key_;
    std::string address_;
};

class EvmClient {
public:
    static const std::set<std::string>& supported_chains();

    EvmClient(ChainConfig config, std::unique_ptr<JsonRpcTransport> transport,
              TransactionPolicy policy = {});

    EvmClient(const EvmClient&) = delete;
    EvmClient& operator=(const EvmClient&) = delete;

    [[nodiscard]] const std::string& chain() const noexcept { return config_.chain; }
    [[nodiscard]] const ChainConfig& config() const noexcept { return config_; }
    [[nodiscard]] const TransactionPolicy& policy() const noexcept { return policy_; }

    // Signer for the configured private key; throws EngineError when none is set
    [[nodiscard]] const EvmSigner& signer() const;
    [[nodiscard]] std::string wallet_address() const;

    // =========================================================================
    // Read-only queries
    // =========================================================================

    uint64_t chain_id();
    uint64_t block_number();
    BlockHeader get_latest_block();
    BigInt max_priority_fee();

    Decimal get_native_balance(std::string_view address);
    BigInt get_native_balance_raw(std::string_view address);

    // "ETH" or EVM_NATIVE_TOKEN_ADDRESS select the native balance
    Decimal get_token_balance(std::string_view token_address, std::string_view owner);
    BigInt get_token_balance_raw(std::string_view token_address, std::string_view owner);
    BigInt get_allowance(std::string_view token, std::string_view owner, std::string_view spender);

    // symbol() and decimals(), cached per address for the life of this client
    TokenInfo get_token_info(std::string_view token_address);
    void clear_token_cache();

    // eth_call returning raw return data
    Bytes call(std::string_view to, const Bytes& data, const std::string& block = "latest");

    // =========================================================================
    // Transactions
    // =========================================================================

    // Fresh pending nonce, fees from the latest block, configured gas limit
    Eip1559Transaction build_transaction(const EvmCall& call, const std::string& from);

    // Builds, signs and broadcasts; nonce read and broadcast are serialized per client
    std::string send_transaction(const EvmCall& call, const EvmSigner& signer);

    std::optional<TransactionReceipt> get_receipt(const std::string& tx_hash);

    // Polls until the receipt is `confirmations` blocks deep; TransactionTimeout on expiry
    TransactionReceipt wait_for_receipt(const std::string& tx_hash, uint64_t confirmations = 1);

    // wait_for_receipt, then TransactionReverted with the replayed reason on status 0
    TransactionReceipt confirm(const std::string& tx_hash, uint64_t confirmations = 1);

    // Replays a mined transaction with eth_call at its block
    std::string get_revert_reason(const std::string& tx_hash);

    // approve(spender, amount), confirmed with the approval confirmation depth
    TransactionReceipt approve(std::string_view token, std::string_view spender,
                               const BigInt& amount, const EvmSigner& signer);

private:
    json rpc(const std::string& method, const json& params);

    ChainConfig config_;
    std::unique_ptr<JsonRpcTransport> transport_;
    TransactionPolicy policy_;
    std::unique_ptr<EvmSigner> signer_;

    std::mutex nonce_mutex_;
    std::mutex cache_mutex_;
    std::optional<uint64_t> chain_id_;
    std::unordered_map<std::string, TokenInfo> token_cache_;
};

// Throws InvalidAddress unless `address` is a 0x-prefixed 20-byte hex string
void validate_evm_address(std::string_view address);

bool is_evm_native(std::string_view token_address);

}  // namespace chainswap
