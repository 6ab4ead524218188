// Chainswap - Solana Chain Client
// Lamport and SPL token balances, transaction submission with bounded finalization polling

#pragma once

#include <chainswap/config.hpp>
#include <chainswap/crypto.hpp>
#include <chainswap/transport.hpp>
#include <chainswap/types.hpp>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace chainswap {

// Wrapped SOL mint, also used as the native token address
inline constexpr const char* SOLANA_NATIVE_MINT = "So11111111111111111111111111111111111111112";

inline constexpr const char* SPL_TOKEN_PROGRAM_ID = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";

inline constexpr unsigned LAMPORTS_DECIMALS = 9;

// Ed25519 wallet keypair in Solana's base58 encodings
class SolanaKeypair {
public:
    // 64-byte secret key (seed || public key), base58
    static SolanaKeypair from_base58(std::string_view secret) {
        return SolanaKeypair(crypto::Ed25519Keypair::from_base58(secret));
    }

    [[nodiscard]] std::string address() const { return key_.public_key_base58(); }
    [[nodiscard]] const Bytes& public_key() const noexcept { return key_.public_key(); }

    [[nodiscard]] Bytes sign(const Bytes& message) const { return key_.sign(message); }

private:
    explicit SolanaKeypair(crypto::Ed25519Keypair key) : key_(std::move(key)) {}

    crypto::Ed25519Keypair key_;
};

struct SplTokenBalance {
    std::string mint;
    std::string token_account;
    Decimal amount;
    unsigned decimals = 0;
};

class SolanaClient {
public:
    static const std::set<std::string>& supported_chains();

    SolanaClient(ChainConfig config, std::unique_ptr<JsonRpcTransport> transport,
                 SolanaConfirmPolicy policy = {});

    SolanaClient(const SolanaClient&) = delete;
    SolanaClient& operator=(const SolanaClient&) = delete;

    [[nodiscard]] const std::string& chain() const noexcept { return config_.chain; }
    [[nodiscard]] const ChainConfig& config() const noexcept { return config_; }

    // Keypair from the configured private key; throws EngineError when none is set
    [[nodiscard]] const SolanaKeypair& keypair() const;
    [[nodiscard]] std::string wallet_address() const;

    Decimal get_native_balance(std::string_view owner);

    // "SOL" or the wrapped SOL mint select the lamport balance.
    // An owner without a token account for the mint holds zero.
    Decimal get_token_balance(std::string_view mint, std::string_view owner);
    Decimal get_token_balance(const TokenInfo& token, std::string_view owner);

    // Every SPL token account of `owner` with a non-zero amount
    std::vector<SplTokenBalance> get_all_token_balances(std::string_view owner);

    // sendTransaction, then getSignatureStatuses until finalized.
    // TransactionReverted when the status carries an error, ConfirmationTimeout on expiry.
    std::string submit_and_confirm(const Bytes& signed_transaction);

    // Wraps a serialized message into a single-signer transaction and submits it
    std::string sign_and_submit(const Bytes& message, const SolanaKeypair& keypair);

private:
    json rpc(const std::string& method, const json& params);

    ChainConfig config_;
    std::unique_ptr<JsonRpcTransport> transport_;
    SolanaConfirmPolicy policy_;
    std::unique_ptr<SolanaKeypair> keypair_;
};

bool is_solana_native(std::string_view mint);

// Compact-u16 length prefix used by the Solana wire format
Bytes encode_compact_u16(uint16_t value);

}  // namespace chainswap
