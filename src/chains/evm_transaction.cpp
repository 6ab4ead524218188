// Chainswap - EVM Transactions, Signer and Receipts

#include <chainswap/chains/evm.hpp>
#include <chainswap/abi.hpp>
#include <chainswap/encoding.hpp>
#include <chainswap/rlp.hpp>

namespace chainswap {

namespace {

constexpr uint8_t EIP1559_TX_TYPE = 0x02;

std::vector<Bytes> unsigned_fields(const Eip1559Transaction& tx) {
    validate_evm_address(tx.to);
    return {
        rlp::encode_uint(BigInt(tx.chain_id)),
        rlp::encode_uint(BigInt(tx.nonce)),
        rlp::encode_uint(tx.max_priority_fee_per_gas),
        rlp::encode_uint(tx.max_fee_per_gas),
        rlp::encode_uint(BigInt(tx.gas_limit)),
        rlp::encode_bytes(hex::decode(tx.to)),
        rlp::encode_uint(tx.value),
        rlp::encode_bytes(tx.data),
        rlp::encode_list({}),  // access list
    };
}

Bytes typed_envelope(const std::vector<Bytes>& fields) {
    Bytes out{EIP1559_TX_TYPE};
    Bytes body = rlp::encode_list(fields);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

uint64_t quantity_or_zero(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return 0;
    return hex::to_uint64(j[key].get<std::string>());
}

}  // namespace

// =============================================================================
// Eip1559Transaction
// =============================================================================

Bytes Eip1559Transaction::signing_payload() const {
    return typed_envelope(unsigned_fields(*this));
}

Bytes Eip1559Transaction::encode_signed(const crypto::RecoverableSignature& signature) const {
    std::vector<Bytes> fields = unsigned_fields(*this);
    fields.push_back(rlp::encode_uint(BigInt(signature.recovery_id)));
    fields.push_back(rlp::encode_uint(signature.r));
    fields.push_back(rlp::encode_uint(signature.s));
    return typed_envelope(fields);
}

// =============================================================================
// EvmSigner
// =============================================================================

EvmSigner::EvmSigner(std::string_view private_key_hex)
    : key_(private_key_hex),
      address_(crypto::to_checksum_address(crypto::address_from_public_key(key_.public_key()))) {}

EvmSigner::SignedTransaction EvmSigner::sign(const Eip1559Transaction& tx) const {
    crypto::Hash256 digest = crypto::keccak256(tx.signing_payload());
    crypto::RecoverableSignature signature = key_.sign_digest(digest);

    SignedTransaction out;
    out.raw = tx.encode_signed(signature);
    crypto::Hash256 hash = crypto::keccak256(out.raw);
    out.hash = hex::encode(hash.data(), hash.size());
    return out;
}

// =============================================================================
// Receipts
// =============================================================================

LogEntry LogEntry::from_json(const json& j) {
    LogEntry log;
    log.address = j.value("address", std::string());
    if (j.contains("topics")) {
        for (const auto& t : j["topics"]) {
            log.topics.push_back(t.get<std::string>());
        }
    }
    log.data = j.value("data", std::string("0x"));
    log.block_number = quantity_or_zero(j, "blockNumber");
    log.transaction_hash = j.value("transactionHash", std::string());
    log.log_index = quantity_or_zero(j, "logIndex");
    return log;
}

TransactionReceipt TransactionReceipt::from_json(const json& j) {
    TransactionReceipt receipt;
    receipt.tx_hash = j.value("transactionHash", std::string());
    receipt.status = quantity_or_zero(j, "status") == 1;
    receipt.block_number = quantity_or_zero(j, "blockNumber");
    receipt.gas_used = quantity_or_zero(j, "gasUsed");
    if (j.contains("logs")) {
        for (const auto& l : j["logs"]) {
            receipt.logs.push_back(LogEntry::from_json(l));
        }
    }
    return receipt;
}

BigInt sum_transfers_to(const TransactionReceipt& receipt, std::string_view token,
                        std::string_view recipient) {
    std::string token_key = normalize_address(token);
    std::string recipient_key = normalize_address(recipient);

    BigInt total = 0;
    for (const auto& log : receipt.logs) {
        if (normalize_address(log.address) != token_key) continue;
        if (log.topics.size() != 3) continue;
        if (normalize_address(log.topics[0]) != abi::TRANSFER_EVENT_TOPIC) continue;
        if (abi::topic_to_address(log.topics[2]) != recipient_key) continue;
        total += hex::to_bigint(log.data);
    }
    return total;
}

}  // namespace chainswap
