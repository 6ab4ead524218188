// Chainswap Tests - In-Memory EVM Chain Implementation

#include "fake_evm_chain.hpp"
#include "rlp_decoder.hpp"
#include <chainswap/crypto.hpp>
#include <chainswap/encoding.hpp>
#include <chainswap/rlp.hpp>
#include <algorithm>

namespace chainswap::testing {

namespace {

class ForwardingTransport : public JsonRpcTransport {
public:
    explicit ForwardingTransport(FakeEvmChain& chain) : chain_(chain) {}

    json call(const std::string& method, const json& params) override {
        return chain_.call(method, params);
    }

private:
    FakeEvmChain& chain_;
};

std::string quantity(uint64_t value) {
    return hex::from_bigint(BigInt(value));
}

std::string handler_key(std::string_view contract, std::string_view selector_hex) {
    std::string selector(selector_hex);
    if (selector.rfind("0x", 0) == 0) selector = selector.substr(2);
    return normalize_address(contract) + ":" + selector;
}

}  // namespace

std::string FakeEvmChain::SentTransaction::selector() const {
    if (data.size() < 4) return "";
    return hex::encode(data.data(), 4, false);
}

void FakeEvmChain::on_call(std::string_view contract, std::string_view selector_hex,
                           CallHandler handler) {
    handlers_[handler_key(contract, selector_hex)] = std::move(handler);
}

void FakeEvmChain::set_native_balance(std::string_view owner, const BigInt& wei) {
    native_balances_[normalize_address(owner)] = wei;
}

void FakeEvmChain::add_erc20(std::string_view token, std::string symbol, unsigned decimals) {
    std::string key = normalize_address(token);
    on_call(token, abi::selector::SYMBOL,
            [symbol](const Bytes&) { return encode_string(symbol); });
    on_call(token, abi::selector::DECIMALS,
            [decimals](const Bytes&) { return encode_uint(BigInt(decimals)); });
    on_call(token, abi::selector::BALANCE_OF, [this, key](const Bytes& calldata) {
        std::string owner = hex::encode(calldata.data() + 16, 20);
        auto& balances = token_balances_[key];
        auto it = balances.find(owner);
        return encode_uint(it == balances.end() ? BigInt(0) : it->second);
    });
}

void FakeEvmChain::set_token_balance(std::string_view token, std::string_view owner,
                                     const BigInt& amount) {
    token_balances_[normalize_address(token)][normalize_address(owner)] = amount;
}

std::unique_ptr<JsonRpcTransport> FakeEvmChain::transport() {
    return std::make_unique<ForwardingTransport>(*this);
}

int FakeEvmChain::count(const std::string& method) const {
    return static_cast<int>(std::count(methods_.begin(), methods_.end(), method));
}

json FakeEvmChain::call(const std::string& method, const json& params) {
    methods_.push_back(method);

    if (method == "eth_chainId") {
        return quantity(chain_id);
    }
    if (method == "eth_blockNumber") {
        // Every poll sees one more block
        return quantity(++block_number);
    }
    if (method == "eth_getBlockByNumber") {
        return json{{"number", quantity(block_number)},
                    {"timestamp", quantity(timestamp)},
                    {"baseFeePerGas", hex::from_bigint(base_fee)}};
    }
    if (method == "eth_maxPriorityFeePerGas") {
        return hex::from_bigint(priority_fee);
    }
    if (method == "eth_getTransactionCount") {
        return quantity(nonces_[normalize_address(params.at(0).get<std::string>())]);
    }
    if (method == "eth_getBalance") {
        auto it = native_balances_.find(normalize_address(params.at(0).get<std::string>()));
        return hex::from_bigint(it == native_balances_.end() ? BigInt(0) : it->second);
    }
    if (method == "eth_call") {
        call_blocks_.push_back(params.size() > 1 ? params.at(1).get<std::string>() : "latest");
        return eth_call(params.at(0));
    }
    if (method == "eth_sendRawTransaction") {
        return send_raw_transaction(params.at(0).get<std::string>());
    }
    if (method == "eth_getTransactionReceipt") {
        auto it = receipts_.find(params.at(0).get<std::string>());
        return it == receipts_.end() ? json(nullptr) : it->second;
    }
    if (method == "eth_getTransactionByHash") {
        auto it = transactions_.find(params.at(0).get<std::string>());
        return it == transactions_.end() ? json(nullptr) : it->second;
    }
    throw RpcError("Method not found: " + method, -32601);
}

json FakeEvmChain::eth_call(const json& tx) {
    Bytes data = hex::decode(tx.value("data", std::string("0x")));
    std::string to = tx.value("to", std::string());
    std::string selector = data.size() >= 4 ? hex::encode(data.data(), 4, false) : "";

    auto it = handlers_.find(handler_key(to, selector));
    if (it == handlers_.end()) {
        throw RpcError("execution reverted: no handler for " + to + ":" + selector, -32000);
    }
    return hex::encode(it->second(data));
}

json FakeEvmChain::send_raw_transaction(const std::string& raw_hex) {
    Bytes raw = hex::decode(raw_hex);
    if (raw.empty() || raw[0] != 0x02) {
        throw RpcError("only type-2 transactions are accepted", -32000);
    }
    RlpItem item = rlp_decode(Bytes(raw.begin() + 1, raw.end()));
    if (!item.is_list || item.children.size() != 12) {
        throw RpcError("malformed EIP-1559 transaction", -32000);
    }

    // Recover the sender from the signature over the unsigned fields
    std::vector<Bytes> unsigned_fields;
    for (size_t i = 0; i < 9; ++i) {
        unsigned_fields.push_back(item.children[i].encoded);
    }
    Bytes payload{0x02};
    Bytes body = rlp::encode_list(unsigned_fields);
    payload.insert(payload.end(), body.begin(), body.end());

    crypto::RecoverableSignature signature;
    signature.recovery_id = static_cast<uint8_t>(item.children[9].as_uint().convert_to<unsigned>());
    signature.r = item.children[10].as_uint();
    signature.s = item.children[11].as_uint();
    Bytes public_key = crypto::recover_public_key(crypto::keccak256(payload), signature);

    SentTransaction sent;
    crypto::Hash256 hash = crypto::keccak256(raw);
    sent.hash = hex::encode(hash.data(), hash.size());
    sent.from = crypto::address_from_public_key(public_key);
    sent.chain_id = item.children[0].as_uint().convert_to<uint64_t>();
    sent.nonce = item.children[1].as_uint().convert_to<uint64_t>();
    sent.max_priority_fee_per_gas = item.children[2].as_uint();
    sent.max_fee_per_gas = item.children[3].as_uint();
    sent.gas_limit = item.children[4].as_uint().convert_to<uint64_t>();
    sent.to = hex::encode(item.children[5].payload);
    sent.data = item.children[7].payload;

    uint64_t& expected_nonce = nonces_[sent.from];
    if (sent.nonce != expected_nonce) {
        throw RpcError("nonce mismatch: expected " + std::to_string(expected_nonce), -32000);
    }
    ++expected_nonce;
    sent_.push_back(sent);

    Outcome outcome = on_transaction_ ? on_transaction_(sent) : Outcome{};
    ++block_number;

    transactions_[sent.hash] = json{{"hash", sent.hash},
                                    {"from", sent.from},
                                    {"to", sent.to},
                                    {"input", hex::encode(sent.data)},
                                    {"value", "0x0"},
                                    {"gas", quantity(sent.gas_limit)},
                                    {"blockNumber", quantity(block_number)}};
    if (!outcome.never_mined) {
        json logs = json::array();
        for (auto log : outcome.logs) {
            log["transactionHash"] = sent.hash;
            log["blockNumber"] = quantity(block_number);
            logs.push_back(std::move(log));
        }
        receipts_[sent.hash] = json{{"transactionHash", sent.hash},
                                    {"status", outcome.success ? "0x1" : "0x0"},
                                    {"blockNumber", quantity(block_number)},
                                    {"gasUsed", "0x5208"},
                                    {"logs", logs}};
    }
    return sent.hash;
}

// =============================================================================
// Helpers
// =============================================================================

Bytes encode_uint(const BigInt& value) {
    return abi::Encoder().add_uint(value).build();
}

Bytes encode_address(std::string_view address) {
    return abi::Encoder().add_address(address).build();
}

Bytes encode_string(const std::string& text) {
    return abi::Encoder().add_bytes(Bytes(text.begin(), text.end())).build();
}

void revert_with(const std::string& reason) {
    Bytes data = hex::decode(abi::selector::ERROR_STRING);
    Bytes args = encode_string(reason);
    data.insert(data.end(), args.begin(), args.end());
    throw RpcError("execution reverted: " + reason, 3, hex::encode(data));
}

json transfer_log(std::string_view token, std::string_view from, std::string_view to,
                  const BigInt& amount) {
    auto topic = [](std::string_view address) {
        return hex::encode(encode_address(address));
    };
    return json{{"address", std::string(token)},
                {"topics", {std::string(abi::TRANSFER_EVENT_TOPIC), topic(from), topic(to)}},
                {"data", hex::encode(hex::bigint_to_bytes(amount, 32))},
                {"logIndex", "0x0"}};
}

std::string test_address(uint8_t byte) {
    return hex::encode(Bytes(20, byte));
}

}  // namespace chainswap::testing
