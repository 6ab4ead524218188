// Chainswap - Error Taxonomy
// Every failure surfaced by the engine derives from EngineError

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace chainswap {

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& msg) : std::runtime_error(msg) {}
};

class UnsupportedChain : public EngineError {
public:
    explicit UnsupportedChain(const std::string& chain)
        : EngineError("Unsupported chain: " + chain), chain_(chain) {}
    UnsupportedChain(const std::string& chain, const std::string& msg)
        : EngineError(msg), chain_(chain) {}

    [[nodiscard]] const std::string& chain() const noexcept { return chain_; }

private:
    std::string chain_;
};

class UnknownVenue : public EngineError {
public:
    explicit UnknownVenue(const std::string& name)
        : EngineError("Unknown venue: " + name), name_(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

// No pool or pair exists for the requested tokens
class NoMarket : public EngineError {
public:
    explicit NoMarket(const std::string& msg) : EngineError(msg) {}
};

class InvalidSlippage : public EngineError {
public:
    explicit InvalidSlippage(long long bps)
        : EngineError("Slippage must be between 0 and 10000 bps, got " + std::to_string(bps)),
          bps_(bps) {}

    [[nodiscard]] long long bps() const noexcept { return bps_; }

private:
    long long bps_;
};

class InsufficientBalance : public EngineError {
public:
    explicit InsufficientBalance(const std::string& msg) : EngineError(msg) {}
};

class InvalidAddress : public EngineError {
public:
    explicit InvalidAddress(const std::string& address)
        : EngineError("Invalid address: " + address), address_(address) {}

    [[nodiscard]] const std::string& address() const noexcept { return address_; }

private:
    std::string address_;
};

class ApprovalFailed : public EngineError {
public:
    ApprovalFailed(const std::string& tx_hash, const std::string& reason)
        : EngineError("Approval " + tx_hash + " failed: " + reason),
          tx_hash_(tx_hash), reason_(reason) {}

    [[nodiscard]] const std::string& tx_hash() const noexcept { return tx_hash_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    std::string tx_hash_;
    std::string reason_;
};

class TransactionReverted : public EngineError {
public:
    TransactionReverted(const std::string& tx_hash, const std::string& reason)
        : EngineError("Transaction " + tx_hash + " reverted: " + reason),
          tx_hash_(tx_hash), reason_(reason) {}

    [[nodiscard]] const std::string& tx_hash() const noexcept { return tx_hash_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    std::string tx_hash_;
    std::string reason_;
};

// The transaction was broadcast but its fate is unknown
class TransactionTimeout : public EngineError {
public:
    explicit TransactionTimeout(const std::string& tx_hash)
        : EngineError("Transaction " + tx_hash + " not confirmed before timeout"),
          tx_hash_(tx_hash) {}
    TransactionTimeout(const std::string& tx_hash, const std::string& msg)
        : EngineError(msg), tx_hash_(tx_hash) {}

    [[nodiscard]] const std::string& tx_hash() const noexcept { return tx_hash_; }

    // Set when a swap times out after its approval was confirmed
    [[nodiscard]] const std::optional<std::string>& approval_tx_hash() const noexcept {
        return approval_tx_hash_;
    }
    void set_approval_tx_hash(std::string hash) { approval_tx_hash_ = std::move(hash); }

private:
    std::string tx_hash_;
    std::optional<std::string> approval_tx_hash_;
};

class ConfirmationTimeout : public TransactionTimeout {
public:
    explicit ConfirmationTimeout(const std::string& signature)
        : TransactionTimeout(signature,
                             "Transaction " + signature + " not finalized before timeout") {}
};

// Transient network or provider failure
class RpcError : public EngineError {
public:
    explicit RpcError(const std::string& msg) : EngineError(msg) {}
    RpcError(const std::string& msg, int code, std::optional<std::string> data = std::nullopt)
        : EngineError(msg), code_(code), data_(std::move(data)) {}

    [[nodiscard]] std::optional<int> code() const noexcept { return code_; }
    [[nodiscard]] const std::optional<std::string>& data() const noexcept { return data_; }

private:
    std::optional<int> code_;
    std::optional<std::string> data_;
};

// Non-success response from an off-chain HTTP API
class ApiError : public EngineError {
public:
    ApiError(long status, const std::string& body)
        : EngineError("HTTP " + std::to_string(status) + ": " + body), status_(status) {}

    [[nodiscard]] long status() const noexcept { return status_; }

private:
    long status_;
};

class DecodeError : public EngineError {
public:
    explicit DecodeError(const std::string& msg) : EngineError(msg) {}
};

class NotImplemented : public EngineError {
public:
    explicit NotImplemented(const std::string& msg) : EngineError(msg) {}
};

class ReconciliationError : public EngineError {
public:
    explicit ReconciliationError(const std::string& msg) : EngineError(msg) {}
};

}  // namespace chainswap
