// Chainswap - Core Types
// Exact decimal arithmetic and token value types

#pragma once

#include <chainswap/errors.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chainswap {

namespace bignum {
using boost::multiprecision::cpp_int;
}  // namespace bignum

// Raw on-chain integer amounts (wei, lamports, liquidity, sqrt prices)
using BigInt = bignum::cpp_int;
using Bytes = std::vector<uint8_t>;

// Arbitrary-precision decimal: value = unscaled * 10^(-scale)
// Addition, subtraction, multiplication and comparison are exact.
class Decimal {
public:
    static constexpr unsigned DIVISION_PRECISION = 36;

    Decimal() = default;
    Decimal(BigInt unscaled, unsigned scale);

    static Decimal from_string(std::string_view s);
    static Decimal from_integer(const BigInt& value) { return Decimal(value, 0); }
    static Decimal from_base_units(const BigInt& raw, unsigned decimals) {
        return Decimal(raw, decimals);
    }

    // amount * 10^decimals, truncated toward zero
    [[nodiscard]] BigInt to_base_units(unsigned decimals) const;
    [[nodiscard]] BigInt truncate() const;

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] double to_double() const;

    [[nodiscard]] const BigInt& unscaled() const noexcept { return unscaled_; }
    [[nodiscard]] unsigned scale() const noexcept { return scale_; }

    Decimal operator+(const Decimal& rhs) const;
    Decimal operator-(const Decimal& rhs) const;
    Decimal operator*(const Decimal& rhs) const;
    // Truncates after DIVISION_PRECISION fractional digits
    Decimal operator/(const Decimal& rhs) const;
    Decimal operator-() const { return Decimal(-unscaled_, scale_); }

    Decimal& operator+=(const Decimal& rhs) { return *this = *this + rhs; }
    Decimal& operator-=(const Decimal& rhs) { return *this = *this - rhs; }

    bool operator==(const Decimal& rhs) const { return compare(rhs) == 0; }
    bool operator!=(const Decimal& rhs) const { return compare(rhs) != 0; }
    bool operator<(const Decimal& rhs) const { return compare(rhs) < 0; }
    bool operator<=(const Decimal& rhs) const { return compare(rhs) <= 0; }
    bool operator>(const Decimal& rhs) const { return compare(rhs) > 0; }
    bool operator>=(const Decimal& rhs) const { return compare(rhs) >= 0; }

    [[nodiscard]] Decimal abs() const { return is_negative() ? -*this : *this; }
    [[nodiscard]] bool is_zero() const { return unscaled_.is_zero(); }
    [[nodiscard]] bool is_positive() const { return unscaled_.sign() > 0; }
    [[nodiscard]] bool is_negative() const { return unscaled_.sign() < 0; }

    static Decimal zero() { return Decimal(); }
    static Decimal one() { return Decimal(1, 0); }

    static BigInt pow10(unsigned exponent);

private:
    void normalize();
    [[nodiscard]] int compare(const Decimal& rhs) const;

    BigInt unscaled_ = 0;
    unsigned scale_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Decimal& d);

// Lowercases 0x-prefixed EVM addresses; other encodings (base58) are case-sensitive
std::string normalize_address(std::string_view address);

// Ascending-address ordering used by pools to pick token0/token1
bool address_less(std::string_view a, std::string_view b);

// Token metadata. Identity is (address, chain); symbol is only a label.
struct TokenInfo {
    std::string symbol;
    std::string address;
    unsigned decimals = 0;
    std::string chain;
    bool is_native = false;

    [[nodiscard]] BigInt to_base_units(const Decimal& amount) const {
        return amount.to_base_units(decimals);
    }

    [[nodiscard]] Decimal from_base_units(const BigInt& raw) const {
        return Decimal::from_base_units(raw, decimals);
    }

    [[nodiscard]] std::string address_key() const { return normalize_address(address); }
    [[nodiscard]] std::string to_string() const;
};

bool operator==(const TokenInfo& a, const TokenInfo& b);
bool operator!=(const TokenInfo& a, const TokenInfo& b);

// Orders two tokens by ascending address
std::pair<TokenInfo, TokenInfo> canonical_order(const TokenInfo& a, const TokenInfo& b);

using Market = std::pair<TokenInfo, TokenInfo>;

struct TokenAmount {
    TokenInfo token;
    Decimal value;

    static TokenAmount from_base_units(const TokenInfo& token, const BigInt& raw) {
        return TokenAmount{token, token.from_base_units(raw)};
    }

    [[nodiscard]] BigInt base_units() const { return token.to_base_units(value); }
};

// Slippage tolerance in basis points, 0..10000
class Slippage {
public:
    static constexpr long long MAX_BPS = 10000;
    static constexpr long long DEFAULT_BPS = 100;

    explicit Slippage(long long bps = DEFAULT_BPS);

    // 1.5 (%) -> 150 bps
    static Slippage from_percentage(const Decimal& percentage);

    [[nodiscard]] int bps() const noexcept { return static_cast<int>(bps_); }
    [[nodiscard]] Decimal to_percentage() const;
    [[nodiscard]] Decimal to_multiplier() const;

    // floor(raw_amount * (10000 - bps) / 10000) for non-negative raw amounts
    [[nodiscard]] BigInt minimum_amount(const BigInt& raw_amount) const;

private:
    long long bps_;
};

// Two-phase swap lifecycle
enum class SwapStage : uint8_t {
    NotApproved = 0,
    Approved = 1,
    Submitted = 2,
    Confirmed = 3,
    Reverted = 4,
    TimedOut = 5
};

inline constexpr const char* to_string(SwapStage s) noexcept {
    switch (s) {
        case SwapStage::NotApproved: return "not_approved";
        case SwapStage::Approved: return "approved";
        case SwapStage::Submitted: return "submitted";
        case SwapStage::Confirmed: return "confirmed";
        case SwapStage::Reverted: return "reverted";
        case SwapStage::TimedOut: return "timed_out";
    }
    return "unknown";
}

struct SwapResult {
    bool success = false;
    Decimal amount_spent;
    Decimal amount_received;
    std::optional<std::string> tx_hash;
    std::optional<std::string> error;
    SwapStage stage = SwapStage::NotApproved;
    std::optional<std::string> approval_tx_hash;

    static SwapResult build_success(Decimal amount_spent, Decimal amount_received,
                                    std::string tx_hash) {
        SwapResult r;
        r.success = true;
        r.amount_spent = std::move(amount_spent);
        r.amount_received = std::move(amount_received);
        r.tx_hash = std::move(tx_hash);
        r.stage = SwapStage::Confirmed;
        return r;
    }

    static SwapResult build_error(Decimal amount_spent, std::string error,
                                  std::optional<std::string> tx_hash = std::nullopt) {
        SwapResult r;
        r.success = false;
        r.amount_spent = std::move(amount_spent);
        r.error = std::move(error);
        r.tx_hash = std::move(tx_hash);
        r.stage = SwapStage::Reverted;
        return r;
    }
};

struct Quote {
    TokenInfo token_out;
    TokenInfo token_in;
    Decimal amount_in;
    Decimal amount_out;
    Decimal price;  // token_out per 1 token_in
    std::vector<std::string> route;
};

}  // namespace chainswap
