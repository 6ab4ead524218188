// Chainswap - Types Implementation

#include <chainswap/types.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <ostream>
#include <stdexcept>

namespace chainswap {

// =============================================================================
// Decimal
// =============================================================================

Decimal::Decimal(BigInt unscaled, unsigned scale)
    : unscaled_(std::move(unscaled)), scale_(scale) {
    normalize();
}

BigInt Decimal::pow10(unsigned exponent) {
    return boost::multiprecision::pow(BigInt(10), exponent);
}

void Decimal::normalize() {
    if (unscaled_.is_zero()) {
        scale_ = 0;
        return;
    }
    while (scale_ > 0 && unscaled_ % 10 == 0) {
        unscaled_ /= 10;
        --scale_;
    }
}

int Decimal::compare(const Decimal& rhs) const {
    if (scale_ == rhs.scale_) {
        return unscaled_.compare(rhs.unscaled_);
    }
    if (scale_ < rhs.scale_) {
        BigInt lhs = unscaled_ * pow10(rhs.scale_ - scale_);
        return lhs.compare(rhs.unscaled_);
    }
    BigInt scaled_rhs = rhs.unscaled_ * pow10(scale_ - rhs.scale_);
    return unscaled_.compare(scaled_rhs);
}

Decimal Decimal::from_string(std::string_view s) {
    size_t i = 0;
    const size_t n = s.size();
    bool negative = false;
    if (i < n && (s[i] == '+' || s[i] == '-')) {
        negative = s[i] == '-';
        ++i;
    }

    std::string digits;
    unsigned scale = 0;
    bool seen_dot = false;
    for (; i < n; ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
            if (seen_dot) ++scale;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            break;
        }
    }
    if (digits.empty()) {
        throw std::invalid_argument("Invalid decimal: " + std::string(s));
    }

    long exponent = 0;
    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < n && s[i] == '+') ++i;
        auto [ptr, ec] = std::from_chars(s.data() + i, s.data() + n, exponent);
        if (ec != std::errc() || ptr == s.data() + i) {
            throw std::invalid_argument("Invalid decimal exponent: " + std::string(s));
        }
        i = static_cast<size_t>(ptr - s.data());
    }
    if (i != n) {
        throw std::invalid_argument("Invalid decimal: " + std::string(s));
    }

    // cpp_int treats a leading zero as an octal prefix
    auto first = digits.find_first_not_of('0');
    digits = first == std::string::npos ? "0" : digits.substr(first);

    BigInt unscaled(digits);
    if (exponent > 0) {
        auto e = static_cast<unsigned>(exponent);
        if (e >= scale) {
            unscaled *= pow10(e - scale);
            scale = 0;
        } else {
            scale -= e;
        }
    } else if (exponent < 0) {
        scale += static_cast<unsigned>(-exponent);
    }
    if (negative) unscaled = -unscaled;
    return Decimal(std::move(unscaled), scale);
}

BigInt Decimal::to_base_units(unsigned decimals) const {
    if (scale_ <= decimals) {
        return unscaled_ * pow10(decimals - scale_);
    }
    return unscaled_ / pow10(scale_ - decimals);
}

BigInt Decimal::truncate() const {
    return to_base_units(0);
}

std::string Decimal::to_string() const {
    BigInt magnitude = unscaled_ < 0 ? BigInt(-unscaled_) : unscaled_;
    std::string digits = magnitude.str();
    std::string sign = is_negative() ? "-" : "";
    if (scale_ == 0) {
        return sign + digits;
    }
    if (digits.size() <= scale_) {
        digits.insert(0, scale_ + 1 - digits.size(), '0');
    }
    digits.insert(digits.size() - scale_, 1, '.');
    return sign + digits;
}

double Decimal::to_double() const {
    return std::stod(to_string());
}

Decimal Decimal::operator+(const Decimal& rhs) const {
    unsigned scale = std::max(scale_, rhs.scale_);
    return Decimal(unscaled_ * pow10(scale - scale_) + rhs.unscaled_ * pow10(scale - rhs.scale_),
                   scale);
}

Decimal Decimal::operator-(const Decimal& rhs) const {
    return *this + (-rhs);
}

Decimal Decimal::operator*(const Decimal& rhs) const {
    return Decimal(unscaled_ * rhs.unscaled_, scale_ + rhs.scale_);
}

Decimal Decimal::operator/(const Decimal& rhs) const {
    if (rhs.is_zero()) {
        throw std::domain_error("Decimal division by zero");
    }
    BigInt numerator = unscaled_ * pow10(rhs.scale_ + DIVISION_PRECISION);
    BigInt denominator = rhs.unscaled_ * pow10(scale_);
    return Decimal(numerator / denominator, DIVISION_PRECISION);
}

std::ostream& operator<<(std::ostream& os, const Decimal& d) {
    return os << d.to_string();
}

// =============================================================================
// Addresses and tokens
// =============================================================================

std::string normalize_address(std::string_view address) {
    std::string out(address);
    if (out.size() >= 2 && out[0] == '0' && (out[1] == 'x' || out[1] == 'X')) {
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    return out;
}

bool address_less(std::string_view a, std::string_view b) {
    return normalize_address(a) < normalize_address(b);
}

std::string TokenInfo::to_string() const {
    return symbol + " (" + address + ") on " + chain;
}

bool operator==(const TokenInfo& a, const TokenInfo& b) {
    return a.chain == b.chain && a.address_key() == b.address_key();
}

bool operator!=(const TokenInfo& a, const TokenInfo& b) {
    return !(a == b);
}

std::pair<TokenInfo, TokenInfo> canonical_order(const TokenInfo& a, const TokenInfo& b) {
    if (address_less(b.address, a.address)) {
        return {b, a};
    }
    return {a, b};
}

// =============================================================================
// Slippage
// =============================================================================

Slippage::Slippage(long long bps) : bps_(bps) {
    if (bps < 0 || bps > MAX_BPS) {
        throw InvalidSlippage(bps);
    }
}

Slippage Slippage::from_percentage(const Decimal& percentage) {
    BigInt bps = (percentage * Decimal::from_integer(100)).truncate();
    if (bps < 0) {
        throw InvalidSlippage(-1);
    }
    if (bps > MAX_BPS) {
        throw InvalidSlippage(bps > 1000000000 ? MAX_BPS + 1 : bps.convert_to<long long>());
    }
    return Slippage(bps.convert_to<long long>());
}

Decimal Slippage::to_percentage() const {
    return Decimal(BigInt(bps_), 2);
}

Decimal Slippage::to_multiplier() const {
    return Decimal(BigInt(MAX_BPS - bps_), 4);
}

BigInt Slippage::minimum_amount(const BigInt& raw_amount) const {
    return raw_amount * (MAX_BPS - bps_) / MAX_BPS;
}

}  // namespace chainswap
