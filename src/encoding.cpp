// Chainswap - Text Encodings Implementation

#include <chainswap/encoding.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <limits>

namespace chainswap {

namespace {

constexpr const char* HEX_DIGITS = "0123456789abcdef";
constexpr std::string_view BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view strip_prefix(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    return text;
}

}  // namespace

// =============================================================================
// Hex
// =============================================================================

namespace hex {

std::string encode(const uint8_t* data, size_t size, bool prefix) {
    std::string out;
    out.reserve(size * 2 + 2);
    if (prefix) out = "0x";
    for (size_t i = 0; i < size; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0f]);
    }
    return out;
}

Bytes decode(std::string_view text) {
    std::string_view digits = strip_prefix(text);
    if (digits.size() % 2 != 0) {
        throw DecodeError("Odd-length hex string: " + std::string(text));
    }
    Bytes out;
    out.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = nibble(digits[i]);
        int lo = nibble(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            throw DecodeError("Invalid hex string: " + std::string(text));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

BigInt to_bigint(std::string_view quantity) {
    std::string_view digits = strip_prefix(quantity);
    BigInt value = 0;
    for (char c : digits) {
        int v = nibble(c);
        if (v < 0) {
            throw DecodeError("Invalid hex quantity: " + std::string(quantity));
        }
        value = (value << 4) | v;
    }
    return value;
}

std::string from_bigint(const BigInt& value) {
    if (value.is_zero()) return "0x0";
    std::string digits = encode(bigint_to_minimal_bytes(value), false);
    auto first = digits.find_first_not_of('0');
    return "0x" + digits.substr(first);
}

uint64_t to_uint64(std::string_view quantity) {
    BigInt value = to_bigint(quantity);
    if (value > std::numeric_limits<uint64_t>::max()) {
        throw DecodeError("Quantity exceeds 64 bits: " + std::string(quantity));
    }
    return value.convert_to<uint64_t>();
}

Bytes bigint_to_bytes(const BigInt& value, size_t width) {
    if (value < 0) {
        throw std::out_of_range("Negative value cannot be encoded as unsigned");
    }
    Bytes out(width, 0);
    BigInt v = value;
    for (size_t i = 0; i < width; ++i) {
        out[width - 1 - i] = static_cast<uint8_t>(BigInt(v & 0xff).convert_to<unsigned>());
        v >>= 8;
    }
    if (!v.is_zero()) {
        throw std::out_of_range("Value does not fit in " + std::to_string(width) + " bytes");
    }
    return out;
}

Bytes bigint_to_minimal_bytes(const BigInt& value) {
    if (value < 0) {
        throw std::out_of_range("Negative value cannot be encoded as unsigned");
    }
    Bytes out;
    BigInt v = value;
    while (!v.is_zero()) {
        out.push_back(static_cast<uint8_t>(BigInt(v & 0xff).convert_to<unsigned>()));
        v >>= 8;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

BigInt bytes_to_bigint(const uint8_t* data, size_t size) {
    BigInt value = 0;
    for (size_t i = 0; i < size; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

}  // namespace hex

// =============================================================================
// Base58 (Bitcoin alphabet, as used by Solana)
// =============================================================================

namespace base58 {

std::string encode(const Bytes& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) ++zeros;

    BigInt n = hex::bytes_to_bigint(data.data(), data.size());
    std::string out;
    while (!n.is_zero()) {
        unsigned digit = BigInt(n % 58).convert_to<unsigned>();
        n /= 58;
        out.push_back(BASE58_ALPHABET[digit]);
    }
    out.append(zeros, '1');
    std::reverse(out.begin(), out.end());
    return out;
}

Bytes decode(std::string_view text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') ++zeros;

    BigInt n = 0;
    for (char c : text) {
        auto idx = BASE58_ALPHABET.find(c);
        if (idx == std::string_view::npos) {
            throw DecodeError("Invalid base58 character in: " + std::string(text));
        }
        n = n * 58 + static_cast<unsigned>(idx);
    }
    Bytes body = hex::bigint_to_minimal_bytes(n);
    Bytes out(zeros, 0);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

}  // namespace base58

// =============================================================================
// Base64 (OpenSSL EVP block codec)
// =============================================================================

namespace base64 {

std::string encode(const Bytes& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

Bytes decode(std::string_view text) {
    if (text.empty()) return {};
    if (text.size() % 4 != 0) {
        throw DecodeError("Invalid base64 length");
    }
    Bytes out(3 * text.size() / 4, 0);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw DecodeError("Invalid base64 input");
    }
    size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

}  // namespace base64

}  // namespace chainswap
