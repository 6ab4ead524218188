// Chainswap - Text Encodings
// Hex, EVM quantities, base58 and base64

#pragma once

#include <chainswap/types.hpp>
#include <string>
#include <string_view>

namespace chainswap {

namespace hex {

// Lowercase hex, "0x"-prefixed when requested
std::string encode(const uint8_t* data, size_t size, bool prefix = true);
inline std::string encode(const Bytes& data, bool prefix = true) {
    return encode(data.data(), data.size(), prefix);
}

// Accepts an optional 0x prefix; throws DecodeError on bad input
Bytes decode(std::string_view text);

// EVM JSON-RPC quantity ("0x1a") <-> integer
BigInt to_bigint(std::string_view quantity);
std::string from_bigint(const BigInt& value);
uint64_t to_uint64(std::string_view quantity);

// Big-endian, left padded to `width` bytes
Bytes bigint_to_bytes(const BigInt& value, size_t width);
// Big-endian with leading zero bytes stripped
Bytes bigint_to_minimal_bytes(const BigInt& value);
BigInt bytes_to_bigint(const uint8_t* data, size_t size);

}  // namespace hex

namespace base58 {

std::string encode(const Bytes& data);
Bytes decode(std::string_view text);

}  // namespace base58

namespace base64 {

std::string encode(const Bytes& data);
Bytes decode(std::string_view text);

}  // namespace base64

}  // namespace chainswap
