// Chainswap - RLP Encoding
// Recursive Length Prefix serialization for typed EVM transactions

#pragma once

#include <chainswap/types.hpp>
#include <vector>

namespace chainswap::rlp {

Bytes encode_bytes(const Bytes& data);

// Big-endian with no leading zeros; zero encodes as the empty string
Bytes encode_uint(const BigInt& value);

// Wraps already-encoded items in a list header
Bytes encode_list(const std::vector<Bytes>& encoded_items);

}  // namespace chainswap::rlp
