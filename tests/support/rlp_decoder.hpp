// Chainswap Tests - RLP Decoder
// Just enough RLP to inspect transactions submitted to the fake chain

#pragma once

#include <chainswap/types.hpp>
#include <vector>

namespace chainswap::testing {

struct RlpItem {
    bool is_list = false;
    Bytes payload;   // string contents, or the concatenated list body
    Bytes encoded;   // the item's full encoding, prefix included
    std::vector<RlpItem> children;

    [[nodiscard]] BigInt as_uint() const;
};

// Decodes exactly one item spanning the whole input
RlpItem rlp_decode(const Bytes& data);

}  // namespace chainswap::testing
