// Chainswap - RLP Encoding Implementation

#include <chainswap/rlp.hpp>
#include <chainswap/encoding.hpp>

namespace chainswap::rlp {

namespace {

Bytes length_prefix(size_t length, uint8_t short_base, uint8_t long_base) {
    if (length <= 55) {
        return Bytes{static_cast<uint8_t>(short_base + length)};
    }
    Bytes len_bytes = hex::bigint_to_minimal_bytes(BigInt(length));
    Bytes out{static_cast<uint8_t>(long_base + len_bytes.size())};
    out.insert(out.end(), len_bytes.begin(), len_bytes.end());
    return out;
}

}  // namespace

Bytes encode_bytes(const Bytes& data) {
    if (data.size() == 1 && data[0] < 0x80) {
        return data;
    }
    Bytes out = length_prefix(data.size(), 0x80, 0xb7);
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

Bytes encode_uint(const BigInt& value) {
    return encode_bytes(hex::bigint_to_minimal_bytes(value));
}

Bytes encode_list(const std::vector<Bytes>& encoded_items) {
    size_t total = 0;
    for (const auto& item : encoded_items) total += item.size();

    Bytes out = length_prefix(total, 0xc0, 0xf7);
    out.reserve(out.size() + total);
    for (const auto& item : encoded_items) {
        out.insert(out.end(), item.begin(), item.end());
    }
    return out;
}

}  // namespace chainswap::rlp
