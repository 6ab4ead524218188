// Chainswap - Solidity ABI Implementation

#include <chainswap/abi.hpp>
#include <chainswap/crypto.hpp>
#include <chainswap/encoding.hpp>

namespace chainswap::abi {

namespace {

Bytes uint_word(const BigInt& value) {
    return hex::bigint_to_bytes(value, 32);
}

Bytes address_word(std::string_view address) {
    if (!crypto::is_hex_address(address)) {
        throw InvalidAddress(std::string(address));
    }
    Bytes raw = hex::decode(address);
    Bytes out(12, 0);
    out.insert(out.end(), raw.begin(), raw.end());
    return out;
}

Bytes padded_bytes(const Bytes& data) {
    Bytes out = uint_word(BigInt(data.size()));
    out.insert(out.end(), data.begin(), data.end());
    size_t rem = data.size() % 32;
    if (rem != 0) out.insert(out.end(), 32 - rem, 0);
    return out;
}

void append(Bytes& out, const Bytes& more) {
    out.insert(out.end(), more.begin(), more.end());
}

}  // namespace

// =============================================================================
// Encoder
// =============================================================================

Encoder::Encoder(std::string_view selector_hex) : selector_(hex::decode(selector_hex)) {
    if (selector_.size() != 4) {
        throw DecodeError("Function selector must be 4 bytes");
    }
}

Encoder& Encoder::add_uint(const BigInt& value) {
    slots_.push_back({uint_word(value), false});
    return *this;
}

Encoder& Encoder::add_address(std::string_view address) {
    slots_.push_back({address_word(address), false});
    return *this;
}

Encoder& Encoder::add_address_array(const std::vector<std::string>& addresses) {
    Bytes encoded = uint_word(BigInt(addresses.size()));
    for (const auto& a : addresses) append(encoded, address_word(a));
    slots_.push_back({std::move(encoded), true});
    return *this;
}

Encoder& Encoder::add_bytes(const Bytes& data) {
    slots_.push_back({padded_bytes(data), true});
    return *this;
}

Encoder& Encoder::add_bytes_array(const std::vector<Bytes>& items) {
    Bytes encoded = uint_word(BigInt(items.size()));
    Bytes tails;
    size_t heads = 32 * items.size();
    for (const auto& item : items) {
        append(encoded, uint_word(BigInt(heads + tails.size())));
        append(tails, padded_bytes(item));
    }
    append(encoded, tails);
    slots_.push_back({std::move(encoded), true});
    return *this;
}

Bytes Encoder::build() const {
    Bytes out = selector_;
    Bytes tails;
    size_t head_size = 32 * slots_.size();
    for (const auto& slot : slots_) {
        if (slot.dynamic) {
            append(out, uint_word(BigInt(head_size + tails.size())));
            append(tails, slot.encoded);
        } else {
            append(out, slot.encoded);
        }
    }
    append(out, tails);
    return out;
}

// =============================================================================
// Decoder
// =============================================================================

Bytes Decoder::word(size_t index) const {
    size_t begin = index * 32;
    if (begin + 32 > data_.size()) {
        throw DecodeError("ABI data too short: need word " + std::to_string(index) + " of " +
                          std::to_string(word_count()));
    }
    return Bytes(data_.begin() + static_cast<std::ptrdiff_t>(begin),
                 data_.begin() + static_cast<std::ptrdiff_t>(begin + 32));
}

BigInt Decoder::uint_at(size_t index) const {
    Bytes w = word(index);
    return hex::bytes_to_bigint(w.data(), w.size());
}

std::string Decoder::address_at(size_t index) const {
    Bytes w = word(index);
    return hex::encode(w.data() + 12, 20);
}

std::string Decoder::string_at(size_t index) const {
    BigInt offset = uint_at(index);
    if (offset % 32 != 0 || offset + 32 > data_.size()) {
        throw DecodeError("ABI string offset out of range");
    }
    auto start = offset.convert_to<size_t>();
    BigInt length = uint_at(start / 32);
    if (start + 32 + length > data_.size()) {
        throw DecodeError("ABI string length out of range");
    }
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(start + 32);
    return std::string(first, first + static_cast<std::ptrdiff_t>(length.convert_to<size_t>()));
}

// =============================================================================
// Revert payloads and topics
// =============================================================================

std::optional<std::string> decode_revert_reason(const Bytes& data) {
    if (data.size() < 4) return std::nullopt;
    std::string sel = hex::encode(data.data(), 4, false);
    Decoder body(Bytes(data.begin() + 4, data.end()));
    if (sel == selector::ERROR_STRING) {
        return body.string_at(0);
    }
    if (sel == selector::PANIC) {
        return "Panic(" + hex::from_bigint(body.uint_at(0)) + ")";
    }
    return std::nullopt;
}

std::string topic_to_address(std::string_view topic) {
    Bytes raw = hex::decode(topic);
    if (raw.size() != 32) {
        throw DecodeError("Address topic must be 32 bytes: " + std::string(topic));
    }
    return hex::encode(raw.data() + 12, 20);
}

}  // namespace chainswap::abi
