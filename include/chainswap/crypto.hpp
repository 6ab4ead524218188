// Chainswap - Cryptography
// Keccak-256, secp256k1 transaction signing and Ed25519 keypairs

#pragma once

#include <chainswap/types.hpp>
#include <array>
#include <string>
#include <string_view>

namespace chainswap::crypto {

using Hash256 = std::array<uint8_t, 32>;

// Original Keccak padding (0x01), as used by Ethereum; not NIST SHA3-256
Hash256 keccak256(const uint8_t* data, size_t size);
inline Hash256 keccak256(const Bytes& data) { return keccak256(data.data(), data.size()); }
Hash256 keccak256(std::string_view text);

// secp256k1 signature with Ethereum recovery id (y parity)
struct RecoverableSignature {
    BigInt r;
    BigInt s;
    uint8_t recovery_id = 0;
};

class Secp256k1PrivateKey {
public:
    // 32-byte key as hex, with or without 0x prefix
    explicit Secp256k1PrivateKey(std::string_view hex_key);

    // Uncompressed SEC1 point, 65 bytes with 0x04 prefix
    [[nodiscard]] const Bytes& public_key() const noexcept { return public_key_; }

    // Low-s normalized signature over a 32-byte digest
    [[nodiscard]] RecoverableSignature sign_digest(const Hash256& digest) const;

private:
    Bytes secret_;
    Bytes public_key_;
};

// Recovers the uncompressed public key that produced `signature` over `digest`
Bytes recover_public_key(const Hash256& digest, const RecoverableSignature& signature);

// Last 20 bytes of keccak(pubkey[1:]), as a lowercase 0x address
std::string address_from_public_key(const Bytes& uncompressed_public_key);

// EIP-55 mixed-case checksum encoding
std::string to_checksum_address(std::string_view address);

bool is_hex_address(std::string_view address);

class Ed25519Keypair {
public:
    // 64-byte base58 secret (seed || public key) or 32-byte seed
    static Ed25519Keypair from_base58(std::string_view secret);
    static Ed25519Keypair from_seed(const Bytes& seed);

    [[nodiscard]] const Bytes& public_key() const noexcept { return public_key_; }
    [[nodiscard]] std::string public_key_base58() const;

    [[nodiscard]] Bytes sign(const Bytes& message) const;

private:
    Ed25519Keypair(Bytes seed, Bytes public_key)
        : seed_(std::move(seed)), public_key_(std::move(public_key)) {}

    Bytes seed_;
    Bytes public_key_;
};

}  // namespace chainswap::crypto
