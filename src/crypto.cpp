// Chainswap - Cryptography Implementation
// Keccak-256, secp256k1 and Ed25519 through OpenSSL 3 EVP

#include <chainswap/crypto.hpp>
#include <chainswap/encoding.hpp>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>
#include <cctype>
#include <memory>

namespace chainswap::crypto {

namespace {

// =============================================================================
// OpenSSL handles
// =============================================================================

template <typename T, void (*Free)(T*)>
struct OsslDeleter {
    void operator()(T* p) const { Free(p); }
};

template <typename T, void (*Free)(T*)>
using OsslPtr = std::unique_ptr<T, OsslDeleter<T, Free>>;

using BnPtr = OsslPtr<BIGNUM, BN_clear_free>;
using BnCtxPtr = OsslPtr<BN_CTX, BN_CTX_free>;
using GroupPtr = OsslPtr<EC_GROUP, EC_GROUP_free>;
using PointPtr = OsslPtr<EC_POINT, EC_POINT_free>;
using PkeyPtr = OsslPtr<EVP_PKEY, EVP_PKEY_free>;
using PkeyCtxPtr = OsslPtr<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;
using SigPtr = OsslPtr<ECDSA_SIG, ECDSA_SIG_free>;
using ParamBldPtr = OsslPtr<OSSL_PARAM_BLD, OSSL_PARAM_BLD_free>;
using ParamPtr = OsslPtr<OSSL_PARAM, OSSL_PARAM_free>;
using MdCtxPtr = OsslPtr<EVP_MD_CTX, EVP_MD_CTX_free>;
using MdPtr = OsslPtr<EVP_MD, EVP_MD_free>;

[[noreturn]] void openssl_fail(const std::string& what) {
    char buf[256] = {0};
    unsigned long code = ERR_get_error();
    if (code != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        throw EngineError(what + ": " + buf);
    }
    throw EngineError(what);
}

const BigInt& secp256k1_order() {
    static const BigInt order = hex::to_bigint(
        "0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");
    return order;
}

BnPtr to_bn(const BigInt& value) {
    Bytes raw = hex::bigint_to_bytes(value, 32);
    BnPtr bn(BN_bin2bn(raw.data(), static_cast<int>(raw.size()), nullptr));
    if (!bn) openssl_fail("BN_bin2bn");
    return bn;
}

BigInt from_bn(const BIGNUM* bn) {
    Bytes raw(static_cast<size_t>(BN_num_bytes(bn)));
    BN_bn2bin(bn, raw.data());
    return hex::bytes_to_bigint(raw.data(), raw.size());
}

GroupPtr secp256k1_group() {
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!group) openssl_fail("EC_GROUP_new_by_curve_name(secp256k1)");
    return group;
}

Bytes encode_point(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
    Bytes out(65);
    size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                    out.data(), out.size(), ctx);
    if (len != out.size()) openssl_fail("EC_POINT_point2oct");
    return out;
}

PkeyPtr make_ec_keypair(const Bytes& secret, const Bytes& public_key) {
    BnPtr priv(BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr));
    ParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!priv || !bld) openssl_fail("OSSL_PARAM_BLD_new");
    if (OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                        "secp256k1", 0) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, priv.get()) != 1 ||
        OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                         public_key.data(), public_key.size()) != 1) {
        openssl_fail("OSSL_PARAM_BLD_push");
    }
    ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
        openssl_fail("EVP_PKEY_fromdata_init");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_KEYPAIR, params.get()) <= 0) {
        openssl_fail("EVP_PKEY_fromdata");
    }
    return PkeyPtr(raw);
}

PkeyPtr make_ed25519_key(const Bytes& seed) {
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(),
                                              seed.size()));
    if (!pkey) openssl_fail("EVP_PKEY_new_raw_private_key(ED25519)");
    return pkey;
}

}  // namespace

// =============================================================================
// Keccak-256
// =============================================================================

namespace {

// Legacy Keccak padding (0x01), not the NIST SHA3 one; provided by OpenSSL 3.2+
const EVP_MD* keccak256_md() {
    static const MdPtr md(EVP_MD_fetch(nullptr, "KECCAK-256", nullptr));
    if (!md) openssl_fail("EVP_MD_fetch(KECCAK-256)");
    return md.get();
}

}  // namespace

Hash256 keccak256(const uint8_t* data, size_t size) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    Hash256 out{};
    unsigned int len = 0;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), keccak256_md(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
        openssl_fail("EVP_Digest(KECCAK-256)");
    }
    return out;
}

Hash256 keccak256(std::string_view text) {
    return keccak256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// =============================================================================
// secp256k1
// =============================================================================

Secp256k1PrivateKey::Secp256k1PrivateKey(std::string_view hex_key)
    : secret_(hex::decode(hex_key)) {
    if (secret_.size() != 32) {
        throw EngineError("secp256k1 private key must be 32 bytes");
    }
    BigInt k = hex::bytes_to_bigint(secret_.data(), secret_.size());
    if (k.is_zero() || k >= secp256k1_order()) {
        throw EngineError("secp256k1 private key out of range");
    }

    BnCtxPtr ctx(BN_CTX_new());
    GroupPtr group = secp256k1_group();
    BnPtr priv = to_bn(k);
    PointPtr pub(EC_POINT_new(group.get()));
    if (!ctx || !pub ||
        EC_POINT_mul(group.get(), pub.get(), priv.get(), nullptr, nullptr, ctx.get()) != 1) {
        openssl_fail("EC_POINT_mul");
    }
    public_key_ = encode_point(group.get(), pub.get(), ctx.get());
}

RecoverableSignature Secp256k1PrivateKey::sign_digest(const Hash256& digest) const {
    PkeyPtr pkey = make_ec_keypair(secret_, public_key_);
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_sign_init(ctx.get()) <= 0) {
        openssl_fail("EVP_PKEY_sign_init");
    }

    size_t der_len = 0;
    if (EVP_PKEY_sign(ctx.get(), nullptr, &der_len, digest.data(), digest.size()) <= 0) {
        openssl_fail("EVP_PKEY_sign");
    }
    Bytes der(der_len);
    if (EVP_PKEY_sign(ctx.get(), der.data(), &der_len, digest.data(), digest.size()) <= 0) {
        openssl_fail("EVP_PKEY_sign");
    }

    const unsigned char* p = der.data();
    SigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_len)));
    if (!sig) openssl_fail("d2i_ECDSA_SIG");
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    RecoverableSignature out;
    out.r = from_bn(r);
    out.s = from_bn(s);
    const BigInt& n = secp256k1_order();
    if (out.s > n / 2) {
        out.s = n - out.s;
    }

    for (uint8_t id = 0; id < 2; ++id) {
        out.recovery_id = id;
        if (recover_public_key(digest, out) == public_key_) {
            return out;
        }
    }
    throw EngineError("Unable to derive signature recovery id");
}

Bytes recover_public_key(const Hash256& digest, const RecoverableSignature& signature) {
    const BigInt& n = secp256k1_order();
    if (signature.r.is_zero() || signature.s.is_zero() || signature.r >= n ||
        signature.s >= n) {
        throw DecodeError("Signature scalar out of range");
    }

    BnCtxPtr ctx(BN_CTX_new());
    GroupPtr group = secp256k1_group();
    const BIGNUM* order = EC_GROUP_get0_order(group.get());
    BnPtr r = to_bn(signature.r);
    BnPtr s = to_bn(signature.s);

    // R = (r, y) with y parity from the recovery id
    PointPtr R(EC_POINT_new(group.get()));
    if (!ctx || !R ||
        EC_POINT_set_compressed_coordinates(group.get(), R.get(), r.get(),
                                            signature.recovery_id & 1, ctx.get()) != 1) {
        throw DecodeError("Signature r is not a curve point");
    }

    // Q = r^-1 (sR - eG)
    BnPtr e(BN_bin2bn(digest.data(), static_cast<int>(digest.size()), nullptr));
    BnPtr r_inv(BN_mod_inverse(nullptr, r.get(), order, ctx.get()));
    BnPtr u1(BN_new());
    BnPtr u2(BN_new());
    if (!e || !r_inv || !u1 || !u2) openssl_fail("BN_mod_inverse");
    if (BN_mod_mul(u1.get(), e.get(), r_inv.get(), order, ctx.get()) != 1 ||
        BN_mod_mul(u2.get(), s.get(), r_inv.get(), order, ctx.get()) != 1) {
        openssl_fail("BN_mod_mul");
    }
    if (!BN_is_zero(u1.get()) && BN_sub(u1.get(), order, u1.get()) != 1) {
        openssl_fail("BN_sub");
    }

    PointPtr Q(EC_POINT_new(group.get()));
    if (!Q || EC_POINT_mul(group.get(), Q.get(), u1.get(), R.get(), u2.get(), ctx.get()) != 1) {
        openssl_fail("EC_POINT_mul");
    }
    return encode_point(group.get(), Q.get(), ctx.get());
}

std::string address_from_public_key(const Bytes& uncompressed_public_key) {
    if (uncompressed_public_key.size() != 65 || uncompressed_public_key[0] != 0x04) {
        throw DecodeError("Expected a 65-byte uncompressed public key");
    }
    Hash256 hash = keccak256(uncompressed_public_key.data() + 1, 64);
    return hex::encode(hash.data() + 12, 20);
}

bool is_hex_address(std::string_view address) {
    if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
        return false;
    }
    for (size_t i = 2; i < address.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(address[i]))) return false;
    }
    return true;
}

std::string to_checksum_address(std::string_view address) {
    if (!is_hex_address(address)) {
        throw InvalidAddress(std::string(address));
    }
    std::string lower = normalize_address(address).substr(2);
    Hash256 hash = keccak256(lower);

    std::string out = "0x";
    for (size_t i = 0; i < lower.size(); ++i) {
        char c = lower[i];
        uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0f);
        if (std::isalpha(static_cast<unsigned char>(c)) && nibble >= 8) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        out.push_back(c);
    }
    return out;
}

// =============================================================================
// Ed25519
// =============================================================================

Ed25519Keypair Ed25519Keypair::from_seed(const Bytes& seed) {
    if (seed.size() != 32) {
        throw EngineError("Ed25519 seed must be 32 bytes");
    }
    PkeyPtr pkey = make_ed25519_key(seed);
    Bytes public_key(32);
    size_t len = public_key.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &len) != 1 || len != 32) {
        openssl_fail("EVP_PKEY_get_raw_public_key");
    }
    return Ed25519Keypair(seed, std::move(public_key));
}

Ed25519Keypair Ed25519Keypair::from_base58(std::string_view secret) {
    Bytes raw = base58::decode(secret);
    if (raw.size() == 32) {
        return from_seed(raw);
    }
    if (raw.size() != 64) {
        throw EngineError("Solana secret key must be 32 or 64 bytes");
    }
    Ed25519Keypair keypair = from_seed(Bytes(raw.begin(), raw.begin() + 32));
    if (keypair.public_key_ != Bytes(raw.begin() + 32, raw.end())) {
        throw EngineError("Solana secret key does not match its public key");
    }
    return keypair;
}

std::string Ed25519Keypair::public_key_base58() const {
    return base58::encode(public_key_);
}

Bytes Ed25519Keypair::sign(const Bytes& message) const {
    PkeyPtr pkey = make_ed25519_key(seed_);
    MdCtxPtr md(EVP_MD_CTX_new());
    if (!md || EVP_DigestSignInit(md.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        openssl_fail("EVP_DigestSignInit(ED25519)");
    }
    Bytes signature(64);
    size_t len = signature.size();
    if (EVP_DigestSign(md.get(), signature.data(), &len, message.data(), message.size()) != 1 ||
        len != 64) {
        openssl_fail("EVP_DigestSign(ED25519)");
    }
    return signature;
}

}  // namespace chainswap::crypto
