// Chainswap - Crypto Tests

#include <catch2/catch_test_macros.hpp>
#include <chainswap/abi.hpp>
#include <chainswap/crypto.hpp>
#include <chainswap/encoding.hpp>

using namespace chainswap;

namespace {

constexpr const char* PRIVATE_KEY_ONE =
    "0x0000000000000000000000000000000000000000000000000000000000000001";

std::string selector_of(std::string_view signature) {
    crypto::Hash256 h = crypto::keccak256(signature);
    return hex::encode(h.data(), 4, false);
}

}  // namespace

TEST_CASE("Keccak-256", "[crypto]") {
    SECTION("Empty input") {
        crypto::Hash256 h = crypto::keccak256(std::string_view(""));
        REQUIRE(hex::encode(h.data(), h.size(), false) ==
                "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
    }

    SECTION("Input longer than one rate block") {
        std::string text(200, 'a');
        crypto::Hash256 a = crypto::keccak256(text);
        crypto::Hash256 b = crypto::keccak256(Bytes(text.begin(), text.end()));
        REQUIRE(a == b);
        text[199] = 'b';
        REQUIRE(crypto::keccak256(text) != a);
    }

    SECTION("Function selectors") {
        REQUIRE(selector_of("transfer(address,uint256)") == "a9059cbb");
        REQUIRE(selector_of("balanceOf(address)") == abi::selector::BALANCE_OF);
        REQUIRE(selector_of("approve(address,uint256)") == abi::selector::APPROVE);
        REQUIRE(selector_of("getPair(address,address)") == abi::selector::GET_PAIR);
        REQUIRE(selector_of("getReserves()") == abi::selector::GET_RESERVES);
        REQUIRE(selector_of("getPool(address,address,uint24)") == abi::selector::GET_POOL);
        REQUIRE(selector_of("slot0()") == abi::selector::SLOT0);
        REQUIRE(selector_of("liquidity()") == abi::selector::LIQUIDITY);
        REQUIRE(selector_of("swapExactTokensForTokens(uint256,uint256,address[],address,uint256)") ==
                abi::selector::SWAP_EXACT_TOKENS_FOR_TOKENS);
        REQUIRE(selector_of("multicall(uint256,bytes[])") == abi::selector::MULTICALL_WITH_DEADLINE);
        REQUIRE(selector_of("Error(string)") == abi::selector::ERROR_STRING);
    }

    SECTION("Transfer event topic") {
        crypto::Hash256 h = crypto::keccak256(std::string_view("Transfer(address,address,uint256)"));
        REQUIRE(hex::encode(h.data(), h.size()) == abi::TRANSFER_EVENT_TOPIC);
    }
}

TEST_CASE("secp256k1 keys and signatures", "[crypto]") {
    crypto::Secp256k1PrivateKey key(PRIVATE_KEY_ONE);

    SECTION("Address of private key 1") {
        std::string address = crypto::address_from_public_key(key.public_key());
        REQUIRE(address == "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
        REQUIRE(crypto::to_checksum_address(address) ==
                "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
    }

    SECTION("Signature recovers the signing key") {
        crypto::Hash256 digest = crypto::keccak256(std::string_view("chainswap"));
        crypto::RecoverableSignature sig = key.sign_digest(digest);
        REQUIRE(sig.recovery_id <= 1);
        REQUIRE(crypto::recover_public_key(digest, sig) == key.public_key());
    }

    SECTION("Signatures are low-s") {
        BigInt half_order("0x7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0");
        for (const char* text : {"a", "b", "c", "d"}) {
            crypto::RecoverableSignature sig = key.sign_digest(crypto::keccak256(std::string_view(text)));
            REQUIRE(sig.s <= half_order);
        }
    }

    SECTION("Invalid keys") {
        REQUIRE_THROWS_AS(crypto::Secp256k1PrivateKey("0x01"), EngineError);
        REQUIRE_THROWS_AS(crypto::Secp256k1PrivateKey(std::string(64, '0')), EngineError);
    }

    SECTION("Out-of-range signature scalars") {
        crypto::RecoverableSignature sig;
        crypto::Hash256 digest{};
        REQUIRE_THROWS_AS(crypto::recover_public_key(digest, sig), DecodeError);
    }
}

TEST_CASE("EIP-55 checksums", "[crypto]") {
    REQUIRE(crypto::to_checksum_address("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed") ==
            "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    REQUIRE(crypto::to_checksum_address("0xFB6916095CA1DF60BB79CE92CE3EA74C37C5D359") ==
            "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359");
    REQUIRE(crypto::is_hex_address("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
    REQUIRE_FALSE(crypto::is_hex_address("5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
    REQUIRE_FALSE(crypto::is_hex_address("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeA"));
    REQUIRE_FALSE(crypto::is_hex_address("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeZ"));
    REQUIRE_THROWS_AS(crypto::to_checksum_address("not-an-address"), InvalidAddress);
}

TEST_CASE("Ed25519", "[crypto]") {
    // RFC 8032 section 7.1, test 1
    Bytes seed = hex::decode("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    Bytes expected_public =
        hex::decode("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");

    SECTION("Public key and signature match the reference vector") {
        crypto::Ed25519Keypair keypair = crypto::Ed25519Keypair::from_seed(seed);
        REQUIRE(keypair.public_key() == expected_public);
        REQUIRE(hex::encode(keypair.sign(Bytes{}), false) ==
                "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e"
                "39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
    }

    SECTION("64-byte base58 secrets carry their public key") {
        Bytes secret = seed;
        secret.insert(secret.end(), expected_public.begin(), expected_public.end());
        crypto::Ed25519Keypair keypair = crypto::Ed25519Keypair::from_base58(base58::encode(secret));
        REQUIRE(keypair.public_key_base58() == base58::encode(expected_public));

        secret.back() ^= 0x01;
        REQUIRE_THROWS_AS(crypto::Ed25519Keypair::from_base58(base58::encode(secret)), EngineError);
    }

    SECTION("Seed-only secrets") {
        crypto::Ed25519Keypair keypair = crypto::Ed25519Keypair::from_base58(base58::encode(seed));
        REQUIRE(keypair.public_key() == expected_public);
    }

    SECTION("Wrong length") {
        REQUIRE_THROWS_AS(crypto::Ed25519Keypair::from_seed(Bytes(31, 1)), EngineError);
    }
}
