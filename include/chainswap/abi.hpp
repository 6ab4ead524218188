// Chainswap - Solidity ABI
// Call-data encoding and return-data decoding for the contracts the engine talks to

#pragma once

#include <chainswap/types.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chainswap::abi {

// Four-byte function selectors (keccak of the canonical signature)
namespace selector {

// ERC-20
inline constexpr std::string_view BALANCE_OF = "70a08231";    // balanceOf(address)
inline constexpr std::string_view DECIMALS = "313ce567";      // decimals()
inline constexpr std::string_view SYMBOL = "95d89b41";        // symbol()
inline constexpr std::string_view APPROVE = "095ea7b3";       // approve(address,uint256)
inline constexpr std::string_view ALLOWANCE = "dd62ed3e";     // allowance(address,address)

// Uniswap V2
inline constexpr std::string_view GET_PAIR = "e6a43905";      // getPair(address,address)
inline constexpr std::string_view GET_RESERVES = "0902f1ac";  // getReserves()
// swapExactTokensForTokens(uint256,uint256,address[],address,uint256)
inline constexpr std::string_view SWAP_EXACT_TOKENS_FOR_TOKENS = "38ed1739";

// Uniswap V3
inline constexpr std::string_view GET_POOL = "1698ee82";      // getPool(address,address,uint24)
inline constexpr std::string_view SLOT0 = "3850c7bd";         // slot0()
inline constexpr std::string_view LIQUIDITY = "1a686502";     // liquidity()
// SwapRouter: exactInputSingle((address,address,uint24,address,uint256,uint256,uint256,uint160))
inline constexpr std::string_view EXACT_INPUT_SINGLE = "414bf389";
// SwapRouter02: exactInputSingle((address,address,uint24,address,uint256,uint256,uint160))
inline constexpr std::string_view EXACT_INPUT_SINGLE_02 = "04e45aaf";
// SwapRouter02: multicall(uint256,bytes[])
inline constexpr std::string_view MULTICALL_WITH_DEADLINE = "5ae401dc";

// Revert payloads
inline constexpr std::string_view ERROR_STRING = "08c379a0";  // Error(string)
inline constexpr std::string_view PANIC = "4e487b71";         // Panic(uint256)

}  // namespace selector

// keccak("Transfer(address,address,uint256)")
inline constexpr std::string_view TRANSFER_EVENT_TOPIC =
    "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";

inline constexpr std::string_view ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";

// Builds call data: selector followed by head/tail encoded arguments
class Encoder {
public:
    Encoder() = default;
    explicit Encoder(std::string_view selector_hex);

    Encoder& add_uint(const BigInt& value);
    Encoder& add_address(std::string_view address);
    Encoder& add_address_array(const std::vector<std::string>& addresses);
    Encoder& add_bytes(const Bytes& data);
    Encoder& add_bytes_array(const std::vector<Bytes>& items);

    [[nodiscard]] Bytes build() const;

private:
    struct Slot {
        Bytes encoded;
        bool dynamic = false;
    };

    Bytes selector_;
    std::vector<Slot> slots_;
};

// Reads 32-byte words out of return data
class Decoder {
public:
    explicit Decoder(Bytes data) : data_(std::move(data)) {}

    [[nodiscard]] size_t word_count() const noexcept { return data_.size() / 32; }
    [[nodiscard]] const Bytes& data() const noexcept { return data_; }

    [[nodiscard]] Bytes word(size_t index) const;
    [[nodiscard]] BigInt uint_at(size_t index) const;
    [[nodiscard]] std::string address_at(size_t index) const;
    // Dynamic string whose offset is stored in word `index`
    [[nodiscard]] std::string string_at(size_t index) const;

private:
    Bytes data_;
};

// Error(string) and Panic(uint256) payloads; nullopt for anything else
std::optional<std::string> decode_revert_reason(const Bytes& data);

// Indexed address topic (32-byte word) to a lowercase 0x address
std::string topic_to_address(std::string_view topic);

}  // namespace chainswap::abi
