/**
 * @file abi.hpp
 * @brief Minimal Solidity ABI codec for read-only contract calls.
 *
 * Supports what balance checks and ENS lookups need: static 32-byte words
 * (uint256, address, bytes32) and dynamic `string` arguments, plus decoding of
 * uint256, address and string return values.
 */
#pragma once
#include "siweauth/core/util/uint256.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace siweauth::abi {

    /**
     * @brief A call argument: a static word (uint256/address/bytes32) or a
     * dynamic ABI `string`.
     */
    using Value = std::variant<Uint256, std::string>;

    /**
     * @brief Address argument (20 bytes, left padded).
     * @throws std::invalid_argument if the text is not a hex address
     */
    Uint256 address(std::string_view addr);

    /**
     * @brief First four bytes of keccak256 of a canonical signature such as
     * "balanceOf(address,uint256)".
     */
    std::array<std::uint8_t, 4> selector(std::string_view signature);

    /**
     * @brief Selector followed by the head/tail encoded arguments.
     */
    std::vector<std::uint8_t> encodeCall(std::string_view signature, const std::vector<Value>& args);

    /**
     * @brief Decode the first return word as uint256.
     * @throws std::invalid_argument if fewer than 32 bytes are returned
     */
    Uint256 decodeUint(const std::vector<std::uint8_t>& ret);

    /**
     * @brief Decode the first return word as an address (lowercase "0x").
     */
    std::string decodeAddress(const std::vector<std::uint8_t>& ret);

    /**
     * @brief Decode a single dynamic `string` return value.
     * @throws std::invalid_argument on truncated or inconsistent data
     */
    std::string decodeString(const std::vector<std::uint8_t>& ret);

}
