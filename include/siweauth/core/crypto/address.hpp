/**
 * @file address.hpp
 * @brief Ethereum address helpers: format validation, normalization and EIP-55 checksums.
 */
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace siweauth::crypto {

    /**
     * @brief True for "0x" followed by exactly 40 hex digits (any case).
     */
    bool isHexAddress(std::string_view addr) noexcept;

    /**
     * @brief True if the address is all-lowercase, all-uppercase, or a
     * mixed-case address whose casing matches its EIP-55 checksum.
     */
    bool hasValidChecksum(std::string_view addr);

    /**
     * @brief Lowercase "0x" form of an address. Used as the wallet identity key.
     * @throws std::invalid_argument if the text is not a hex address
     */
    std::string normalizeAddress(std::string_view addr);

    /**
     * @brief EIP-55 mixed-case checksum form of an address.
     * @throws std::invalid_argument if the text is not a hex address
     */
    std::string toChecksumAddress(std::string_view addr);

    /**
     * @brief Address of a public key: last 20 bytes of keccak256(X || Y).
     * @param pubkey 64-byte uncompressed public key without the 0x04 prefix
     * @return Lowercase "0x" address
     */
    std::string addressFromPublicKey(const std::array<std::uint8_t, 64>& pubkey);

}
