/**
 * @file ecdsa.hpp
 * @brief secp256k1 recoverable signatures with Ethereum conventions.
 *
 * Signatures are 65 bytes: r (32) || s (32) || v (1), where v is the recovery
 * id either raw (0/1) or offset by 27 (27/28) as produced by personal_sign.
 */
#pragma once
#include "siweauth/core/crypto/keccak.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace siweauth::crypto {

    using PrivateKey = std::array<std::uint8_t, 32>;

    /**
     * @brief EIP-191 personal message digest:
     * keccak256("\x19Ethereum Signed Message:\n" + len(message) + message).
     */
    Hash256 personalMessageHash(std::string_view message);

    /**
     * @brief Recover the signer address of a digest.
     *
     * @param digest 32-byte message digest
     * @param signature 65-byte r||s||v signature
     * @return Lowercase "0x" address, or std::nullopt if the signature is
     *         malformed or no public key can be recovered
     */
    std::optional<std::string> recoverAddress(const Hash256& digest,
                                              const std::vector<std::uint8_t>& signature);

    /**
     * @brief Sign a digest, returning r||s||v with v in {27, 28}.
     * @throws std::invalid_argument if the private key is out of range
     */
    std::vector<std::uint8_t> signDigest(const Hash256& digest, const PrivateKey& key);

    /**
     * @brief personal_sign equivalent: sign personalMessageHash(message).
     */
    std::vector<std::uint8_t> signPersonalMessage(std::string_view message, const PrivateKey& key);

    /**
     * @brief Lowercase "0x" address controlled by a private key.
     * @throws std::invalid_argument if the private key is out of range
     */
    std::string addressFromPrivateKey(const PrivateKey& key);

}
