/**
 * @file keccak.hpp
 * @brief Keccak-256 as used by Ethereum.
 *
 * This is the original Keccak submission (pad byte 0x01), not NIST SHA3-256
 * (pad byte 0x06), so OpenSSL's SHA3 digest cannot be used in its place.
 */
#pragma once
#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

namespace siweauth::crypto {

    using Hash256 = std::array<std::uint8_t, 32>;

    Hash256 keccak256(const std::uint8_t* data, std::size_t len);

    inline Hash256 keccak256(const std::vector<std::uint8_t>& data) {
        return keccak256(data.data(), data.size());
    }

    inline Hash256 keccak256(std::string_view text) {
        return keccak256(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }

}
