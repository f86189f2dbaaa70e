/**
 * @file random.hpp
 * @brief Random token utilities for siweauth.
 *
 * Nonces and session identifiers must be unguessable, so bytes come from the
 * OpenSSL CSPRNG rather than a seeded PRNG.
 */
#pragma once
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <openssl/rand.h>
#include "siweauth/core/util/hex.hpp"

namespace siweauth {

    /**
     * @brief Fill a byte array with cryptographically strong random data.
     *
     * @param tok Array to fill
     * @throws std::runtime_error if the OpenSSL generator is not seeded
     */
    template<std::size_t N>
    void randomFill(std::array<std::uint8_t, N>& tok)
    {
        if (RAND_bytes(tok.data(), static_cast<int>(N)) != 1)
            throw std::runtime_error("RAND_bytes failed");
    }

    /**
     * @brief Generate N random bytes and return them hex encoded (2*N characters).
     */
    template<std::size_t N>
    std::string randomHexToken()
    {
        std::array<std::uint8_t, N> buf{};
        randomFill(buf);
        return toHex(buf);
    }

}
