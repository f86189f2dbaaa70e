#include "siweauth/core/crypto/keccak.hpp"
#include <cstring>

namespace siweauth::crypto {

    namespace {

        constexpr std::uint64_t kRoundConstants[24] = {
            0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
            0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
            0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
            0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
            0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
            0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
            0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
            0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
        };

        constexpr int kRotation[25] = {
             0,  1, 62, 28, 27,
            36, 44,  6, 55, 20,
             3, 10, 43, 25, 39,
            41, 45, 15, 21,  8,
            18,  2, 61, 56, 14,
        };

        constexpr std::size_t kRate = 136;   // 1088-bit rate for a 256-bit digest

        inline std::uint64_t rotl(std::uint64_t v, int n) {
            return n == 0 ? v : (v << n) | (v >> (64 - n));
        }

        void keccakF1600(std::uint64_t a[25]) {
            for (int round = 0; round < 24; ++round) {
                // theta
                std::uint64_t c[5], d[5];
                for (int x = 0; x < 5; ++x)
                    c[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
                for (int x = 0; x < 5; ++x)
                    d[x] = c[(x + 4) % 5] ^ rotl(c[(x + 1) % 5], 1);
                for (int i = 0; i < 25; ++i)
                    a[i] ^= d[i % 5];

                // rho + pi
                std::uint64_t b[25];
                for (int x = 0; x < 5; ++x)
                    for (int y = 0; y < 5; ++y)
                        b[y + 5 * ((2 * x + 3 * y) % 5)] = rotl(a[x + 5 * y], kRotation[x + 5 * y]);

                // chi
                for (int x = 0; x < 5; ++x)
                    for (int y = 0; y < 5; ++y)
                        a[x + 5 * y] = b[x + 5 * y] ^ (~b[(x + 1) % 5 + 5 * y] & b[(x + 2) % 5 + 5 * y]);

                // iota
                a[0] ^= kRoundConstants[round];
            }
        }

        inline std::uint64_t load64le(const std::uint8_t* p) {
            std::uint64_t v = 0;
            for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
            return v;
        }

        void absorbBlock(std::uint64_t state[25], const std::uint8_t* block) {
            for (std::size_t i = 0; i < kRate / 8; ++i)
                state[i] ^= load64le(block + 8 * i);
            keccakF1600(state);
        }

    }

    Hash256 keccak256(const std::uint8_t* data, std::size_t len)
    {
        std::uint64_t state[25] = {};

        while (len >= kRate) {
            absorbBlock(state, data);
            data += kRate;
            len -= kRate;
        }

        std::uint8_t last[kRate] = {};
        if (len > 0) std::memcpy(last, data, len);
        last[len] ^= 0x01;
        last[kRate - 1] ^= 0x80;
        absorbBlock(state, last);

        Hash256 out{};
        for (std::size_t i = 0; i < out.size(); ++i)
            out[i] = static_cast<std::uint8_t>(state[i / 8] >> (8 * (i % 8)));
        return out;
    }

}
