/**
 * @file uint256.hpp
 * @brief Fixed-width 256-bit unsigned integer for on-chain quantities.
 *
 * Token balances, token ids and ABI words are uint256 on chain. Only the
 * operations the membership checks need are provided: construction from
 * decimal/hex text and raw words, comparison and formatting.
 */
#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace siweauth {

    /**
     * @class Uint256
     * @brief Big-endian 32-byte unsigned integer.
     *
     * Storage is big-endian so lexicographic byte comparison is numeric comparison.
     */
    class Uint256 {
    public:
        using Bytes = std::array<std::uint8_t, 32>;

        constexpr Uint256() = default;
        explicit Uint256(std::uint64_t v);

        /**
         * @brief Build from up to 32 big-endian bytes (left padded with zeros).
         * @throws std::invalid_argument if more than 32 bytes are given
         */
        static Uint256 fromBytes(const std::uint8_t* data, std::size_t len);
        static Uint256 fromBytes(const std::vector<std::uint8_t>& b) { return fromBytes(b.data(), b.size()); }

        /**
         * @brief Parse "0x"-prefixed hex (1..64 digits) or plain decimal text.
         * @throws std::invalid_argument on malformed text or overflow
         */
        static Uint256 parse(std::string_view text);
        static Uint256 fromDecimal(std::string_view text);
        static Uint256 fromHex(std::string_view text);

        bool isZero() const noexcept;
        const Bytes& bytes() const noexcept { return bytes_; }

        /// Lowercase hex without leading zeros, "0x" prefixed ("0x0" for zero).
        std::string toHex() const;
        std::string toDecimal() const;

        auto operator<=>(const Uint256&) const = default;
        bool operator==(const Uint256&) const = default;

    private:
        Bytes bytes_{};
    };

}
