/**
 * @file hex.hpp
 * @brief Hexadecimal encoding and decoding utilities for siweauth.
 *
 * Ethereum data (addresses, signatures, calldata) travels as "0x"-prefixed hex.
 * These helpers convert between such strings and raw byte buffers.
 */
#pragma once
#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace siweauth {

    namespace detail {
        inline int hexNibble(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    }

    /**
     * @brief Remove a leading "0x"/"0X" if present.
     */
    inline std::string_view strip0x(std::string_view hex) noexcept {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
            hex.remove_prefix(2);
        return hex;
    }

    /**
     * @brief Check that a string (optionally 0x-prefixed) contains only hex digits.
     */
    inline bool isHex(std::string_view hex) noexcept {
        hex = strip0x(hex);
        for (char c : hex)
            if (detail::hexNibble(c) < 0) return false;
        return true;
    }

    /**
     * @brief Encode a byte buffer as lowercase hex without prefix.
     */
    inline std::string toHex(const std::uint8_t* data, std::size_t len)
    {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (std::size_t i = 0; i < len; ++i) {
            out.push_back(digits[data[i] >> 4]);
            out.push_back(digits[data[i] & 0x0F]);
        }
        return out;
    }

    inline std::string toHex(const std::vector<std::uint8_t>& buf) {
        return toHex(buf.data(), buf.size());
    }

    template<std::size_t N>
    std::string toHex(const std::array<std::uint8_t, N>& buf) {
        return toHex(buf.data(), N);
    }

    /**
     * @brief Encode a byte buffer as "0x"-prefixed lowercase hex.
     */
    inline std::string toHex0x(const std::vector<std::uint8_t>& buf) {
        return "0x" + toHex(buf);
    }

    /**
     * @brief Decode a hex string (optionally 0x-prefixed) into bytes.
     *
     * @param hex Hex string with an even number of digits
     * @return Decoded bytes
     * @throws std::invalid_argument on odd length or non-hex characters
     */
    inline std::vector<std::uint8_t> fromHex(std::string_view hex)
    {
        hex = strip0x(hex);
        if (hex.size() % 2 != 0)
            throw std::invalid_argument("fromHex: odd number of digits");
        std::vector<std::uint8_t> out;
        out.reserve(hex.size() / 2);
        for (std::size_t i = 0; i < hex.size(); i += 2) {
            int hi = detail::hexNibble(hex[i]);
            int lo = detail::hexNibble(hex[i + 1]);
            if (hi < 0 || lo < 0)
                throw std::invalid_argument("fromHex: invalid hex digit");
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
        return out;
    }

    /**
     * @brief Decode a hex string into a fixed-size array.
     * @throws std::invalid_argument if the decoded length is not exactly N
     */
    template<std::size_t N>
    void fromHex(std::string_view hex, std::array<std::uint8_t, N>& out)
    {
        auto bytes = fromHex(hex);
        if (bytes.size() != N)
            throw std::invalid_argument("fromHex: length != " + std::to_string(N));
        std::copy(bytes.begin(), bytes.end(), out.begin());
    }

}
