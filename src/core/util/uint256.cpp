#include "siweauth/core/util/uint256.hpp"
#include "siweauth/core/util/hex.hpp"
#include <algorithm>
#include <stdexcept>

namespace siweauth {

    Uint256::Uint256(std::uint64_t v) {
        for (int i = 31; i >= 24; --i) {
            bytes_[i] = static_cast<std::uint8_t>(v & 0xFF);
            v >>= 8;
        }
    }

    Uint256 Uint256::fromBytes(const std::uint8_t* data, std::size_t len) {
        if (len > 32)
            throw std::invalid_argument("Uint256: more than 32 bytes");
        Uint256 r;
        std::copy(data, data + len, r.bytes_.begin() + (32 - len));
        return r;
    }

    Uint256 Uint256::fromHex(std::string_view text) {
        auto digits = strip0x(text);
        if (digits.empty() || digits.size() > 64 || !isHex(digits))
            throw std::invalid_argument("Uint256: invalid hex '" + std::string(text) + "'");
        std::string padded(digits.size() % 2, '0');
        padded.append(digits);
        return fromBytes(siweauth::fromHex(padded));
    }

    Uint256 Uint256::fromDecimal(std::string_view text) {
        if (text.empty())
            throw std::invalid_argument("Uint256: empty decimal");
        Uint256 r;
        for (char c : text) {
            if (c < '0' || c > '9')
                throw std::invalid_argument("Uint256: invalid decimal '" + std::string(text) + "'");
            // r = r * 10 + digit
            unsigned carry = static_cast<unsigned>(c - '0');
            for (int i = 31; i >= 0; --i) {
                unsigned v = r.bytes_[i] * 10u + carry;
                r.bytes_[i] = static_cast<std::uint8_t>(v & 0xFF);
                carry = v >> 8;
            }
            if (carry != 0)
                throw std::invalid_argument("Uint256: decimal overflow");
        }
        return r;
    }

    Uint256 Uint256::parse(std::string_view text) {
        if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
            return fromHex(text);
        return fromDecimal(text);
    }

    bool Uint256::isZero() const noexcept {
        return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
    }

    std::string Uint256::toHex() const {
        auto hex = siweauth::toHex(bytes_);
        auto first = hex.find_first_not_of('0');
        if (first == std::string::npos) return "0x0";
        return "0x" + hex.substr(first);
    }

    std::string Uint256::toDecimal() const {
        if (isZero()) return "0";
        Bytes work = bytes_;
        std::string out;
        bool nonZero = true;
        while (nonZero) {
            // work /= 10, collecting the remainder
            unsigned rem = 0;
            nonZero = false;
            for (auto& b : work) {
                unsigned cur = (rem << 8) | b;
                b = static_cast<std::uint8_t>(cur / 10);
                rem = cur % 10;
                if (b != 0) nonZero = true;
            }
            out.push_back(static_cast<char>('0' + rem));
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

}
