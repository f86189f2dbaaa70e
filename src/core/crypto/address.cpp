#include "siweauth/core/crypto/address.hpp"
#include "siweauth/core/crypto/keccak.hpp"
#include "siweauth/core/util/hex.hpp"
#include <cctype>
#include <stdexcept>

namespace siweauth::crypto {

    bool isHexAddress(std::string_view addr) noexcept {
        if (addr.size() != 42 || addr[0] != '0' || (addr[1] != 'x' && addr[1] != 'X'))
            return false;
        return isHex(addr.substr(2));
    }

    std::string normalizeAddress(std::string_view addr) {
        if (!isHexAddress(addr))
            throw std::invalid_argument("not an Ethereum address: " + std::string(addr));
        std::string out = "0x";
        for (char c : addr.substr(2))
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        return out;
    }

    std::string toChecksumAddress(std::string_view addr) {
        auto lower = normalizeAddress(addr);
        auto hash = keccak256(std::string_view(lower).substr(2));
        std::string out = "0x";
        for (std::size_t i = 0; i < 40; ++i) {
            char c = lower[i + 2];
            std::uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0F);
            if (c >= 'a' && c <= 'f' && nibble >= 8)
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            out.push_back(c);
        }
        return out;
    }

    bool hasValidChecksum(std::string_view addr) {
        if (!isHexAddress(addr)) return false;
        auto body = addr.substr(2);
        bool hasLower = false, hasUpper = false;
        for (char c : body) {
            if (c >= 'a' && c <= 'f') hasLower = true;
            if (c >= 'A' && c <= 'F') hasUpper = true;
        }
        if (!hasLower || !hasUpper) return true;
        return toChecksumAddress(addr).substr(2) == body;
    }

    std::string addressFromPublicKey(const std::array<std::uint8_t, 64>& pubkey) {
        auto hash = keccak256(pubkey.data(), pubkey.size());
        return "0x" + toHex(hash.data() + 12, 20);
    }

}
