#include "siweauth/core/chain/abi.hpp"
#include "siweauth/core/crypto/address.hpp"
#include "siweauth/core/crypto/keccak.hpp"
#include "siweauth/core/util/hex.hpp"
#include <stdexcept>

namespace siweauth::abi {

    namespace {

        constexpr std::size_t kWord = 32;

        void appendWord(std::vector<std::uint8_t>& out, const Uint256& w) {
            out.insert(out.end(), w.bytes().begin(), w.bytes().end());
        }

        void appendPadded(std::vector<std::uint8_t>& out, const std::string& s) {
            out.insert(out.end(), s.begin(), s.end());
            std::size_t pad = (kWord - s.size() % kWord) % kWord;
            out.insert(out.end(), pad, 0);
        }

        std::uint64_t wordToSize(const std::vector<std::uint8_t>& ret, std::size_t offset) {
            if (offset + kWord > ret.size())
                throw std::invalid_argument("abi: truncated return data");
            auto w = Uint256::fromBytes(ret.data() + offset, kWord);
            // anything that does not fit in 8 bytes cannot be a valid offset/length
            for (std::size_t i = 0; i < 24; ++i)
                if (w.bytes()[i] != 0)
                    throw std::invalid_argument("abi: offset or length out of range");
            std::uint64_t v = 0;
            for (std::size_t i = 24; i < 32; ++i) v = (v << 8) | w.bytes()[i];
            return v;
        }

    }

    Uint256 address(std::string_view addr) {
        auto lower = crypto::normalizeAddress(addr);
        return Uint256::fromBytes(fromHex(lower));
    }

    std::array<std::uint8_t, 4> selector(std::string_view signature) {
        auto h = crypto::keccak256(signature);
        return { h[0], h[1], h[2], h[3] };
    }

    std::vector<std::uint8_t> encodeCall(std::string_view signature, const std::vector<Value>& args)
    {
        auto sel = selector(signature);
        std::vector<std::uint8_t> head(sel.begin(), sel.end());
        std::vector<std::uint8_t> tail;
        const std::size_t headSize = args.size() * kWord;

        for (const auto& arg : args) {
            if (const auto* word = std::get_if<Uint256>(&arg)) {
                appendWord(head, *word);
            }
            else {
                const auto& str = std::get<std::string>(arg);
                appendWord(head, Uint256(static_cast<std::uint64_t>(headSize + tail.size())));
                appendWord(tail, Uint256(static_cast<std::uint64_t>(str.size())));
                appendPadded(tail, str);
            }
        }
        head.insert(head.end(), tail.begin(), tail.end());
        return head;
    }

    Uint256 decodeUint(const std::vector<std::uint8_t>& ret) {
        if (ret.size() < kWord)
            throw std::invalid_argument("abi: expected a 32-byte word, got " + std::to_string(ret.size()) + " bytes");
        return Uint256::fromBytes(ret.data(), kWord);
    }

    std::string decodeAddress(const std::vector<std::uint8_t>& ret) {
        if (ret.size() < kWord)
            throw std::invalid_argument("abi: expected a 32-byte word, got " + std::to_string(ret.size()) + " bytes");
        return "0x" + toHex(ret.data() + 12, 20);
    }

    std::string decodeString(const std::vector<std::uint8_t>& ret) {
        auto offset = wordToSize(ret, 0);
        auto len = wordToSize(ret, static_cast<std::size_t>(offset));
        std::size_t start = static_cast<std::size_t>(offset) + kWord;
        if (len > ret.size() || start + len > ret.size())
            throw std::invalid_argument("abi: string exceeds return data");
        return std::string(ret.begin() + start, ret.begin() + start + static_cast<std::size_t>(len));
    }

}
