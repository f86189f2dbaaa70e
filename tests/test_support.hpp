#pragma once
// Shared fixtures for the siweauth tests: deterministic keys, a scriptable
// chain provider and a SIWE message builder.

#include "siweauth/core/chain/abi.hpp"
#include "siweauth/core/crypto/ecdsa.hpp"
#include "siweauth/core/interfaces/ichain_provider.hpp"
#include "siweauth/core/interfaces/iens_resolver.hpp"
#include "siweauth/core/siwe/siwe_message.hpp"
#include "siweauth/core/util/error_types.hpp"
#include "siweauth/core/util/hex.hpp"
#include "siweauth/core/util/time.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace siweauth::test {

    // Private key 1 and 2 with their well known addresses.
    inline crypto::PrivateKey keyOne() {
        crypto::PrivateKey k{};
        k[31] = 1;
        return k;
    }

    inline crypto::PrivateKey keyTwo() {
        crypto::PrivateKey k{};
        k[31] = 2;
        return k;
    }

    inline const std::string kAddrOne = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf";
    inline const std::string kAddrOneChecksum = "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf";
    inline const std::string kAddrTwo = "0x2b5ad5c4795c026514f8317c7a215e218dccd6cf";

    inline const std::string kDomain = "example.com";
    inline const std::string kUri = "https://example.com/login";

    // 2024-01-01T00:00:00Z
    constexpr std::uint64_t kT0 = 1'704'067'200'000ull;

    inline SiweMessage makeMessage(const std::string& address, const std::string& nonce,
                                   std::uint64_t issuedMs = kT0)
    {
        SiweMessage m;
        m.domain = kDomain;
        m.address = address;
        m.statement = "Sign in to Example.";
        m.uri = kUri;
        m.version = "1";
        m.chainId = 1;
        m.nonce = nonce;
        m.issuedAt = formatRfc3339(static_cast<std::int64_t>(issuedMs));
        return m;
    }

    inline std::string sign(const SiweMessage& m, const crypto::PrivateKey& key) {
        return toHex0x(crypto::signPersonalMessage(m.toString(), key));
    }

    /**
     * Chain provider answering from a table keyed by (contract, calldata).
     * Can be switched off to simulate an unreachable node, or slowed down.
     */
    class MockChainProvider : public IChainProvider {
    public:
        void setResponse(const std::string& contract, const std::string& method,
                         const std::vector<abi::Value>& args, std::vector<std::uint8_t> ret)
        {
            std::scoped_lock lk(mx_);
            table_[key(contract, abi::encodeCall(method, args))] = std::move(ret);
        }

        void setBalance(const std::string& contract, const std::string& owner, std::uint64_t balance) {
            setResponse(contract, "balanceOf(address)", { abi::address(owner) },
                toBytes(Uint256(balance)));
        }

        void setBalance1155(const std::string& contract, const std::string& owner,
                            std::uint64_t tokenId, std::uint64_t balance) {
            setResponse(contract, "balanceOf(address,uint256)", { abi::address(owner), Uint256(tokenId) },
                toBytes(Uint256(balance)));
        }

        void setDown(bool down) { down_ = down; }
        void setDelay(std::chrono::milliseconds d) { delayMs_ = d.count(); }
        std::size_t calls() const { return calls_; }

        std::vector<std::uint8_t> call(const std::string& contract, const std::string& method,
                                       const std::vector<abi::Value>& args) override
        {
            ++calls_;
            if (auto d = delayMs_.load(); d > 0)
                std::this_thread::sleep_for(std::chrono::milliseconds(d));
            if (down_)
                throw AuthError(AuthErr::ChainProviderUnavailable, "connection refused");

            std::scoped_lock lk(mx_);
            auto it = table_.find(key(lower(contract), abi::encodeCall(method, args)));
            if (it != table_.end()) return it->second;
            // unknown calls behave like a contract returning zero
            return std::vector<std::uint8_t>(32, 0);
        }

        static std::vector<std::uint8_t> toBytes(const Uint256& v) {
            return std::vector<std::uint8_t>(v.bytes().begin(), v.bytes().end());
        }

    private:
        static std::string lower(std::string s) {
            for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return s;
        }

        static std::string key(const std::string& contract, const std::vector<std::uint8_t>& data) {
            return lower(contract) + "|" + toHex(data);
        }

        std::mutex                                          mx_;
        std::map<std::string, std::vector<std::uint8_t>>    table_;
        std::atomic_bool                                    down_{ false };
        std::atomic<std::int64_t>                           delayMs_{ 0 };
        std::atomic_size_t                                  calls_{ 0 };
    };

    /// ENS resolver returning a fixed profile, or throwing when told to.
    class StaticEnsResolver : public IEnsResolver {
    public:
        std::optional<EnsProfile> profile;
        bool                      fail{ false };

        std::optional<EnsProfile> resolve(const std::string&) override {
            if (fail) throw AuthError(AuthErr::ChainProviderUnavailable, "ens down");
            return profile;
        }
    };

}
