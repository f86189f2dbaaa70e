#include <catch2/catch_all.hpp>
#include "siweauth/core/chain/ens_resolver.hpp"
#include "test_support.hpp"

using namespace siweauth;

namespace {

    const std::string kRegistry = "0x00000000000c2e074ec69a0dfb2997ba6c7d2e1e";
    const std::string kReverseResolver = "0xa2c122be93b0074270ebee7f6b7292c7deb45047";
    const std::string kPublicResolver = "0x231b0ee14048e9dccd1d247744d114a4eb5e8e63";

    Uint256 word(const crypto::Hash256& h) { return Uint256::fromBytes(h.data(), h.size()); }

    std::vector<std::uint8_t> addressRet(const std::string& addr) {
        return test::MockChainProvider::toBytes(abi::address(addr));
    }

    std::vector<std::uint8_t> stringRet(const std::string& s) {
        std::vector<std::uint8_t> out(64, 0);
        out[31] = 0x20;
        out[63] = static_cast<std::uint8_t>(s.size());
        out.insert(out.end(), s.begin(), s.end());
        out.resize(64 + (s.size() + 31) / 32 * 32, 0);
        return out;
    }

    /// Wires the registry and resolvers so that `addr` has primary name `name`.
    void setupName(test::MockChainProvider& chain, const std::string& addr, const std::string& name,
                   const std::string& forwardTo, const std::string& avatar = "")
    {
        auto reverse = namehash(addr.substr(2) + ".addr.reverse");
        chain.setResponse(kRegistry, "resolver(bytes32)", { word(reverse) }, addressRet(kReverseResolver));
        chain.setResponse(kReverseResolver, "name(bytes32)", { word(reverse) }, stringRet(name));

        auto node = namehash(name);
        chain.setResponse(kRegistry, "resolver(bytes32)", { word(node) }, addressRet(kPublicResolver));
        chain.setResponse(kPublicResolver, "addr(bytes32)", { word(node) }, addressRet(forwardTo));
        chain.setResponse(kPublicResolver, "text(bytes32,string)", { word(node), std::string("avatar") },
                          stringRet(avatar));
    }

}

TEST_CASE("namehash follows the ENS algorithm", "[ens]") {
    REQUIRE(toHex(namehash("")) == std::string(64, '0'));
    REQUIRE(toHex(namehash("eth")) ==
        "93cdeb708b7545dc668eb9280176169d1c33cfd8ed6f04690a0bcc88a93fc4ae");
    REQUIRE(toHex(namehash("foo.eth")) ==
        "de9b09fd7c5f901e23a3f19fecc54828e9c848539801e86591bd9801b019f84f");
}

TEST_CASE("a verified primary name and avatar are returned", "[ens]") {
    auto chain = std::make_shared<test::MockChainProvider>();
    setupName(*chain, test::kAddrOne, "alice.eth", test::kAddrOne, "https://img.example/a.png");

    EnsResolver ens(chain);
    auto p = ens.resolve(test::kAddrOneChecksum);
    REQUIRE(p);
    REQUIRE(p->name == "alice.eth");
    REQUIRE(p->avatar == "https://img.example/a.png");
}

TEST_CASE("a name without avatar has no avatar", "[ens]") {
    auto chain = std::make_shared<test::MockChainProvider>();
    setupName(*chain, test::kAddrOne, "alice.eth", test::kAddrOne);

    auto p = EnsResolver(chain).resolve(test::kAddrOne);
    REQUIRE(p);
    REQUIRE_FALSE(p->avatar);
}

TEST_CASE("a reverse record that does not resolve back is ignored", "[ens]") {
    auto chain = std::make_shared<test::MockChainProvider>();
    setupName(*chain, test::kAddrOne, "vitalik.eth", test::kAddrTwo);
    REQUIRE_FALSE(EnsResolver(chain).resolve(test::kAddrOne));
}

TEST_CASE("no reverse resolver means no profile", "[ens]") {
    auto chain = std::make_shared<test::MockChainProvider>();
    REQUIRE_FALSE(EnsResolver(chain).resolve(test::kAddrOne));
}

TEST_CASE("provider errors propagate to the caller", "[ens]") {
    auto chain = std::make_shared<test::MockChainProvider>();
    chain->setDown(true);
    REQUIRE_THROWS_AS(EnsResolver(chain).resolve(test::kAddrOne), AuthError);
}

TEST_CASE("EnsResolver construction is validated", "[ens]") {
    REQUIRE_THROWS_AS(EnsResolver(nullptr), AuthError);
    REQUIRE_THROWS_AS(EnsResolver(std::make_shared<test::MockChainProvider>(), "0x12"), AuthError);
}
