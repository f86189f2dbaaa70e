#include <catch2/catch_all.hpp>
#include "siweauth/core/crypto/address.hpp"
#include "siweauth/core/crypto/ecdsa.hpp"
#include "siweauth/core/crypto/keccak.hpp"
#include "siweauth/core/util/hex.hpp"
#include "test_support.hpp"

using namespace siweauth;
using namespace siweauth::crypto;

TEST_CASE("keccak256 matches the reference vectors", "[crypto][keccak]") {
    REQUIRE(toHex(keccak256(std::string_view(""))) ==
        "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
    REQUIRE(toHex(keccak256(std::string_view("abc"))) ==
        "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST_CASE("keccak256 handles input spanning several blocks", "[crypto][keccak]") {
    // rate is 136 bytes; 135, 136 and 137 exercise the padding edge
    for (std::size_t n : { 135u, 136u, 137u, 300u }) {
        std::string a(n, 'a');
        std::string b = a;
        b.back() = 'b';
        REQUIRE(keccak256(std::string_view(a)) != keccak256(std::string_view(b)));
        REQUIRE(keccak256(std::string_view(a)) == keccak256(std::string_view(a)));
    }
}

TEST_CASE("EIP-55 checksum encoding", "[crypto][address]") {
    REQUIRE(toChecksumAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed") ==
        "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    REQUIRE(toChecksumAddress(test::kAddrOne) == test::kAddrOneChecksum);
}

TEST_CASE("hasValidChecksum accepts single-case and correct mixed-case only", "[crypto][address]") {
    REQUIRE(hasValidChecksum("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
    REQUIRE(hasValidChecksum("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    REQUIRE(hasValidChecksum("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED"));
    REQUIRE_FALSE(hasValidChecksum("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeD"));
}

TEST_CASE("address format validation", "[crypto][address]") {
    REQUIRE(isHexAddress(test::kAddrOne));
    REQUIRE_FALSE(isHexAddress("7e5f4552091a69125d5dfcb7b8c2659029395bdf"));
    REQUIRE_FALSE(isHexAddress("0x7e5f4552091a69125d5dfcb7b8c2659029395bd"));
    REQUIRE_FALSE(isHexAddress("0x7e5f4552091a69125d5dfcb7b8c2659029395bdg"));
    REQUIRE(normalizeAddress(test::kAddrOneChecksum) == test::kAddrOne);
    REQUIRE_THROWS_AS(normalizeAddress("0x1234"), std::invalid_argument);
}

TEST_CASE("addresses derived from private keys", "[crypto][ecdsa]") {
    REQUIRE(addressFromPrivateKey(test::keyOne()) == test::kAddrOne);
    REQUIRE(addressFromPrivateKey(test::keyTwo()) == test::kAddrTwo);

    PrivateKey zero{};
    REQUIRE_THROWS_AS(addressFromPrivateKey(zero), std::invalid_argument);
}

TEST_CASE("personal_sign signatures recover to the signer", "[crypto][ecdsa]") {
    const std::string msg = "hello siwe";
    auto sig = signPersonalMessage(msg, test::keyOne());
    REQUIRE(sig.size() == 65);
    REQUIRE((sig[64] == 27 || sig[64] == 28));

    auto digest = personalMessageHash(msg);
    auto rec = recoverAddress(digest, sig);
    REQUIRE(rec);
    REQUIRE(*rec == test::kAddrOne);

    SECTION("raw recovery id 0/1 is accepted too") {
        auto raw = sig;
        raw[64] = static_cast<std::uint8_t>(raw[64] - 27);
        REQUIRE(recoverAddress(digest, raw) == rec);
    }

    SECTION("a different message recovers a different address") {
        auto other = recoverAddress(personalMessageHash("hello siwf"), sig);
        REQUIRE(other != rec);
    }

    SECTION("bad recovery id or length yields nothing") {
        auto bad = sig;
        bad[64] = 29;
        REQUIRE_FALSE(recoverAddress(digest, bad));
        bad.pop_back();
        REQUIRE_FALSE(recoverAddress(digest, bad));
    }
}

TEST_CASE("personalMessageHash prefixes the byte length", "[crypto][ecdsa]") {
    std::string expected = "\x19" "Ethereum Signed Message:\n" "5hello";
    REQUIRE(personalMessageHash("hello") == keccak256(std::string_view(expected)));
}
