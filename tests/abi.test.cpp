#include <catch2/catch_all.hpp>
#include "siweauth/core/chain/abi.hpp"
#include "siweauth/core/util/hex.hpp"
#include "siweauth/core/util/uint256.hpp"

#include <algorithm>

using namespace siweauth;

TEST_CASE("Uint256 parses decimal and hex", "[uint256]") {
    REQUIRE(Uint256::parse("0") == Uint256(0));
    REQUIRE(Uint256::parse("255") == Uint256(255));
    REQUIRE(Uint256::parse("0xff") == Uint256(255));
    REQUIRE(Uint256::parse("18446744073709551616").toHex() == "0x10000000000000000");
    REQUIRE(Uint256::parse("0x10000000000000000").toDecimal() == "18446744073709551616");
    REQUIRE(Uint256(0).toHex() == "0x0");
    REQUIRE(Uint256(0).isZero());
}

TEST_CASE("Uint256 rejects malformed text and overflow", "[uint256]") {
    REQUIRE_THROWS_AS(Uint256::parse(""), std::invalid_argument);
    REQUIRE_THROWS_AS(Uint256::parse("12a"), std::invalid_argument);
    REQUIRE_THROWS_AS(Uint256::parse("0xzz"), std::invalid_argument);
    // 2^256
    REQUIRE_THROWS_AS(Uint256::parse(
        "115792089237316195423570985008687907853269984665640564039457584007913129639936"),
        std::invalid_argument);
    REQUIRE_NOTHROW(Uint256::parse(
        "115792089237316195423570985008687907853269984665640564039457584007913129639935"));
}

TEST_CASE("Uint256 ordering is numeric", "[uint256]") {
    REQUIRE(Uint256(1) < Uint256(2));
    REQUIRE(Uint256(256) > Uint256(255));
    REQUIRE(Uint256::parse("0x0100000000000000000000000000000000") > Uint256(~0ull));
    REQUIRE(Uint256(7) >= Uint256(7));
}

TEST_CASE("function selectors", "[abi]") {
    REQUIRE(toHex(abi::selector("balanceOf(address)")) == "70a08231");
    REQUIRE(toHex(abi::selector("transfer(address,uint256)")) == "a9059cbb");
}

TEST_CASE("encodeCall with static arguments", "[abi]") {
    auto data = abi::encodeCall("balanceOf(address)",
        { abi::address("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf") });
    REQUIRE(data.size() == 4 + 32);
    REQUIRE(toHex(data) ==
        "70a08231"
        "0000000000000000000000007e5f4552091a69125d5dfcb7b8c2659029395bdf");
}

TEST_CASE("encodeCall places dynamic strings in the tail", "[abi]") {
    auto data = abi::encodeCall("text(bytes32,string)", { Uint256(1), std::string("avatar") });
    REQUIRE(data.size() == 4 + 32 * 4);
    auto body = std::vector<std::uint8_t>(data.begin() + 4, data.end());
    // head: word, offset 0x40; tail: length 6, padded bytes
    REQUIRE(abi::decodeUint(std::vector<std::uint8_t>(body.begin() + 32, body.begin() + 64)) == Uint256(0x40));
    REQUIRE(abi::decodeUint(std::vector<std::uint8_t>(body.begin() + 64, body.begin() + 96)) == Uint256(6));
    REQUIRE(std::string(body.begin() + 96, body.begin() + 102) == "avatar");
    REQUIRE(std::all_of(body.begin() + 102, body.end(), [](std::uint8_t b) { return b == 0; }));
}

TEST_CASE("decodeString reads an ABI encoded string return", "[abi]") {
    std::vector<std::uint8_t> ret(32 * 3, 0);
    const std::string name = "vitalik.eth";
    ret[31] = 0x20;                                     // offset
    ret[63] = static_cast<std::uint8_t>(name.size());   // length
    std::copy(name.begin(), name.end(), ret.begin() + 64);
    REQUIRE(abi::decodeString(ret) == name);

    SECTION("length past the end is rejected") {
        ret[63] = 200;
        REQUIRE_THROWS_AS(abi::decodeString(ret), std::invalid_argument);
    }
    SECTION("truncated data is rejected") {
        REQUIRE_THROWS_AS(abi::decodeString(std::vector<std::uint8_t>(16, 0)), std::invalid_argument);
    }
}

TEST_CASE("decodeAddress takes the low 20 bytes", "[abi]") {
    std::vector<std::uint8_t> ret(32, 0);
    for (int i = 12; i < 32; ++i) ret[i] = 0xab;
    REQUIRE(abi::decodeAddress(ret) == "0xabababababababababababababababababababab");
}
