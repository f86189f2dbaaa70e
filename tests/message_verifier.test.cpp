#include <catch2/catch_all.hpp>
#include "siweauth/core/siwe/message_verifier.hpp"
#include "siweauth/core/store/memory_stores.hpp"
#include "test_support.hpp"

#include <functional>

using namespace siweauth;
using test::kT0;

namespace {

    struct Fixture {
        std::shared_ptr<MemoryNonceStore> store = std::make_shared<MemoryNonceStore>();
        std::shared_ptr<NonceManager>     nonces = std::make_shared<NonceManager>(store);
        MessageVerifier                   verifier{ VerifierConfig{ test::kDomain, test::kUri, 60'000 }, nonces };

        std::string nonce() { return nonces->issueNonce(kT0); }
    };

    AuthErr errorOf(const std::function<void()>& fn) {
        try {
            fn();
        }
        catch (const AuthError& e) {
            return e.code();
        }
        return AuthErr::Internal;
    }

}

TEST_CASE("a correctly signed message verifies", "[verifier]") {
    Fixture f;
    auto msg = test::makeMessage(test::kAddrOneChecksum, f.nonce());
    auto sig = test::sign(msg, test::keyOne());

    auto id = f.verifier.verify(msg, sig, kT0 + 1000);
    REQUIRE(id.address == test::kAddrOne);
    REQUIRE(id.chainId == 1);
    REQUIRE(id.issuedAtMs == static_cast<std::int64_t>(kT0));
    REQUIRE(id.message.nonce == msg.nonce);
}

TEST_CASE("verifyText accepts the signed text form", "[verifier]") {
    Fixture f;
    auto msg = test::makeMessage(test::kAddrOne, f.nonce());
    auto sig = test::sign(msg, test::keyOne());
    REQUIRE(f.verifier.verifyText(msg.toString(), sig, kT0).address == test::kAddrOne);
}

TEST_CASE("a nonce cannot be replayed", "[verifier]") {
    Fixture f;
    auto msg = test::makeMessage(test::kAddrOne, f.nonce());
    auto sig = test::sign(msg, test::keyOne());

    f.verifier.verify(msg, sig, kT0);
    REQUIRE(errorOf([&] { f.verifier.verify(msg, sig, kT0); }) == AuthErr::InvalidNonce);
}

TEST_CASE("signature problems are SignatureMismatch", "[verifier]") {
    Fixture f;
    auto msg = test::makeMessage(test::kAddrOne, f.nonce());

    SECTION("signed by another key") {
        auto sig = test::sign(msg, test::keyTwo());
        REQUIRE(errorOf([&] { f.verifier.verify(msg, sig, kT0); }) == AuthErr::SignatureMismatch);
    }
    SECTION("one flipped byte") {
        auto raw = crypto::signPersonalMessage(msg.toString(), test::keyOne());
        raw[10] ^= 0x01;
        REQUIRE(errorOf([&] { f.verifier.verify(msg, toHex0x(raw), kT0); }) == AuthErr::SignatureMismatch);
    }
    SECTION("message altered after signing") {
        auto sig = test::sign(msg, test::keyOne());
        msg.statement = "Sign in to Example!";
        REQUIRE(errorOf([&] { f.verifier.verify(msg, sig, kT0); }) == AuthErr::SignatureMismatch);
    }
    SECTION("not hex") {
        REQUIRE(errorOf([&] { f.verifier.verify(msg, "0xnothex", kT0); }) == AuthErr::SignatureMismatch);
    }
    SECTION("wrong length") {
        REQUIRE(errorOf([&] { f.verifier.verify(msg, "0x" + std::string(128, 'a'), kT0); })
                == AuthErr::SignatureMismatch);
    }
}

TEST_CASE("domain binding is checked before the nonce is spent", "[verifier]") {
    Fixture f;
    auto n = f.nonce();
    auto msg = test::makeMessage(test::kAddrOne, n);
    msg.domain = "evil.example";
    auto sig = test::sign(msg, test::keyOne());

    REQUIRE(errorOf([&] { f.verifier.verify(msg, sig, kT0); }) == AuthErr::DomainMismatch);

    // nonce still usable by the legitimate message
    auto good = test::makeMessage(test::kAddrOne, n);
    REQUIRE_NOTHROW(f.verifier.verify(good, test::sign(good, test::keyOne()), kT0));
}

TEST_CASE("domain comparison ignores case, uri must share the origin", "[verifier]") {
    Fixture f;

    auto upper = test::makeMessage(test::kAddrOne, f.nonce());
    upper.domain = "EXAMPLE.com";
    REQUIRE_NOTHROW(f.verifier.verify(upper, test::sign(upper, test::keyOne()), kT0));

    auto other = test::makeMessage(test::kAddrOne, f.nonce());
    other.uri = "https://example.com.evil.org/login";
    REQUIRE(errorOf([&] { f.verifier.verify(other, test::sign(other, test::keyOne()), kT0); })
            == AuthErr::DomainMismatch);
}

TEST_CASE("time window", "[verifier]") {
    Fixture f;
    auto msg = test::makeMessage(test::kAddrOne, f.nonce());

    SECTION("expired message") {
        msg.expirationTime = formatRfc3339(static_cast<std::int64_t>(kT0 + 5000));
        auto sig = test::sign(msg, test::keyOne());
        REQUIRE(errorOf([&] { f.verifier.verify(msg, sig, kT0 + 5000); }) == AuthErr::MessageExpired);
    }
    SECTION("issued too far in the future") {
        auto future = test::makeMessage(test::kAddrOne, msg.nonce, kT0 + 120'000);
        auto sig = test::sign(future, test::keyOne());
        REQUIRE(errorOf([&] { f.verifier.verify(future, sig, kT0); }) == AuthErr::MessageExpired);
    }
    SECTION("issuedAt within the skew tolerance") {
        auto near = test::makeMessage(test::kAddrOne, msg.nonce, kT0 + 30'000);
        REQUIRE_NOTHROW(f.verifier.verify(near, test::sign(near, test::keyOne()), kT0));
    }
    SECTION("notBefore in the future") {
        msg.notBefore = formatRfc3339(static_cast<std::int64_t>(kT0 + 600'000));
        auto sig = test::sign(msg, test::keyOne());
        REQUIRE(errorOf([&] { f.verifier.verify(msg, sig, kT0); }) == AuthErr::MessageNotYetValid);
    }
}

TEST_CASE("structural problems are reported with their fields", "[verifier]") {
    Fixture f;
    auto msg = test::makeMessage(test::kAddrOne, "short");
    msg.uri = "";
    try {
        f.verifier.verify(msg, "0x00", kT0);
        FAIL("malformed message accepted");
    }
    catch (const AuthError& e) {
        REQUIRE(e.code() == AuthErr::MalformedMessage);
        REQUIRE(std::string(e.what()) == "One or more validation errors occurred.");
        REQUIRE(e.fields().size() == 2);
    }
}

TEST_CASE("MessageVerifier requires a domain and a nonce manager", "[verifier]") {
    auto nonces = std::make_shared<NonceManager>(std::make_shared<MemoryNonceStore>());
    REQUIRE_THROWS_AS(MessageVerifier(VerifierConfig{}, nonces), AuthError);
    REQUIRE_THROWS_AS(MessageVerifier(VerifierConfig{ "example.com", std::nullopt, 0 }, nullptr), AuthError);
}
