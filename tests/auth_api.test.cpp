#include <catch2/catch_all.hpp>
#include "siweauth/core/auth_api.hpp"
#include "siweauth/core/store/memory_stores.hpp"
#include "test_support.hpp"

#include <algorithm>

using namespace siweauth;
using test::kT0;

namespace {

    struct ApiEnv {
        std::shared_ptr<MemoryWalletRepository> wallets = std::make_shared<MemoryWalletRepository>();
        std::shared_ptr<test::StaticEnsResolver> ens = std::make_shared<test::StaticEnsResolver>();
        std::unique_ptr<Authenticator>           auth;
        std::unique_ptr<AuthApi>                 api;

        ApiEnv() {
            AuthConfig cfg;
            cfg.domain = test::kDomain;
            cfg.providerUrl = "http://127.0.0.1:8545";

            auto deps = AuthDependencies::inMemory();
            deps.wallets = wallets;
            deps.ens = ens;
            deps.provider = std::make_shared<test::MockChainProvider>();
            deps.clock = [] { return kT0; };
            auth = std::make_unique<Authenticator>(cfg, std::move(deps));
            api = std::make_unique<AuthApi>(*auth);
        }

        std::string nonce() {
            auto r = api->nonce();
            REQUIRE(r.status == 200);
            return r.body["nonce"].get<std::string>();
        }

        std::string loginBody(const std::string& nonce, const crypto::PrivateKey& key = test::keyOne()) {
            auto msg = test::makeMessage(test::kAddrOneChecksum, nonce);
            return nlohmann::json{ { "message", msg.toJson() }, { "signature", test::sign(msg, key) } }.dump();
        }

        std::string login() {
            auto r = api->login(loginBody(nonce()));
            REQUIRE(r.status == 200);
            return *r.setSession;
        }
    };

    bool hasFieldEntry(const nlohmann::json& body, const std::string& field) {
        const auto& errs = body.at("errors");
        return std::any_of(errs.begin(), errs.end(),
            [&](const nlohmann::json& e) { return e.value("field", "") == field; });
    }

}

TEST_CASE("nonce endpoint", "[api]") {
    ApiEnv env;
    auto r = env.api->nonce();
    REQUIRE(r.status == 200);
    REQUIRE(r.body["success"] == true);
    REQUIRE(r.body["nonce"].get<std::string>().size() == 24);
}

TEST_CASE("login succeeds and sets the session", "[api]") {
    ApiEnv env;
    auto n = env.nonce();
    auto r = env.api->login(env.loginBody(n));

    REQUIRE(r.status == 200);
    REQUIRE(r.body["success"] == true);
    REQUIRE(r.body["message"] == "Successful login.");
    REQUIRE(r.body["address"] == test::kAddrOne);
    REQUIRE(r.body["expires_at"] == formatRfc3339(static_cast<std::int64_t>(kT0 + 3ull * 60 * 60 * 1000)));
    REQUIRE(r.setSession);
    REQUIRE(r.body["session_id"] == *r.setSession);

    SECTION("replaying the body is unauthorized") {
        auto again = env.api->login(env.loginBody(n));
        REQUIRE(again.status == 401);
        REQUIRE(again.body["error"] == "InvalidNonce");
        REQUIRE(again.body["message"] == AuthApi::kMessage401);
    }
}

TEST_CASE("login accepts the message as text", "[api]") {
    ApiEnv env;
    auto msg = test::makeMessage(test::kAddrOne, env.nonce());
    nlohmann::json body = { { "message", msg.toString() }, { "signature", test::sign(msg, test::keyOne()) } };
    REQUIRE(env.api->login(body.dump()).status == 200);
}

TEST_CASE("malformed login requests are 400 with field errors", "[api]") {
    ApiEnv env;

    SECTION("not JSON") {
        auto r = env.api->login("{oops");
        REQUIRE(r.status == 400);
        REQUIRE(r.body["message"] == AuthApi::kMessage400);
        REQUIRE(r.body["errors"].size() == 1);
    }
    SECTION("missing message and signature") {
        auto r = env.api->login("{}");
        REQUIRE(r.status == 400);
        REQUIRE(hasFieldEntry(r.body, "message"));
        REQUIRE(hasFieldEntry(r.body, "signature"));
    }
    SECTION("invalid SIWE fields are prefixed") {
        auto msg = test::makeMessage(test::kAddrOne, "short").toJson();
        msg.erase("uri");
        nlohmann::json body = { { "message", msg }, { "signature", "0x00" } };
        auto r = env.api->login(body.dump());
        REQUIRE(r.status == 400);
        REQUIRE(r.body["error"] == "MalformedMessage");
        REQUIRE(hasFieldEntry(r.body, "message.nonce"));
        REQUIRE(hasFieldEntry(r.body, "message.uri"));
    }
}

TEST_CASE("bad signature is 401", "[api]") {
    ApiEnv env;
    auto r = env.api->login(env.loginBody(env.nonce(), test::keyTwo()));
    REQUIRE(r.status == 401);
    REQUIRE(r.body["error"] == "SignatureMismatch");
    REQUIRE_FALSE(r.setSession);
}

TEST_CASE("disabled wallet is 403", "[api]") {
    ApiEnv env;
    env.login();
    env.wallets->setActive(test::kAddrOne, false);
    auto r = env.api->login(env.loginBody(env.nonce()));
    REQUIRE(r.status == 403);
    REQUIRE(r.body["message"] == AuthApi::kMessage403);
}

TEST_CASE("session endpoints", "[api][session]") {
    ApiEnv env;
    env.ens->profile = EnsProfile{ "alice.eth", std::nullopt };
    auto sid = env.login();

    SECTION("verify") {
        auto r = env.api->verify(sid);
        REQUIRE(r.status == 200);
        REQUIRE(r.body["message"] == "Successful session verify.");
        REQUIRE(r.body["address"] == test::kAddrOne);
    }
    SECTION("me") {
        auto r = env.api->me(sid);
        REQUIRE(r.status == 200);
        const auto& w = r.body["wallet"];
        REQUIRE(w["ethereum_address"] == test::kAddrOneChecksum);
        REQUIRE(w["ens_name"] == "alice.eth");
        REQUIRE(w["ens_avatar"].is_null());
        REQUIRE(w["is_active"] == true);
        REQUIRE(w["is_admin"] == false);
        REQUIRE(w["groups"].empty());
    }
    SECTION("refresh rotates") {
        auto r = env.api->refresh(sid);
        REQUIRE(r.status == 200);
        REQUIRE(r.body["message"] == "Successful session refresh.");
        REQUIRE(r.setSession);
        REQUIRE(*r.setSession != sid);

        auto old = env.api->verify(sid);
        REQUIRE(old.status == 401);
        REQUIRE(old.clearSession);
    }
    SECTION("logout twice") {
        auto r1 = env.api->logout(sid);
        REQUIRE(r1.status == 200);
        REQUIRE(r1.body["message"] == "Successful logout.");
        REQUIRE(r1.clearSession);
        REQUIRE(env.api->logout(sid).status == 200);
        REQUIRE(env.api->me(sid).status == 401);
    }
}

TEST_CASE("missing session cookie is 401", "[api][session]") {
    ApiEnv env;
    REQUIRE(env.api->verify(std::nullopt).status == 401);
    REQUIRE(env.api->me(std::string()).status == 401);
    REQUIRE(env.api->refresh(std::nullopt).status == 401);
    REQUIRE(env.api->logout(std::nullopt).status == 200);
}

TEST_CASE("status mapping", "[api]") {
    REQUIRE(AuthApi::statusFor(AuthErr::MalformedMessage) == 400);
    REQUIRE(AuthApi::statusFor(AuthErr::DomainMismatch) == 401);
    REQUIRE(AuthApi::statusFor(AuthErr::MessageNotYetValid) == 401);
    REQUIRE(AuthApi::statusFor(AuthErr::SessionExpired) == 401);
    REQUIRE(AuthApi::statusFor(AuthErr::WalletDisabled) == 403);
    REQUIRE(AuthApi::statusFor(AuthErr::ChainProviderUnavailable) == 500);
    REQUIRE(AuthApi::statusFor(AuthErr::Internal) == 500);

    auto r = AuthApi::errorResponse({ AuthErr::Internal, "boom", {} });
    REQUIRE(r.body["message"] == AuthApi::kMessage500);
    REQUIRE(r.body["errors"][0]["message"] == "boom");
}
