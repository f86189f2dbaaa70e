#include <catch2/catch_all.hpp>
#include "siweauth/core/groups/group_registry.hpp"
#include "siweauth/core/groups/group_sync.hpp"
#include "siweauth/core/store/memory_stores.hpp"
#include "test_support.hpp"

#include <algorithm>

using namespace siweauth;
using namespace std::chrono_literals;

namespace {

    const std::string kToken = "0xdAC17F958D2ee523a2206206994597C13D831ec7";
    const std::string kNft = "0xbc4ca0eda7647a8ab7c2061c2e118a18a936f13d";
    const std::string kMulti = "0x495f947276749ce646f68ac8c248420045cb7b5e";

    std::string configError(const nlohmann::json& groups) {
        GroupManagerRegistry reg;
        try {
            reg.buildAll(groups);
        }
        catch (const AuthError& e) {
            REQUIRE(e.code() == AuthErr::ConfigurationError);
            return e.what();
        }
        return {};
    }

    bool contains(const std::vector<std::string>& v, const std::string& s) {
        return std::find(v.begin(), v.end(), s) != v.end();
    }

    Wallet walletOne() {
        Wallet w;
        w.address = test::kAddrOne;
        return w;
    }

    /// Custom strategy: members are exactly the wallets flagged as admin.
    class AdminOnlyManager : public GroupManager {
    public:
        bool isMember(const Wallet& w, IChainProvider&) const override { return w.isAdmin; }
        std::string describe() const override { return "admin-only"; }
    };

}

TEST_CASE("token owner configs report missing attributes", "[groups][config]") {
    REQUIRE(configError(nlohmann::json::parse(R"([{"name":"g","type":"erc20","config":{}}])")) ==
            "ERC20 Owner Manager config is missing contract attribute.");
    REQUIRE(configError(nlohmann::json::parse(R"([{"name":"g","type":"erc721"}])")) ==
            "ERC721 Owner Manager config is missing contract attribute.");

    nlohmann::json noTokenId = nlohmann::json::array({
        { { "name", "g" }, { "type", "erc1155" }, { "config", { { "contract", kMulti } } } } });
    REQUIRE(configError(noTokenId) == "ERC1155 Owner Manager config is missing token_id attribute.");
}

TEST_CASE("registry rejects unknown types, bad contracts and duplicate names", "[groups][config]") {
    REQUIRE_FALSE(configError(nlohmann::json::parse(R"([{"name":"g","type":"erc9999"}])")).empty());
    REQUIRE_FALSE(configError(nlohmann::json::parse(
        R"([{"name":"g","type":"erc20","config":{"contract":"0x1234"}}])")).empty());
    REQUIRE_FALSE(configError(nlohmann::json::parse(
        R"([{"name":"g","type":"erc20","config":{"contract":"0xdac17f958d2ee523a2206206994597c13d831ec7","min_balance":-3}}])")).empty());
    REQUIRE_FALSE(configError(nlohmann::json::parse(R"([{"type":"erc20"}])")).empty());
    REQUIRE_FALSE(configError(nlohmann::json::parse(R"({"name":"g"})")).empty());

    nlohmann::json cfg = { { "contract", kToken } };
    nlohmann::json dup = nlohmann::json::array({
        { { "name", "holders" }, { "type", "erc20" }, { "config", cfg } },
        { { "name", "holders" }, { "type", "erc721" }, { "config", cfg } } });
    REQUIRE(configError(dup) == "duplicate group 'holders'");
}

TEST_CASE("token owner managers compare the balance with min_balance", "[groups]") {
    test::MockChainProvider chain;
    GroupManagerRegistry reg;
    auto w = walletOne();

    SECTION("erc20 default min_balance is 1") {
        auto mgr = reg.create("erc20", { { "contract", kToken } });
        REQUIRE_FALSE(mgr->isMember(w, chain));
        chain.setBalance(kToken, w.address, 1);
        REQUIRE(mgr->isMember(w, chain));
    }
    SECTION("erc721 with explicit threshold as a string") {
        auto mgr = reg.create("erc721", { { "contract", kNft }, { "min_balance", "3" } });
        chain.setBalance(kNft, w.address, 2);
        REQUIRE_FALSE(mgr->isMember(w, chain));
        chain.setBalance(kNft, w.address, 3);
        REQUIRE(mgr->isMember(w, chain));
    }
    SECTION("erc1155 asks for the configured token id") {
        auto mgr = reg.create("erc1155", { { "contract", kMulti }, { "token_id", 42 } });
        chain.setBalance1155(kMulti, w.address, 41, 10);
        REQUIRE_FALSE(mgr->isMember(w, chain));
        chain.setBalance1155(kMulti, w.address, 42, 1);
        REQUIRE(mgr->isMember(w, chain));
        REQUIRE(mgr->describe().find("#42") != std::string::npos);
    }
    SECTION("short return data is a provider failure") {
        auto mgr = reg.create("erc20", { { "contract", kToken } });
        chain.setResponse(kToken, "balanceOf(address)", { abi::address(w.address) }, { 0x01 });
        try {
            mgr->isMember(w, chain);
            FAIL("short return accepted");
        }
        catch (const AuthError& e) {
            REQUIRE(e.code() == AuthErr::ChainProviderUnavailable);
        }
    }
}

TEST_CASE("sync follows on-chain balances across logins", "[groups][sync]") {
    auto chain = std::make_shared<test::MockChainProvider>();
    auto repo = std::make_shared<MemoryGroupRepository>();
    auto pool = std::make_shared<ThreadPool>(2);
    GroupManagerRegistry reg;

    auto groups = reg.buildAll(nlohmann::json::array({
        { { "name", "usdt-holders" }, { "type", "erc20" }, { "config", { { "contract", kToken } } } } }));
    GroupSynchronizer sync(groups, repo, chain, pool);
    auto w = walletOne();

    // balance 0: group created, wallet not a member
    auto r1 = sync.sync(w);
    REQUIRE(r1.ok());
    REQUIRE(repo->hasGroup("usdt-holders"));
    REQUIRE_FALSE(repo->isMember("usdt-holders", w.address));
    REQUIRE(contains(r1.kept, "usdt-holders"));

    // balance 5: joins
    chain->setBalance(kToken, w.address, 5);
    auto r2 = sync.sync(w);
    REQUIRE(contains(r2.added, "usdt-holders"));
    REQUIRE(repo->isMember("usdt-holders", w.address));

    // unchanged on the next login
    auto r3 = sync.sync(w);
    REQUIRE(contains(r3.kept, "usdt-holders"));

    // balance back to 0: removed
    chain->setBalance(kToken, w.address, 0);
    auto r4 = sync.sync(w);
    REQUIRE(contains(r4.removed, "usdt-holders"));
    REQUIRE(repo->groupsOf(w.address).empty());
}

TEST_CASE("provider failures leave membership untouched", "[groups][sync]") {
    auto chain = std::make_shared<test::MockChainProvider>();
    auto repo = std::make_shared<MemoryGroupRepository>();
    auto pool = std::make_shared<ThreadPool>(2);
    GroupManagerRegistry reg;
    auto w = walletOne();

    auto groups = reg.buildAll(nlohmann::json::array({
        { { "name", "a" }, { "type", "erc20" }, { "config", { { "contract", kToken } } } },
        { { "name", "b" }, { "type", "erc721" }, { "config", { { "contract", kNft } } } } }));

    chain->setBalance(kToken, w.address, 1);
    chain->setBalance(kNft, w.address, 1);
    GroupSynchronizer(groups, repo, chain, pool).sync(w);
    REQUIRE(repo->isMember("a", w.address));
    REQUIRE(repo->isMember("b", w.address));

    SECTION("provider down") {
        chain->setDown(true);
        auto r = GroupSynchronizer(groups, repo, chain, pool).sync(w);
        REQUIRE_FALSE(r.ok());
        REQUIRE(r.failed.size() == 2);
        REQUIRE(repo->isMember("a", w.address));
        REQUIRE(repo->isMember("b", w.address));
    }

    SECTION("slow provider hits the deadline") {
        chain->setDelay(300ms);
        chain->setBalance(kToken, w.address, 0);
        auto r = GroupSynchronizer(groups, repo, chain, pool, 50ms).sync(w);
        REQUIRE(r.failed.size() == 2);
        REQUIRE(r.failed[0].reason == "timeout");
        REQUIRE(repo->isMember("a", w.address));
    }
}

TEST_CASE("custom strategies can be registered", "[groups][registry]") {
    GroupManagerRegistry reg;
    REQUIRE_FALSE(reg.hasType("admin"));
    reg.registerType("admin", [](const nlohmann::json&) { return std::make_unique<AdminOnlyManager>(); });
    REQUIRE(reg.hasType("admin"));
    REQUIRE(reg.hasType("erc1155"));

    auto groups = reg.buildAll(nlohmann::json::parse(R"([{"name":"staff","type":"admin"}])"));
    auto repo = std::make_shared<MemoryGroupRepository>();
    GroupSynchronizer sync(groups, repo, std::make_shared<test::MockChainProvider>(),
                           std::make_shared<ThreadPool>(1));

    auto w = walletOne();
    REQUIRE(sync.sync(w).kept.size() == 1);
    w.isAdmin = true;
    REQUIRE(sync.sync(w).added.size() == 1);
    REQUIRE(repo->groupsOf(w.address) == std::vector<std::string>{ "staff" });
}
