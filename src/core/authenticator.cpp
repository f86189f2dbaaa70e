#include "siweauth/core/authenticator.hpp"
#include "siweauth/core/chain/ens_resolver.hpp"
#include "siweauth/core/chain/json_rpc_provider.hpp"
#include "siweauth/core/nonce/nonce_manager.hpp"
#include "siweauth/core/session/session_manager.hpp"
#include "siweauth/core/siwe/message_verifier.hpp"
#include "siweauth/core/store/memory_stores.hpp"
#include "siweauth/core/util/error_types.hpp"
#include "siweauth/core/util/logger.hpp"
#include "siweauth/core/util/thread_pool.hpp"
#include <format>

namespace siweauth {

    AuthDependencies AuthDependencies::inMemory()
    {
        AuthDependencies d;
        d.nonces = std::make_shared<MemoryNonceStore>();
        d.sessions = std::make_shared<MemorySessionStore>();
        d.wallets = std::make_shared<MemoryWalletRepository>();
        d.groups = std::make_shared<MemoryGroupRepository>();
        return d;
    }

    struct Authenticator::Impl {
        AuthConfig                         cfg;
        Clock                              clock;
        std::shared_ptr<IWalletRepository> wallets;
        std::shared_ptr<IGroupRepository>  groupRepo;
        std::shared_ptr<IEnsResolver>      ens;
        std::shared_ptr<NonceManager>      nonces;
        std::unique_ptr<MessageVerifier>   verifier;
        std::unique_ptr<SessionManager>    sessions;
        std::unique_ptr<GroupSynchronizer> sync;

        std::uint64_t now() const { return clock(); }

        void enrichEns(Wallet& w);
        std::optional<SyncReport> syncGroups(const Wallet& w);
        LoginResult login(const SiweMessage& msg, std::string_view signature);
    };

    void Authenticator::Impl::enrichEns(Wallet& w)
    {
        if (!ens) return;
        try {
            auto profile = ens->resolve(w.address);
            w.ensName = profile ? std::optional<std::string>(profile->name) : std::nullopt;
            w.ensAvatar = profile ? profile->avatar : std::nullopt;
        }
        catch (const std::exception& e) {
            // enrichment only, keep what we had
            LOG_WARN(std::format("ENS lookup for {} failed: {}", w.address, e.what()));
        }
    }

    std::optional<SyncReport> Authenticator::Impl::syncGroups(const Wallet& w)
    {
        if (!sync) return std::nullopt;
        try {
            return sync->sync(w);
        }
        catch (const std::exception& e) {
            LOG_WARN(std::format("group sync for {} aborted: {}", w.address, e.what()));
            SyncReport r;
            for (const auto& g : sync->groups())
                r.failed.push_back({ g.name, e.what() });
            return r;
        }
    }

    LoginResult Authenticator::Impl::login(const SiweMessage& msg, std::string_view signature)
    {
        const auto t = now();
        auto identity = verifier->verify(msg, signature, t);

        if (auto existing = wallets->find(identity.address); existing && !existing->isActive) {
            LOG_INFO(std::format("login refused for disabled wallet {}", identity.address));
            throw AuthError(AuthErr::WalletDisabled,
                "The request is understood, but it has been refused or access is not allowed.");
        }

        LoginResult result;
        result.session = sessions->createSession(identity.address, t);

        auto wallet = wallets->find(identity.address);
        if (!wallet)
            throw AuthError(AuthErr::Internal, std::format("wallet {} vanished after session creation", identity.address));
        wallet->lastLoginMs = t;
        if (cfg.createEnsProfileOnAuth)
            enrichEns(*wallet);
        wallets->update(*wallet);

        result.wallet = *wallet;
        result.groups = syncGroups(result.wallet);

        LOG_INFO(std::format("login {} (chain {})", identity.address, identity.chainId));
        return result;
    }

    Authenticator::Authenticator(AuthConfig cfg, AuthDependencies deps)
        : pImpl_(std::make_unique<Impl>())
    {
        cfg.validate();
        if (!deps.nonces || !deps.sessions || !deps.wallets || !deps.groups)
            throw AuthError(AuthErr::ConfigurationError, "Authenticator requires nonce, session, wallet and group stores");

        auto& p = *pImpl_;
        p.cfg = std::move(cfg);
        p.clock = deps.clock ? std::move(deps.clock) : Clock(epochMillis);
        p.wallets = deps.wallets;
        p.groupRepo = deps.groups;

        p.nonces = std::make_shared<NonceManager>(deps.nonces, p.cfg.nonceTtlMs);

        VerifierConfig vc;
        vc.expectedDomain = p.cfg.domain;
        vc.expectedUri = p.cfg.uri;
        vc.clockSkewMs = p.cfg.clockSkewMs;
        p.verifier = std::make_unique<MessageVerifier>(std::move(vc), p.nonces);

        SessionPolicy sp;
        sp.lifetimeMs = p.cfg.sessionLifetimeMs;
        sp.hardCeilingMs = p.cfg.sessionHardCeilingMs;
        p.sessions = std::make_unique<SessionManager>(deps.sessions, deps.wallets, sp);

        const bool needSync = p.cfg.createGroupsOnAuth && !p.cfg.groups.empty();
        const bool needEns = p.cfg.createEnsProfileOnAuth && !deps.ens;
        auto provider = deps.provider;
        if (!provider && (needSync || needEns))
            provider = std::make_shared<JsonRpcProvider>(p.cfg.providerUrl,
                std::chrono::milliseconds(p.cfg.providerTimeoutMs));

        if (p.cfg.createEnsProfileOnAuth)
            p.ens = deps.ens ? deps.ens : std::make_shared<EnsResolver>(provider);

        if (needSync) {
            auto pool = std::make_shared<ThreadPool>(p.cfg.workerThreads);
            p.sync = std::make_unique<GroupSynchronizer>(p.cfg.groups, p.groupRepo, provider, pool,
                std::chrono::milliseconds(p.cfg.groupSyncTimeoutMs));
        }

        Logger::inst().setLevel(p.cfg.logLevel);
        LOG_INFO(std::format("authenticator ready: domain={}, groups={}, ens={}",
            p.cfg.domain, needSync ? p.cfg.groups.size() : 0, p.ens ? "on" : "off"));
    }

    Authenticator::~Authenticator() = default;

    std::string Authenticator::requestNonce() {
        return pImpl_->nonces->issueNonce(pImpl_->now());
    }

    LoginResult Authenticator::login(const SiweMessage& message, std::string_view signature) {
        return pImpl_->login(message, signature);
    }

    LoginResult Authenticator::loginText(std::string_view message, std::string_view signature) {
        return pImpl_->login(SiweMessage::parse(message), signature);
    }

    Session Authenticator::refresh(const std::string& sessionId) {
        return pImpl_->sessions->refresh(sessionId, pImpl_->now());
    }

    std::string Authenticator::verify(const std::string& sessionId) {
        return pImpl_->sessions->verify(sessionId, pImpl_->now()).address;
    }

    void Authenticator::logout(const std::string& sessionId) {
        pImpl_->sessions->destroy(sessionId);
    }

    WalletProfile Authenticator::me(const std::string& sessionId)
    {
        auto s = pImpl_->sessions->verify(sessionId, pImpl_->now());
        auto w = pImpl_->wallets->find(s.address);
        if (!w)
            throw AuthError(AuthErr::Internal, std::format("no wallet for session address {}", s.address));
        return { *w, pImpl_->groupRepo->groupsOf(s.address) };
    }

    std::size_t Authenticator::reap() {
        auto t = pImpl_->now();
        return pImpl_->nonces->purgeExpired(t) + pImpl_->sessions->reap(t);
    }

    const AuthConfig& Authenticator::config() const {
        return pImpl_->cfg;
    }

}
