#include "siweauth/core/session/session_manager.hpp"
#include "siweauth/core/util/error_types.hpp"
#include "siweauth/core/util/logger.hpp"
#include "internal/core/util/random.hpp"
#include <algorithm>
#include <format>

using namespace siweauth;

namespace {
    constexpr int kMaxIdAttempts = 4;

    /// Short prefix of an id for log lines; full ids are credentials.
    std::string shortId(const std::string& id) { return id.substr(0, 8); }
}

SessionManager::SessionManager(std::shared_ptr<ISessionStore> sessions,
                               std::shared_ptr<IWalletRepository> wallets,
                               SessionPolicy policy)
    : sessions_(std::move(sessions)), wallets_(std::move(wallets)), policy_(policy)
{
    if (!sessions_ || !wallets_)
        throw AuthError(AuthErr::ConfigurationError, "SessionManager requires a session store and a wallet repository");
    if (policy_.lifetimeMs == 0)
        throw AuthError(AuthErr::ConfigurationError, "session lifetime must be positive");
}

std::uint64_t SessionManager::expiryFor(std::uint64_t originMs, std::uint64_t nowMs) const
{
    std::uint64_t exp = nowMs + policy_.lifetimeMs;
    if (policy_.hardCeilingMs > 0)
        exp = std::min(exp, originMs + policy_.hardCeilingMs);
    return exp;
}

bool SessionManager::pastCeiling(const Session& s, std::uint64_t nowMs) const {
    return policy_.hardCeilingMs > 0 && nowMs >= s.originMs + policy_.hardCeilingMs;
}

/*──────────────── Session creation ───────────────*/
Session SessionManager::createSession(const std::string& address, std::uint64_t nowMs)
{
    reap(nowMs);

    auto [wallet, created] = wallets_->getOrCreate(address, nowMs);
    if (created)
        LOG_INFO(std::format("new wallet {}", wallet.address));

    Session s;
    s.address = address;
    s.createdMs = nowMs;
    s.originMs = nowMs;
    s.expiresMs = expiryFor(nowMs, nowMs);
    s.rotation = 0;

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        s.id = randomHexToken<16>();
        if (sessions_->insert(s)) {
            LOG_DEBUG(std::format("session {}.. created for {}", shortId(s.id), address));
            return s;
        }
    }
    throw AuthError(AuthErr::Internal, "could not allocate a unique session id");
}

/*──────────────── Rotation ───────────────*/
Session SessionManager::refresh(const std::string& id, std::uint64_t nowMs)
{
    auto cur = sessions_->find(id);
    if (!cur)
        throw AuthError(AuthErr::SessionNotFound, "Session not found");

    if (nowMs >= cur->expiresMs || pastCeiling(*cur, nowMs)) {
        sessions_->erase(id);
        throw AuthError(AuthErr::SessionExpired, "Session expired");
    }

    Session next = *cur;
    next.createdMs = nowMs;
    next.expiresMs = expiryFor(cur->originMs, nowMs);
    next.rotation = cur->rotation + 1;

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        next.id = randomHexToken<16>();
        switch (sessions_->rotate(id, next)) {
            case RotateResult::Ok:
                LOG_DEBUG(std::format("session {}.. rotated to {}.. (rotation {})",
                    shortId(id), shortId(next.id), next.rotation));
                return next;
            case RotateResult::NotFound:
                // lost a race with a concurrent refresh or logout
                throw AuthError(AuthErr::SessionNotFound, "Session not found");
            case RotateResult::IdInUse:
                break;
        }
    }
    throw AuthError(AuthErr::Internal, "could not allocate a unique session id");
}

/*──────────────── Lookup ───────────────*/
Session SessionManager::verify(const std::string& id, std::uint64_t nowMs) const
{
    auto s = sessions_->find(id);
    if (!s)
        throw AuthError(AuthErr::SessionNotFound, "Session not found");
    if (nowMs >= s->expiresMs || pastCeiling(*s, nowMs))
        throw AuthError(AuthErr::SessionExpired, "Session expired");
    return *s;
}

void SessionManager::destroy(const std::string& id) {
    sessions_->erase(id);
}

/*──────────────── TTL Reaper ───────────────*/
std::size_t SessionManager::reap(std::uint64_t nowMs)
{
    auto n = sessions_->purgeExpired(nowMs);
    if (n > 0)
        LOG_DEBUG(std::format("reaped {} expired sessions", n));
    return n;
}
