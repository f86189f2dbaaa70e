#include "siweauth/core/nonce/nonce_manager.hpp"
#include "siweauth/core/util/error_types.hpp"
#include "siweauth/core/util/logger.hpp"
#include "internal/core/util/random.hpp"
#include <format>
#include <string_view>

namespace siweauth {

    namespace {
        constexpr int kMaxIssueAttempts = 4;

        /// Prefix of a presented nonce for log lines.
        std::string_view shortNonce(std::string_view token) { return token.substr(0, 6); }
    }

    NonceManager::NonceManager(std::shared_ptr<INonceStore> store, std::uint64_t ttlMs)
        : store_(std::move(store)), ttlMs_(ttlMs)
    {
        if (!store_)
            throw AuthError(AuthErr::ConfigurationError, "NonceManager requires a nonce store");
        if (ttlMs_ == 0)
            throw AuthError(AuthErr::ConfigurationError, "nonce TTL must be positive");
    }

    std::string NonceManager::issueNonce(std::uint64_t nowMs)
    {
        if (auto purged = store_->purgeExpired(nowMs); purged > 0)
            LOG_DEBUG(std::format("purged {} expired nonces", purged));

        for (int attempt = 0; attempt < kMaxIssueAttempts; ++attempt) {
            NonceRecord rec;
            rec.value = randomHexToken<12>();
            rec.issuedMs = nowMs;
            rec.expiresMs = nowMs + ttlMs_;
            if (store_->insert(rec))
                return rec.value;
            LOG_WARN("nonce collision, drawing again");
        }
        throw AuthError(AuthErr::Internal, "could not store a unique nonce");
    }

    void NonceManager::consume(const std::string& token, std::uint64_t nowMs)
    {
        if (token.empty() || !store_->consume(token, nowMs)) {
            LOG_DEBUG(std::format("nonce '{}..' rejected", shortNonce(token)));
            throw AuthError(AuthErr::InvalidNonce, "Invalid nonce");
        }
    }

    std::size_t NonceManager::purgeExpired(std::uint64_t nowMs) {
        return store_->purgeExpired(nowMs);
    }

}
