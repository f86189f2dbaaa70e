/**
 * @file nonce_manager.hpp
 * @brief Issues and consumes single-use login nonces.
 */
#pragma once
#include "siweauth/core/interfaces/inonce_store.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace siweauth {

    /**
     * @class NonceManager
     * @brief Nonce lifecycle on top of an INonceStore.
     *
     * A nonce moves from issued to consumed exactly once. Unknown, expired and
     * consumed nonces are all rejected with AuthErr::InvalidNonce so that a
     * caller cannot tell them apart.
     */
    class NonceManager {
    public:
        static constexpr std::uint64_t kDefaultTtlMs = 10 * 60 * 1000;   // 10 min

        /**
         * @param store Backing store, shared with whoever else needs it (tests)
         * @param ttlMs Nonce lifetime in milliseconds
         */
        explicit NonceManager(std::shared_ptr<INonceStore> store,
                              std::uint64_t ttlMs = kDefaultTtlMs);

        /**
         * @brief Create and store a fresh nonce (12 random bytes, hex encoded).
         *
         * Expired records are purged first.
         */
        std::string issueNonce(std::uint64_t nowMs);

        /**
         * @brief Consume a nonce.
         * @throws AuthError with AuthErr::InvalidNonce if the nonce is unknown,
         *         expired or already consumed
         */
        void consume(const std::string& token, std::uint64_t nowMs);

        std::size_t purgeExpired(std::uint64_t nowMs);

        std::uint64_t ttlMs() const { return ttlMs_; }

    private:
        std::shared_ptr<INonceStore> store_;
        std::uint64_t                ttlMs_;
    };

}
