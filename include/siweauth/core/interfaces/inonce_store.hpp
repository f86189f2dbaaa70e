/**
 * @file inonce_store.hpp
 * @brief Storage interface for login nonces.
 */
#pragma once
#include "siweauth/core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace siweauth {

    /**
     * @class INonceStore
     * @brief Keyed storage of NonceRecord with an atomic consume.
     *
     * Implementations back the NonceManager: an in-memory map for tests and
     * single-process deployments, a shared transactional store otherwise.
     */
    class INonceStore {
    public:
        virtual ~INonceStore() = default;

        /**
         * @brief Store a new nonce.
         * @return false if a record with the same value already exists
         */
        virtual bool insert(const NonceRecord& rec) = 0;

        /**
         * @brief Atomically consume a nonce.
         *
         * Succeeds only if the record exists, is not expired at nowMs and has
         * not been consumed. Among concurrent callers for the same value at most
         * one may succeed.
         */
        virtual bool consume(const std::string& value, std::uint64_t nowMs) = 0;

        /**
         * @brief Delete expired records (consumed or not).
         * @return Number of records removed
         */
        virtual std::size_t purgeExpired(std::uint64_t nowMs) = 0;
    };

}
