/**
 * @file session_manager.hpp
 * @brief SessionManager class for issuing, rotating and revoking wallet sessions.
 *
 * Sessions are server-side records bound to a verified wallet address. The
 * manager owns the expiry and rotation policy; storage is delegated to an
 * ISessionStore so that several processes can share it.
 */
#pragma once
#include "siweauth/core/interfaces/isession_store.hpp"
#include "siweauth/core/interfaces/iwallet_repository.hpp"
#include "siweauth/core/types.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace siweauth {

    /**
     * @struct SessionPolicy
     * @brief Lifetime settings for sessions.
     */
    struct SessionPolicy {
        std::uint64_t lifetimeMs{ 3ull * 60 * 60 * 1000 };   ///< Expiry after creation or refresh (3 h)
        std::uint64_t hardCeilingMs{ 0 };                      ///< Max age of a rotation chain, 0 = unlimited
    };

    /**
     * @class SessionManager
     * @brief Creates, refreshes, verifies and destroys sessions.
     *
     * A refresh rotates the identifier: the old id stops working the moment the
     * new one is stored. Identifiers are 128-bit random values and the store
     * rejects ids already in use, so an id is never handed out twice.
     */
    class SessionManager {
    public:
        /**
         * @brief Construct a SessionManager.
         * @param sessions Session storage
         * @param wallets Wallet repository, used to create the wallet on first login
         * @param policy Lifetime policy
         */
        SessionManager(std::shared_ptr<ISessionStore> sessions,
                       std::shared_ptr<IWalletRepository> wallets,
                       SessionPolicy policy = {});

        /**
         * @brief Create a new session for a verified address.
         *
         * The wallet record is created if this is the first time the address is
         * seen. A new session is created on every call, after expired sessions
         * have been purged from the store.
         *
         * @param address Lowercase wallet address
         * @param nowMs Current time in milliseconds
         * @return The stored session
         */
        Session createSession(const std::string& address, std::uint64_t nowMs);

        /**
         * @brief Rotate a live session.
         *
         * @return The new session (new id, later expiry, rotation + 1)
         * @throws AuthError SessionNotFound if the id is unknown or was already
         *         rotated; SessionExpired if the session or its hard ceiling has
         *         passed (the record is removed)
         */
        Session refresh(const std::string& id, std::uint64_t nowMs);

        /**
         * @brief Look up a live session.
         * @throws AuthError SessionNotFound / SessionExpired
         */
        Session verify(const std::string& id, std::uint64_t nowMs) const;

        /**
         * @brief Remove a session. Unknown ids are ignored.
         */
        void destroy(const std::string& id);

        /**
         * @brief Remove expired sessions.
         * @param nowMs Current time in milliseconds
         * @return Number of sessions removed
         */
        std::size_t reap(std::uint64_t nowMs);

        const SessionPolicy& policy() const { return policy_; }

    private:
        std::uint64_t expiryFor(std::uint64_t originMs, std::uint64_t nowMs) const;
        bool pastCeiling(const Session& s, std::uint64_t nowMs) const;

        std::shared_ptr<ISessionStore>     sessions_;
        std::shared_ptr<IWalletRepository> wallets_;
        SessionPolicy                      policy_;
    };

}
