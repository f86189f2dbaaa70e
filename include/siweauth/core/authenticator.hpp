/**
 * @file authenticator.hpp
 * @brief Authenticator class, the entry point of the SIWE authentication core.
 *
 * Composes nonce management, message verification, sessions, group
 * synchronization and ENS enrichment into the operations exposed to callers:
 * requestNonce, login, refresh, verify, logout and me.
 */
#pragma once
#include "siweauth/core/config.hpp"
#include "siweauth/core/groups/group_sync.hpp"
#include "siweauth/core/interfaces/ichain_provider.hpp"
#include "siweauth/core/interfaces/iens_resolver.hpp"
#include "siweauth/core/interfaces/igroup_repository.hpp"
#include "siweauth/core/interfaces/inonce_store.hpp"
#include "siweauth/core/interfaces/isession_store.hpp"
#include "siweauth/core/interfaces/iwallet_repository.hpp"
#include "siweauth/core/siwe/siwe_message.hpp"
#include "siweauth/core/types.hpp"
#include "siweauth/core/util/time.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace siweauth {

    /**
     * @struct AuthDependencies
     * @brief Collaborators injected into the Authenticator.
     *
     * Stores are required. A null provider is replaced by a JsonRpcProvider
     * for AuthConfig::providerUrl and a null ENS resolver by an EnsResolver on
     * that provider, both created only when the configuration needs them.
     */
    struct AuthDependencies {
        std::shared_ptr<INonceStore>       nonces;
        std::shared_ptr<ISessionStore>     sessions;
        std::shared_ptr<IWalletRepository> wallets;
        std::shared_ptr<IGroupRepository>  groups;
        std::shared_ptr<IChainProvider>    provider;
        std::shared_ptr<IEnsResolver>      ens;
        Clock                              clock;   ///< Defaults to epochMillis

        /// In-memory stores, no provider or resolver.
        static AuthDependencies inMemory();
    };

    /**
     * @struct LoginResult
     * @brief Outcome of a successful login.
     */
    struct LoginResult {
        Session                   session;
        Wallet                    wallet;   ///< After last-login and ENS update
        std::optional<SyncReport> groups;   ///< Set when group sync ran
    };

    /**
     * @struct WalletProfile
     * @brief What `me` reports about the authenticated wallet.
     */
    struct WalletProfile {
        Wallet                   wallet;
        std::vector<std::string> groups;   ///< Sorted group names
    };

    /**
     * @class Authenticator
     * @brief Thread-safe facade over the authentication components.
     *
     * Independent requests may call into one instance concurrently. Failures
     * are reported as AuthError; see AuthErr for the kinds each operation can
     * produce.
     */
    class Authenticator {
    public:
        /**
         * @throws AuthError with AuthErr::ConfigurationError for an invalid
         *         configuration or missing stores
         */
        Authenticator(AuthConfig cfg, AuthDependencies deps);
        ~Authenticator();

        Authenticator(const Authenticator&) = delete;
        Authenticator& operator=(const Authenticator&) = delete;

        /**
         * @brief Issue a single-use nonce to embed in a SIWE message.
         */
        std::string requestNonce();

        /**
         * @brief Verify a signed message and open a session.
         *
         * On success the wallet's last-login time is updated; depending on the
         * configuration its ENS profile is refreshed and its groups are
         * synchronized. Neither enrichment can make the login fail.
         *
         * @throws AuthError MalformedMessage, DomainMismatch, InvalidNonce,
         *         MessageExpired, MessageNotYetValid, SignatureMismatch or
         *         WalletDisabled
         */
        LoginResult login(const SiweMessage& message, std::string_view signature);

        /// login() for the EIP-4361 text form.
        LoginResult loginText(std::string_view message, std::string_view signature);

        /**
         * @brief Rotate a session.
         * @throws AuthError SessionNotFound / SessionExpired
         */
        Session refresh(const std::string& sessionId);

        /**
         * @brief Address bound to a live session.
         * @throws AuthError SessionNotFound / SessionExpired
         */
        std::string verify(const std::string& sessionId);

        /**
         * @brief End a session. Unknown or already ended sessions are ignored.
         */
        void logout(const std::string& sessionId);

        /**
         * @brief Profile of the wallet behind a live session.
         * @throws AuthError SessionNotFound / SessionExpired
         */
        WalletProfile me(const std::string& sessionId);

        /**
         * @brief Purge expired nonces and sessions.
         * @return Number of records removed
         */
        std::size_t reap();

        const AuthConfig& config() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
