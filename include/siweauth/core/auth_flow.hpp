/**
 * @file auth_flow.hpp
 * @brief Explicit state machine for one client's authentication flow.
 */
#pragma once
#include "siweauth/core/authenticator.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace siweauth {

    /**
     * @enum AuthState
     * @brief States of a single authentication flow.
     *
     * Unauthenticated -> NonceIssued -> Authenticated -> (refresh)* -> LoggedOut | Expired
     */
    enum class AuthState {
        Unauthenticated,
        NonceIssued,
        Authenticated,
        Expired,
        LoggedOut
    };

    const char* toString(AuthState s) noexcept;

    /**
     * @class AuthFlow
     * @brief Drives an Authenticator on behalf of one client and tracks where it is.
     *
     * Used by clients and tests that hold one flow at a time. A failed login
     * returns the flow to Unauthenticated (the nonce it used is spent); a
     * session found expired or missing during refresh or verify moves it to
     * Expired. Not thread-safe.
     */
    class AuthFlow {
    public:
        explicit AuthFlow(Authenticator& auth) : auth_(auth) {}

        /// Fetch a nonce. Allowed in any state; a live session is kept.
        const std::string& requestNonce();

        /**
         * @brief Log in with a message signed over the current nonce.
         * @throws AuthError from Authenticator::login; the flow is then Unauthenticated
         */
        const LoginResult& login(const SiweMessage& message, std::string_view signature);

        /**
         * @brief Rotate the current session.
         * @throws AuthError SessionNotFound if not Authenticated, otherwise as
         *         Authenticator::refresh (the flow is then Expired)
         */
        const Session& refresh();

        /**
         * @brief Address of the current session.
         * @throws AuthError as refresh()
         */
        std::string verify();

        /// End the session. Idempotent; always ends in LoggedOut.
        void logout();

        AuthState state() const { return state_; }
        const std::optional<std::string>& nonce() const { return nonce_; }
        const std::optional<LoginResult>& current() const { return login_; }

    private:
        const std::string& sessionIdOrThrow() const;
        void markExpired();

        Authenticator&             auth_;
        AuthState                  state_{ AuthState::Unauthenticated };
        std::optional<std::string> nonce_;
        std::optional<LoginResult> login_;
    };

}
