#include "siweauth/core/auth_flow.hpp"
#include "siweauth/core/util/error_types.hpp"
#include <exception>

namespace siweauth {

    const char* toString(AuthState s) noexcept {
        switch (s) {
            case AuthState::Unauthenticated: return "Unauthenticated";
            case AuthState::NonceIssued:     return "NonceIssued";
            case AuthState::Authenticated:   return "Authenticated";
            case AuthState::Expired:         return "Expired";
            case AuthState::LoggedOut:       return "LoggedOut";
        }
        return "Unknown";
    }

    const std::string& AuthFlow::requestNonce()
    {
        nonce_ = auth_.requestNonce();
        if (state_ != AuthState::Authenticated)
            state_ = AuthState::NonceIssued;
        return *nonce_;
    }

    const LoginResult& AuthFlow::login(const SiweMessage& message, std::string_view signature)
    {
        try {
            login_ = auth_.login(message, signature);
        }
        catch (const std::exception&) {
            // the nonce is spent whatever went wrong
            nonce_.reset();
            login_.reset();
            state_ = AuthState::Unauthenticated;
            throw;
        }
        nonce_.reset();
        state_ = AuthState::Authenticated;
        return *login_;
    }

    const std::string& AuthFlow::sessionIdOrThrow() const
    {
        if (state_ != AuthState::Authenticated || !login_)
            throw AuthError(AuthErr::SessionNotFound, "No active session");
        return login_->session.id;
    }

    void AuthFlow::markExpired()
    {
        state_ = AuthState::Expired;
        login_.reset();
    }

    const Session& AuthFlow::refresh()
    {
        const auto& id = sessionIdOrThrow();
        try {
            login_->session = auth_.refresh(id);
        }
        catch (const AuthError& e) {
            if (e.code() == AuthErr::SessionExpired || e.code() == AuthErr::SessionNotFound)
                markExpired();
            throw;
        }
        return login_->session;
    }

    std::string AuthFlow::verify()
    {
        const auto& id = sessionIdOrThrow();
        try {
            return auth_.verify(id);
        }
        catch (const AuthError& e) {
            if (e.code() == AuthErr::SessionExpired || e.code() == AuthErr::SessionNotFound)
                markExpired();
            throw;
        }
    }

    void AuthFlow::logout()
    {
        if (login_)
            auth_.logout(login_->session.id);
        login_.reset();
        nonce_.reset();
        state_ = AuthState::LoggedOut;
    }

}
