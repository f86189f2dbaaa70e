/**
 * @file error_types.hpp
 * @brief Error type definitions for siweauth.
 *
 * Provides the error kind enumeration, the AuthError exception thrown by the
 * core components and the ErrorObj structure used when an outcome is reported
 * to an external caller.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace siweauth {

    /**
     * @enum AuthErr
     * @brief Error kinds produced by the authentication core.
     *
     * InvalidNonce deliberately covers unknown, expired and already consumed
     * nonces alike.
     */
    enum class AuthErr : int {
        MalformedMessage = 1,      ///< Missing or badly formed SIWE fields
        DomainMismatch,            ///< Domain or URI differs from the configured values
        InvalidNonce,              ///< Nonce unknown, expired or consumed
        MessageExpired,            ///< expirationTime passed or issuedAt too far in the future
        MessageNotYetValid,        ///< notBefore still in the future
        SignatureMismatch,         ///< Malformed signature or recovered address differs
        SessionNotFound,           ///< Unknown session identifier
        SessionExpired,            ///< Session past its expiry or hard ceiling
        WalletDisabled,            ///< Wallet exists but is marked inactive
        ChainProviderUnavailable,  ///< On-chain read failed or timed out
        ConfigurationError,        ///< Invalid or missing configuration (startup only)
        Internal = 99              ///< Unexpected failure
    };

    /**
     * @brief Stable name of an error kind, used in API bodies and logs.
     */
    inline const char* toString(AuthErr e) noexcept {
        switch (e) {
            case AuthErr::MalformedMessage:         return "MalformedMessage";
            case AuthErr::DomainMismatch:           return "DomainMismatch";
            case AuthErr::InvalidNonce:             return "InvalidNonce";
            case AuthErr::MessageExpired:           return "MessageExpired";
            case AuthErr::MessageNotYetValid:       return "MessageNotYetValid";
            case AuthErr::SignatureMismatch:        return "SignatureMismatch";
            case AuthErr::SessionNotFound:          return "SessionNotFound";
            case AuthErr::SessionExpired:           return "SessionExpired";
            case AuthErr::WalletDisabled:           return "WalletDisabled";
            case AuthErr::ChainProviderUnavailable: return "ChainProviderUnavailable";
            case AuthErr::ConfigurationError:       return "ConfigurationError";
            case AuthErr::Internal:                 return "Internal";
        }
        return "Unknown";
    }

    /**
     * @struct FieldError
     * @brief A single field-level problem, e.g. a missing SIWE field.
     */
    struct FieldError {
        std::string field;   ///< Dotted field path ("message.nonce"), may be empty
        std::string message; ///< Human readable description
    };

    /**
     * @class AuthError
     * @brief Exception carrying an AuthErr kind and optional field details.
     */
    class AuthError : public std::runtime_error {
    public:
        AuthError(AuthErr code, const std::string& msg, std::vector<FieldError> fields = {})
            : std::runtime_error(msg), code_(code), fields_(std::move(fields)) {}

        AuthErr code() const noexcept { return code_; }
        const std::vector<FieldError>& fields() const noexcept { return fields_; }

    private:
        AuthErr                 code_;
        std::vector<FieldError> fields_;
    };

    /**
     * @struct ErrorObj
     * @brief Error outcome handed back to callers of the public API.
     */
    struct ErrorObj {
        AuthErr                 code;   ///< Error kind
        std::string             msg;    ///< Error message
        std::vector<FieldError> fields; ///< Optional field-level details
    };

}
