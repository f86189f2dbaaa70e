/**
 * @file auth_api.hpp
 * @brief AuthApi maps Authenticator operations to HTTP-style status codes and JSON bodies.
 *
 * Transport neutral: the host server extracts the session id (cookie or
 * header) and the request body, calls the matching method and writes back
 * ApiResponse::status and ApiResponse::body.
 */
#pragma once
#include "siweauth/core/authenticator.hpp"
#include "siweauth/core/util/error_types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace siweauth {

    /**
     * @struct ApiResponse
     * @brief Status, JSON body and session cookie instruction of one API call.
     */
    struct ApiResponse {
        int                        status{ 200 };
        nlohmann::json             body;
        std::optional<std::string> setSession;          ///< New session id to hand to the client
        bool                       clearSession{ false }; ///< Client should drop its session id
    };

    /**
     * @class AuthApi
     * @brief JSON front of the Authenticator.
     *
     * Bodies follow one shape: `{"success": bool, "message": string}` plus
     * operation specific keys, and `"errors": [{"message", "field"?}]` for 400
     * and 500 responses. Error responses also carry the error kind as `"error"`.
     */
    class AuthApi {
    public:
        static constexpr const char* kMessage400 = "One or more validation errors occurred.";
        static constexpr const char* kMessage401 = "Authentication credentials were missing or incorrect.";
        static constexpr const char* kMessage403 = "The request is understood, but it has been refused or access is not allowed.";
        static constexpr const char* kMessage500 = "Something went wrong.";

        explicit AuthApi(Authenticator& auth) : auth_(auth) {}

        /// GET nonce -> `{success, nonce}`
        ApiResponse nonce();

        /**
         * @brief POST login with `{"message": {...camelCase fields...} | "<EIP-4361 text>", "signature": "0x..."}`.
         */
        ApiResponse login(std::string_view rawBody);

        /// POST refresh -> new session id.
        ApiResponse refresh(const std::optional<std::string>& sessionId);

        /// GET verify -> address of the session.
        ApiResponse verify(const std::optional<std::string>& sessionId);

        /// POST logout, always 200.
        ApiResponse logout(const std::optional<std::string>& sessionId);

        /// GET me -> `{success, wallet: {...}}`
        ApiResponse me(const std::optional<std::string>& sessionId);

        /**
         * @brief HTTP status of an error kind.
         */
        static int statusFor(AuthErr code) noexcept;

        /**
         * @brief Response body and status for an error.
         */
        static ApiResponse errorResponse(const ErrorObj& err);

    private:
        template<typename F>
        ApiResponse guarded(const char* op, F&& fn);

        Authenticator& auth_;
    };

}
