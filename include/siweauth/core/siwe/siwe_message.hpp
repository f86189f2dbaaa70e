/**
 * @file siwe_message.hpp
 * @brief EIP-4361 (Sign-In with Ethereum) message model.
 *
 * A SiweMessage can be parsed from the text a wallet signed, built from the
 * camelCase JSON object sent by browser clients, and serialized back to the
 * canonical text. Signatures are always checked against toString(), so a
 * message built from JSON verifies only if the client signed exactly the
 * canonical rendering of the same fields.
 */
#pragma once
#include "siweauth/core/util/error_types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace siweauth {

    /**
     * @struct SiweMessage
     * @brief Fields of an EIP-4361 message.
     *
     * Timestamps are kept as the RFC 3339 text they arrived in; re-rendering
     * must reproduce the signed bytes.
     */
    struct SiweMessage {
        static constexpr std::string_view kHeaderSuffix = " wants you to sign in with your Ethereum account:";
        static constexpr std::size_t kMinNonceLength = 8;

        std::optional<std::string> scheme;          ///< Optional "https" style prefix of the domain line
        std::string                domain;
        std::string                address;         ///< As written, EIP-55 or lowercase
        std::optional<std::string> statement;
        std::string                uri;
        std::string                version{ "1" };
        std::uint64_t              chainId{ 0 };
        std::string                nonce;
        std::string                issuedAt;
        std::optional<std::string> expirationTime;
        std::optional<std::string> notBefore;
        std::optional<std::string> requestId;
        std::vector<std::string>   resources;

        /**
         * @brief Parse the EIP-4361 text form.
         * @throws AuthError with AuthErr::MalformedMessage when the text does not
         *         follow the message grammar
         */
        static SiweMessage parse(std::string_view text);

        /**
         * @brief Build from a JSON object with camelCase keys (chainId, issuedAt,
         * expirationTime, notBefore, requestId...).
         *
         * chainId may be a number or a decimal string.
         * @throws AuthError with AuthErr::MalformedMessage listing every field
         *         with the wrong JSON type
         */
        static SiweMessage fromJson(const nlohmann::json& j);

        /// camelCase JSON object, optional fields omitted when absent.
        nlohmann::json toJson() const;

        /// Canonical EIP-4361 text, the exact bytes that get signed.
        std::string toString() const;

        /**
         * @brief Check presence and format of every field.
         * @return One entry per invalid field, empty if the message is well formed
         */
        std::vector<FieldError> validate() const;

        /// issuedAt in epoch milliseconds; std::nullopt if unparseable.
        std::optional<std::int64_t> issuedAtMs() const;
        std::optional<std::int64_t> expirationTimeMs() const;
        std::optional<std::int64_t> notBeforeMs() const;
    };

}
