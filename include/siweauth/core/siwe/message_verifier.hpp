/**
 * @file message_verifier.hpp
 * @brief Verification of signed SIWE messages.
 */
#pragma once
#include "siweauth/core/nonce/nonce_manager.hpp"
#include "siweauth/core/siwe/siwe_message.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace siweauth {

    /**
     * @struct VerifierConfig
     * @brief What a message must be bound to in order to be accepted.
     */
    struct VerifierConfig {
        std::string                expectedDomain;          ///< Compared case-insensitively
        std::optional<std::string> expectedUri;             ///< Origin prefix the message URI must start with
        std::uint64_t              clockSkewMs{ 60'000 };   ///< Tolerance for issuedAt / notBefore in the future
    };

    /**
     * @struct VerifiedIdentity
     * @brief Result of a successful verification.
     */
    struct VerifiedIdentity {
        std::string   address;      ///< Lowercase recovered address
        std::uint64_t chainId{};
        std::int64_t  issuedAtMs{};
        SiweMessage   message;      ///< The verified message as parsed
    };

    /**
     * @class MessageVerifier
     * @brief Runs the SIWE checks in a fixed order and stops at the first failure.
     *
     * 1. structure (MalformedMessage)
     * 2. domain / URI binding (DomainMismatch)
     * 3. nonce consumption (InvalidNonce)
     * 4. time window (MessageExpired, MessageNotYetValid)
     * 5. signature recovery (SignatureMismatch)
     *
     * Apart from step 3 there are no side effects. Once step 3 is reached the
     * nonce is spent even if a later step fails.
     */
    class MessageVerifier {
    public:
        MessageVerifier(VerifierConfig cfg, std::shared_ptr<NonceManager> nonces);

        /**
         * @brief Verify a message and its personal_sign signature.
         *
         * @param msg Parsed message
         * @param signatureHex 65-byte r||s||v signature as hex, "0x" optional
         * @param nowMs Current time in milliseconds
         * @throws AuthError on the first failed check
         */
        VerifiedIdentity verify(const SiweMessage& msg, std::string_view signatureHex,
                                std::uint64_t nowMs) const;

        /**
         * @brief Same as verify() for the EIP-4361 text form.
         */
        VerifiedIdentity verifyText(std::string_view text, std::string_view signatureHex,
                                    std::uint64_t nowMs) const;

        const VerifierConfig& config() const { return cfg_; }

    private:
        void checkBinding(const SiweMessage& msg) const;
        void checkTimeWindow(const SiweMessage& msg, std::uint64_t nowMs) const;
        std::string checkSignature(const SiweMessage& msg, std::string_view signatureHex) const;

        VerifierConfig                cfg_;
        std::shared_ptr<NonceManager> nonces_;
    };

}
