#include "siweauth/core/siwe/message_verifier.hpp"
#include "siweauth/core/crypto/address.hpp"
#include "siweauth/core/crypto/ecdsa.hpp"
#include "siweauth/core/util/hex.hpp"
#include "siweauth/core/util/logger.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace siweauth {

    namespace {

        bool iequals(std::string_view a, std::string_view b) {
            return a.size() == b.size() &&
                std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                    return std::tolower(x) == std::tolower(y);
                });
        }

        /// uri equals the origin, or continues it with a path, query or fragment.
        bool matchesOrigin(std::string_view uri, std::string_view origin) {
            if (origin.ends_with('/')) origin.remove_suffix(1);
            if (uri.size() < origin.size() || !iequals(uri.substr(0, origin.size()), origin))
                return false;
            if (uri.size() == origin.size()) return true;
            char next = uri[origin.size()];
            return next == '/' || next == '?' || next == '#';
        }

    }

    MessageVerifier::MessageVerifier(VerifierConfig cfg, std::shared_ptr<NonceManager> nonces)
        : cfg_(std::move(cfg)), nonces_(std::move(nonces))
    {
        if (cfg_.expectedDomain.empty())
            throw AuthError(AuthErr::ConfigurationError, "expected domain is not configured");
        if (!nonces_)
            throw AuthError(AuthErr::ConfigurationError, "MessageVerifier requires a NonceManager");
    }

    VerifiedIdentity MessageVerifier::verifyText(std::string_view text, std::string_view signatureHex,
                                                 std::uint64_t nowMs) const
    {
        return verify(SiweMessage::parse(text), signatureHex, nowMs);
    }

    VerifiedIdentity MessageVerifier::verify(const SiweMessage& msg, std::string_view signatureHex,
                                             std::uint64_t nowMs) const
    {
        // 1. structure
        if (auto errs = msg.validate(); !errs.empty()) {
            LOG_DEBUG(std::format("SIWE message rejected: {} invalid field(s), first '{}'",
                errs.size(), errs.front().field));
            throw AuthError(AuthErr::MalformedMessage, "One or more validation errors occurred.", std::move(errs));
        }

        // 2. binding
        checkBinding(msg);

        // 3. nonce, spent from here on
        nonces_->consume(msg.nonce, nowMs);

        // 4. time window
        checkTimeWindow(msg, nowMs);

        // 5. signature
        auto address = checkSignature(msg, signatureHex);

        VerifiedIdentity id;
        id.address = std::move(address);
        id.chainId = msg.chainId;
        id.issuedAtMs = *msg.issuedAtMs();
        id.message = msg;
        return id;
    }

    void MessageVerifier::checkBinding(const SiweMessage& msg) const
    {
        if (!iequals(msg.domain, cfg_.expectedDomain)) {
            LOG_DEBUG(std::format("domain mismatch: got '{}', expected '{}'", msg.domain, cfg_.expectedDomain));
            throw AuthError(AuthErr::DomainMismatch, "Domain does not match", { { "domain", "does not match" } });
        }
        if (cfg_.expectedUri && !matchesOrigin(msg.uri, *cfg_.expectedUri)) {
            LOG_DEBUG(std::format("uri mismatch: got '{}', expected origin '{}'", msg.uri, *cfg_.expectedUri));
            throw AuthError(AuthErr::DomainMismatch, "URI does not match", { { "uri", "does not match" } });
        }
    }

    void MessageVerifier::checkTimeWindow(const SiweMessage& msg, std::uint64_t nowMs) const
    {
        const auto now = static_cast<std::int64_t>(nowMs);
        const auto skew = static_cast<std::int64_t>(cfg_.clockSkewMs);

        if (*msg.issuedAtMs() > now + skew)
            throw AuthError(AuthErr::MessageExpired, "Message issued in the future");

        if (auto exp = msg.expirationTimeMs(); exp && now >= *exp)
            throw AuthError(AuthErr::MessageExpired, "Message expired");

        if (auto nbf = msg.notBeforeMs(); nbf && *nbf > now + skew)
            throw AuthError(AuthErr::MessageNotYetValid, "Message not yet valid");
    }

    std::string MessageVerifier::checkSignature(const SiweMessage& msg, std::string_view signatureHex) const
    {
        std::vector<std::uint8_t> sig;
        try {
            sig = fromHex(signatureHex);
        }
        catch (const std::invalid_argument&) {
            throw AuthError(AuthErr::SignatureMismatch, "Malformed signature");
        }
        if (sig.size() != 65)
            throw AuthError(AuthErr::SignatureMismatch, "Malformed signature");

        auto digest = crypto::personalMessageHash(msg.toString());
        auto recovered = crypto::recoverAddress(digest, sig);
        if (!recovered)
            throw AuthError(AuthErr::SignatureMismatch, "Signature could not be recovered");

        auto claimed = crypto::normalizeAddress(msg.address);
        if (*recovered != claimed) {
            LOG_DEBUG(std::format("signature mismatch: recovered {}, claimed {}", *recovered, claimed));
            throw AuthError(AuthErr::SignatureMismatch, "Signature does not match address");
        }
        return claimed;
    }

}
