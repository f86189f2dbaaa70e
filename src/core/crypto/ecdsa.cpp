#include "siweauth/core/crypto/ecdsa.hpp"
#include "siweauth/core/crypto/address.hpp"
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <algorithm>
#include <stdexcept>

namespace siweauth::crypto {

    namespace {

        secp256k1_context* secpContext() {
            static secp256k1_context* ctx = []() {
                secp256k1_context* created =
                    secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
                if (created == nullptr)
                    throw std::runtime_error("Failed to create secp256k1 context");
                return created;
            }();
            return ctx;
        }

        std::array<std::uint8_t, 64> serializeUncompressed(const secp256k1_pubkey& pubkey) {
            std::uint8_t out[65];
            std::size_t outLen = sizeof(out);
            secp256k1_ec_pubkey_serialize(secpContext(), out, &outLen, &pubkey,
                                          SECP256K1_EC_UNCOMPRESSED);
            std::array<std::uint8_t, 64> xy{};
            std::copy(out + 1, out + 65, xy.begin());
            return xy;
        }

    }

    Hash256 personalMessageHash(std::string_view message) {
        std::string prefixed = "\x19" "Ethereum Signed Message:\n" + std::to_string(message.size());
        prefixed.append(message);
        return keccak256(std::string_view(prefixed));
    }

    std::optional<std::string> recoverAddress(const Hash256& digest,
                                              const std::vector<std::uint8_t>& signature)
    {
        if (signature.size() != 65) return std::nullopt;

        int recid = signature[64];
        if (recid >= 27) recid -= 27;
        if (recid != 0 && recid != 1) return std::nullopt;

        secp256k1_ecdsa_recoverable_signature sig;
        if (!secp256k1_ecdsa_recoverable_signature_parse_compact(secpContext(), &sig,
                                                                 signature.data(), recid))
            return std::nullopt;

        secp256k1_pubkey pubkey;
        if (!secp256k1_ecdsa_recover(secpContext(), &pubkey, &sig, digest.data()))
            return std::nullopt;

        return addressFromPublicKey(serializeUncompressed(pubkey));
    }

    std::vector<std::uint8_t> signDigest(const Hash256& digest, const PrivateKey& key)
    {
        if (!secp256k1_ec_seckey_verify(secpContext(), key.data()))
            throw std::invalid_argument("invalid secp256k1 private key");

        secp256k1_ecdsa_recoverable_signature sig;
        if (!secp256k1_ecdsa_sign_recoverable(secpContext(), &sig, digest.data(), key.data(),
                                              nullptr, nullptr))
            throw std::runtime_error("secp256k1 signing failed");

        std::vector<std::uint8_t> out(65);
        int recid = 0;
        secp256k1_ecdsa_recoverable_signature_serialize_compact(secpContext(), out.data(),
                                                                &recid, &sig);
        out[64] = static_cast<std::uint8_t>(27 + recid);
        return out;
    }

    std::vector<std::uint8_t> signPersonalMessage(std::string_view message, const PrivateKey& key) {
        return signDigest(personalMessageHash(message), key);
    }

    std::string addressFromPrivateKey(const PrivateKey& key)
    {
        secp256k1_pubkey pubkey;
        if (!secp256k1_ec_pubkey_create(secpContext(), &pubkey, key.data()))
            throw std::invalid_argument("invalid secp256k1 private key");
        return addressFromPublicKey(serializeUncompressed(pubkey));
    }

}
