/**
 * @file types.hpp
 * @brief Core records of the authentication model: wallets, nonces and sessions.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace siweauth {

    /**
     * @struct Wallet
     * @brief Identity record keyed by a lowercase Ethereum address.
     *
     * Created on the first successful login for an address and never deleted by
     * the core. Login only touches lastLoginMs and the ENS fields.
     */
    struct Wallet {
        std::string                address;        ///< Lowercase "0x" address, primary key
        std::uint64_t              createdMs{};    ///< Creation time
        std::uint64_t              lastLoginMs{};  ///< Last successful authentication
        std::optional<std::string> ensName;        ///< Primary ENS name, if any
        std::optional<std::string> ensAvatar;      ///< ENS "avatar" text record, if any
        bool                       isActive{ true };
        bool                       isAdmin{ false };
    };

    /**
     * @struct NonceRecord
     * @brief Single-use login challenge.
     */
    struct NonceRecord {
        std::string   value;
        std::uint64_t issuedMs{};
        std::uint64_t expiresMs{};
        bool          consumed{ false };
    };

    /**
     * @struct Session
     * @brief Server-side authenticated context bound to one wallet.
     *
     * The address never changes for the lifetime of a session chain; a refresh
     * produces a new record with a new id, later expiry and rotation + 1.
     */
    struct Session {
        std::string   id;              ///< Opaque identifier handed to the client
        std::string   address;         ///< Wallet the session is bound to
        std::uint64_t createdMs{};     ///< Creation time of this record
        std::uint64_t expiresMs{};     ///< Record is invalid at or after this time
        std::uint64_t originMs{};      ///< Creation time of the first record of the chain
        std::uint32_t rotation{ 0 };   ///< Number of refreshes since login
    };

    /**
     * @struct EnsProfile
     * @brief Result of a reverse ENS lookup.
     */
    struct EnsProfile {
        std::string                name;
        std::optional<std::string> avatar;
    };

}
