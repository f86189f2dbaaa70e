/**
 * @file iwallet_repository.hpp
 * @brief Persistence interface for Wallet records, supplied by the host's storage layer.
 */
#pragma once
#include "siweauth/core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace siweauth {

    class IWalletRepository {
    public:
        virtual ~IWalletRepository() = default;

        /**
         * @brief Fetch the wallet for an address, creating it if absent.
         * @param address Lowercase address
         * @param nowMs Creation time used for a new record
         * @return The wallet and whether it was created by this call
         */
        virtual std::pair<Wallet, bool> getOrCreate(const std::string& address,
                                                    std::uint64_t nowMs) = 0;

        virtual std::optional<Wallet> find(const std::string& address) const = 0;

        /**
         * @brief Persist last-login and ENS fields of an existing wallet.
         */
        virtual void update(const Wallet& wallet) = 0;
    };

}
