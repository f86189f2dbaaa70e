/**
 * @file iens_resolver.hpp
 * @brief Best-effort reverse ENS lookup.
 */
#pragma once
#include "siweauth/core/types.hpp"
#include <optional>
#include <string>

namespace siweauth {

    class IEnsResolver {
    public:
        virtual ~IEnsResolver() = default;

        /**
         * @brief Primary ENS name (and avatar) of an address.
         * @return std::nullopt if the address has no primary name. May throw;
         *         callers treat any failure as "no profile".
         */
        virtual std::optional<EnsProfile> resolve(const std::string& address) = 0;
    };

}
