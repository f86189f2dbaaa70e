/**
 * @file ens_resolver.hpp
 * @brief Reverse ENS resolution through an IChainProvider.
 */
#pragma once
#include "siweauth/core/crypto/keccak.hpp"
#include "siweauth/core/interfaces/ichain_provider.hpp"
#include "siweauth/core/interfaces/iens_resolver.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace siweauth {

    /**
     * @brief ENS namehash of a dot separated name ("" is the root node).
     *
     * Labels are hashed as given; callers pass names already lowercased.
     */
    crypto::Hash256 namehash(std::string_view name);

    /**
     * @class EnsResolver
     * @brief Looks up the primary name of an address and its avatar record.
     *
     * The reverse record `<addr>.addr.reverse` is only trusted if the name
     * resolves forward to the same address. The avatar is the `avatar` text
     * record of the name.
     */
    class EnsResolver : public IEnsResolver {
    public:
        static constexpr std::string_view kMainnetRegistry = "0x00000000000C2E074eC69A0dFb2997BA6C7d2e1e";

        explicit EnsResolver(std::shared_ptr<IChainProvider> provider,
                             std::string registry = std::string(kMainnetRegistry));

        std::optional<EnsProfile> resolve(const std::string& address) override;

    private:
        /// Resolver contract of a node, std::nullopt if none is set.
        std::optional<std::string> resolverOf(const crypto::Hash256& node);

        std::shared_ptr<IChainProvider> provider_;
        std::string                     registry_;
    };

}
