#include "siweauth/core/chain/ens_resolver.hpp"
#include "siweauth/core/chain/abi.hpp"
#include "siweauth/core/crypto/address.hpp"
#include "siweauth/core/util/error_types.hpp"
#include "siweauth/core/util/logger.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace siweauth {

    namespace {
        constexpr std::string_view kZeroAddress = "0x0000000000000000000000000000000000000000";

        Uint256 word(const crypto::Hash256& h) { return Uint256::fromBytes(h.data(), h.size()); }
    }

    crypto::Hash256 namehash(std::string_view name)
    {
        crypto::Hash256 node{};
        while (!name.empty()) {
            auto dot = name.rfind('.');
            std::string_view label = (dot == std::string_view::npos) ? name : name.substr(dot + 1);
            name = (dot == std::string_view::npos) ? std::string_view{} : name.substr(0, dot);

            auto labelHash = crypto::keccak256(label);
            std::uint8_t buf[64];
            std::copy(node.begin(), node.end(), buf);
            std::copy(labelHash.begin(), labelHash.end(), buf + 32);
            node = crypto::keccak256(buf, sizeof(buf));
        }
        return node;
    }

    EnsResolver::EnsResolver(std::shared_ptr<IChainProvider> provider, std::string registry)
        : provider_(std::move(provider))
    {
        if (!provider_)
            throw AuthError(AuthErr::ConfigurationError, "EnsResolver requires a chain provider");
        if (!crypto::isHexAddress(registry))
            throw AuthError(AuthErr::ConfigurationError, std::format("invalid ENS registry address '{}'", registry));
        registry_ = crypto::normalizeAddress(registry);
    }

    std::optional<std::string> EnsResolver::resolverOf(const crypto::Hash256& node)
    {
        auto res = abi::decodeAddress(provider_->call(registry_, "resolver(bytes32)", { word(node) }));
        if (res == kZeroAddress) return std::nullopt;
        return res;
    }

    std::optional<EnsProfile> EnsResolver::resolve(const std::string& address)
    {
        auto addr = crypto::normalizeAddress(address);

        // reverse record
        auto reverseNode = namehash(addr.substr(2) + ".addr.reverse");
        auto reverseResolver = resolverOf(reverseNode);
        if (!reverseResolver) return std::nullopt;

        auto name = abi::decodeString(provider_->call(*reverseResolver, "name(bytes32)", { word(reverseNode) }));
        if (name.empty()) return std::nullopt;
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        // forward check
        auto node = namehash(name);
        auto forwardResolver = resolverOf(node);
        if (!forwardResolver) return std::nullopt;
        auto forward = abi::decodeAddress(provider_->call(*forwardResolver, "addr(bytes32)", { word(node) }));
        if (forward != addr) {
            LOG_DEBUG(std::format("ENS name {} of {} resolves to {}, ignored", name, addr, forward));
            return std::nullopt;
        }

        EnsProfile profile;
        profile.name = name;
        auto avatar = abi::decodeString(provider_->call(*forwardResolver, "text(bytes32,string)",
            { word(node), std::string("avatar") }));
        if (!avatar.empty()) profile.avatar = std::move(avatar);
        return profile;
    }

}
