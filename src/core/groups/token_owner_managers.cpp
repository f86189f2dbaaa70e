#include "siweauth/core/groups/group_manager.hpp"
#include "siweauth/core/chain/abi.hpp"
#include "siweauth/core/crypto/address.hpp"
#include "siweauth/core/util/error_types.hpp"
#include <format>

namespace siweauth {

    namespace {

        /// Integer config values may be JSON numbers or decimal / 0x hex strings.
        Uint256 toUint(const nlohmann::json& v) {
            if (v.is_number_unsigned()) return Uint256(v.get<std::uint64_t>());
            if (v.is_number_integer() && v.get<std::int64_t>() >= 0)
                return Uint256(static_cast<std::uint64_t>(v.get<std::int64_t>()));
            if (v.is_string()) return Uint256::parse(v.get_ref<const std::string&>());
            throw std::invalid_argument("expected a non-negative integer");
        }

        Uint256 decodeBalance(const std::vector<std::uint8_t>& ret, const std::string& contract) {
            try {
                return abi::decodeUint(ret);
            }
            catch (const std::invalid_argument& e) {
                throw AuthError(AuthErr::ChainProviderUnavailable,
                    std::format("unexpected balanceOf result from {}: {}", contract, e.what()));
            }
        }

    }

    /*──────────────── Shared ───────────────*/
    TokenOwnerManager::TokenOwnerManager(std::string standard, const nlohmann::json& config)
        : standard_(std::move(standard))
    {
        if (!config.is_object())
            throw AuthError(AuthErr::ConfigurationError,
                std::format("{} Owner Manager config must be an object.", standard_));

        const auto& contract = required(config, "contract");
        if (!contract.is_string() || !crypto::isHexAddress(contract.get_ref<const std::string&>()))
            throw AuthError(AuthErr::ConfigurationError,
                std::format("{} Owner Manager contract must be a hex address.", standard_));
        contract_ = crypto::normalizeAddress(contract.get_ref<const std::string&>());

        if (auto it = config.find("min_balance"); it != config.end()) {
            try {
                minBalance_ = toUint(*it);
            }
            catch (const std::invalid_argument& e) {
                throw AuthError(AuthErr::ConfigurationError,
                    std::format("{} Owner Manager min_balance is invalid: {}", standard_, e.what()));
            }
        }
    }

    const nlohmann::json& TokenOwnerManager::required(const nlohmann::json& config, const char* key) const
    {
        auto it = config.find(key);
        if (it == config.end() || it->is_null())
            throw AuthError(AuthErr::ConfigurationError,
                std::format("{} Owner Manager config is missing {} attribute.", standard_, key));
        return *it;
    }

    bool TokenOwnerManager::isMember(const Wallet& wallet, IChainProvider& provider) const {
        return balanceOf(wallet.address, provider) >= minBalance_;
    }

    std::string TokenOwnerManager::describe() const {
        return std::format("{} {}", standard_, contract_);
    }

    /*──────────────── ERC-20 ───────────────*/
    ERC20OwnerManager::ERC20OwnerManager(const nlohmann::json& config)
        : TokenOwnerManager("ERC20", config) {}

    Uint256 ERC20OwnerManager::balanceOf(const std::string& address, IChainProvider& provider) const {
        auto ret = provider.call(contract_, "balanceOf(address)", { abi::address(address) });
        return decodeBalance(ret, contract_);
    }

    /*──────────────── ERC-721 ───────────────*/
    ERC721OwnerManager::ERC721OwnerManager(const nlohmann::json& config)
        : TokenOwnerManager("ERC721", config) {}

    Uint256 ERC721OwnerManager::balanceOf(const std::string& address, IChainProvider& provider) const {
        auto ret = provider.call(contract_, "balanceOf(address)", { abi::address(address) });
        return decodeBalance(ret, contract_);
    }

    /*──────────────── ERC-1155 ───────────────*/
    ERC1155OwnerManager::ERC1155OwnerManager(const nlohmann::json& config)
        : TokenOwnerManager("ERC1155", config)
    {
        try {
            tokenId_ = toUint(required(config, "token_id"));
        }
        catch (const std::invalid_argument& e) {
            throw AuthError(AuthErr::ConfigurationError,
                std::format("ERC1155 Owner Manager token_id is invalid: {}", e.what()));
        }
    }

    Uint256 ERC1155OwnerManager::balanceOf(const std::string& address, IChainProvider& provider) const {
        auto ret = provider.call(contract_, "balanceOf(address,uint256)", { abi::address(address), tokenId_ });
        return decodeBalance(ret, contract_);
    }

    std::string ERC1155OwnerManager::describe() const {
        return std::format("ERC1155 {} #{}", contract_, tokenId_.toDecimal());
    }

}
