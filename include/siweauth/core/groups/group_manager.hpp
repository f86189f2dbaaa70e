/**
 * @file group_manager.hpp
 * @brief Group membership strategies evaluated against on-chain state.
 *
 * A GroupManager answers a single question: does this wallet belong to the
 * group right now? The token owner managers below answer it with a
 * `balanceOf` read; host applications add their own strategies by deriving
 * from GroupManager and registering a factory in GroupManagerRegistry.
 */
#pragma once
#include "siweauth/core/interfaces/ichain_provider.hpp"
#include "siweauth/core/types.hpp"
#include "siweauth/core/util/uint256.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace siweauth {

    /**
     * @class GroupManager
     * @brief Interface of a membership strategy.
     *
     * isMember() is called from worker threads, possibly for several wallets
     * at once, and must not mutate the strategy.
     */
    class GroupManager {
    public:
        virtual ~GroupManager() = default;

        /**
         * @brief Evaluate membership of a wallet.
         * @throws AuthError with AuthErr::ChainProviderUnavailable when the chain
         *         cannot be read; the caller leaves membership unchanged
         */
        virtual bool isMember(const Wallet& wallet, IChainProvider& provider) const = 0;

        /// Short description for logs, e.g. "erc20 0xdac1...".
        virtual std::string describe() const = 0;
    };

    /**
     * @class TokenOwnerManager
     * @brief Shared configuration and threshold logic of the token managers.
     *
     * Configuration keys: `contract` (required), `min_balance` (optional,
     * default 1, decimal or 0x hex).
     */
    class TokenOwnerManager : public GroupManager {
    public:
        const std::string& contract() const { return contract_; }
        const Uint256& minBalance() const { return minBalance_; }

        bool isMember(const Wallet& wallet, IChainProvider& provider) const override;
        std::string describe() const override;

    protected:
        /**
         * @param standard Token standard name used in error messages ("ERC20")
         * @param config JSON object with the keys listed above
         * @throws AuthError with AuthErr::ConfigurationError on missing or invalid keys
         */
        TokenOwnerManager(std::string standard, const nlohmann::json& config);

        /// Raw balance of the wallet as reported by the contract.
        virtual Uint256 balanceOf(const std::string& address, IChainProvider& provider) const = 0;

        /// Read a required key, throwing "<standard> Owner Manager config is missing <key> attribute."
        const nlohmann::json& required(const nlohmann::json& config, const char* key) const;

        std::string standard_;
        std::string contract_;
        Uint256     minBalance_{ 1 };
    };

    /// Member iff ERC-20 `balanceOf(owner)` >= min_balance.
    class ERC20OwnerManager : public TokenOwnerManager {
    public:
        explicit ERC20OwnerManager(const nlohmann::json& config);
    protected:
        Uint256 balanceOf(const std::string& address, IChainProvider& provider) const override;
    };

    /// Member iff ERC-721 `balanceOf(owner)` >= min_balance.
    class ERC721OwnerManager : public TokenOwnerManager {
    public:
        explicit ERC721OwnerManager(const nlohmann::json& config);
    protected:
        Uint256 balanceOf(const std::string& address, IChainProvider& provider) const override;
    };

    /**
     * @class ERC1155OwnerManager
     * @brief Member iff ERC-1155 `balanceOf(owner, token_id)` >= min_balance.
     *
     * Additional required key: `token_id`.
     */
    class ERC1155OwnerManager : public TokenOwnerManager {
    public:
        explicit ERC1155OwnerManager(const nlohmann::json& config);

        const Uint256& tokenId() const { return tokenId_; }
        std::string describe() const override;

    protected:
        Uint256 balanceOf(const std::string& address, IChainProvider& provider) const override;

    private:
        Uint256 tokenId_;
    };

}
