/**
 * @file group_registry.hpp
 * @brief Maps strategy type names to GroupManager factories.
 */
#pragma once
#include "siweauth/core/groups/group_manager.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace siweauth {

    /**
     * @struct GroupBinding
     * @brief A named group and the strategy deciding its membership.
     */
    struct GroupBinding {
        std::string                         name;
        std::shared_ptr<const GroupManager> manager;
    };

    /**
     * @class GroupManagerRegistry
     * @brief Builds strategies from configuration entries.
     *
     * Built-in types: "erc20", "erc721", "erc1155". Host applications register
     * their own types before loading configuration:
     * @code
     * registry.registerType("allowlist", [](const nlohmann::json& cfg) {
     *     return std::make_unique<AllowListManager>(cfg);
     * });
     * @endcode
     */
    class GroupManagerRegistry {
    public:
        using Factory = std::function<std::unique_ptr<GroupManager>(const nlohmann::json&)>;

        /// Registry with the built-in token owner types.
        GroupManagerRegistry();

        /**
         * @brief Register or replace a strategy type.
         */
        void registerType(const std::string& type, Factory factory);

        bool hasType(const std::string& type) const;

        /**
         * @brief Instantiate a strategy.
         * @throws AuthError with AuthErr::ConfigurationError for unknown types or
         *         invalid configuration
         */
        std::unique_ptr<GroupManager> create(const std::string& type, const nlohmann::json& config) const;

        /**
         * @brief Build bindings from a JSON array of
         * `{"name": ..., "type": ..., "config": {...}}` entries.
         * @throws AuthError with AuthErr::ConfigurationError on malformed entries
         *         or duplicate group names
         */
        std::vector<GroupBinding> buildAll(const nlohmann::json& groups) const;

    private:
        std::map<std::string, Factory> factories_;
    };

}
