/**
 * @file config.hpp
 * @brief Runtime configuration of the authentication core.
 *
 * Example file:
 * @code{.json}
 * {
 *   "domain": "example.com",
 *   "uri": "https://example.com",
 *   "provider": "https://mainnet.infura.io/v3/<key>",
 *   "create_groups_on_auth": true,
 *   "groups": [
 *     { "name": "usdt_owners", "type": "erc20",  "config": { "contract": "0xdAC17F958D2ee523a2206206994597C13D831ec7" } },
 *     { "name": "ens_holders", "type": "erc721", "config": { "contract": "0x57f1887a8BF19b14fC0dF6Fd9B2acc9Af147eA85" } }
 *   ]
 * }
 * @endcode
 */
#pragma once
#include "siweauth/core/groups/group_registry.hpp"
#include "siweauth/core/util/logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace siweauth {

    /**
     * @struct AuthConfig
     * @brief All tunables with their defaults. Durations are milliseconds.
     */
    struct AuthConfig {
        std::string                domain;                               ///< Required, expected SIWE domain
        std::optional<std::string> uri;                                  ///< Expected URI origin, unchecked if absent
        std::string                providerUrl;                          ///< Required, JSON-RPC endpoint
        bool                       csrfExempt{ false };
        bool                       createGroupsOnAuth{ false };
        bool                       createEnsProfileOnAuth{ true };
        std::vector<GroupBinding>  groups;
        std::uint64_t              sessionLifetimeMs{ 3ull * 60 * 60 * 1000 };
        std::uint64_t              sessionHardCeilingMs{ 0 };            ///< 0 = disabled
        std::uint64_t              nonceTtlMs{ 10 * 60 * 1000 };
        std::uint64_t              clockSkewMs{ 60'000 };
        std::uint64_t              groupSyncTimeoutMs{ 5'000 };
        std::uint64_t              providerTimeoutMs{ 10'000 };
        std::size_t                workerThreads{ 0 };                   ///< 0 = hardware concurrency
        LogLevel                   logLevel{ LogLevel::Info };

        /**
         * @brief Build a configuration from a JSON object.
         *
         * Unknown keys are ignored. Group entries are instantiated through the
         * registry, so custom strategy types must be registered beforehand.
         *
         * @throws AuthError with AuthErr::ConfigurationError on missing required
         *         keys, wrong types or invalid group definitions
         */
        static AuthConfig fromJson(const nlohmann::json& j,
                                   const GroupManagerRegistry& registry = GroupManagerRegistry{});

        /**
         * @brief Check required keys and value ranges.
         * @throws AuthError with AuthErr::ConfigurationError
         */
        void validate() const;
    };

    /**
     * @brief Read and parse a JSON configuration file.
     * @throws AuthError with AuthErr::ConfigurationError if the file cannot be
     *         read or parsed, or fromJson() rejects it
     */
    AuthConfig loadConfigFile(const std::string& path,
                              const GroupManagerRegistry& registry = GroupManagerRegistry{});

}
