#include "siweauth/core/groups/group_registry.hpp"
#include "siweauth/core/util/error_types.hpp"
#include <format>
#include <set>

namespace siweauth {

    GroupManagerRegistry::GroupManagerRegistry()
    {
        registerType("erc20", [](const nlohmann::json& cfg) {
            return std::make_unique<ERC20OwnerManager>(cfg);
        });
        registerType("erc721", [](const nlohmann::json& cfg) {
            return std::make_unique<ERC721OwnerManager>(cfg);
        });
        registerType("erc1155", [](const nlohmann::json& cfg) {
            return std::make_unique<ERC1155OwnerManager>(cfg);
        });
    }

    void GroupManagerRegistry::registerType(const std::string& type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    bool GroupManagerRegistry::hasType(const std::string& type) const {
        return factories_.contains(type);
    }

    std::unique_ptr<GroupManager> GroupManagerRegistry::create(const std::string& type,
                                                               const nlohmann::json& config) const
    {
        auto it = factories_.find(type);
        if (it == factories_.end())
            throw AuthError(AuthErr::ConfigurationError, std::format("unknown group manager type '{}'", type));
        auto mgr = it->second(config);
        if (!mgr)
            throw AuthError(AuthErr::ConfigurationError, std::format("factory for '{}' returned no manager", type));
        return mgr;
    }

    std::vector<GroupBinding> GroupManagerRegistry::buildAll(const nlohmann::json& groups) const
    {
        if (!groups.is_array())
            throw AuthError(AuthErr::ConfigurationError, "groups must be an array");

        std::vector<GroupBinding> out;
        std::set<std::string> seen;
        for (const auto& entry : groups) {
            if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string() ||
                !entry.contains("type") || !entry["type"].is_string())
                throw AuthError(AuthErr::ConfigurationError, "group entries need string 'name' and 'type'");

            auto name = entry["name"].get<std::string>();
            if (name.empty())
                throw AuthError(AuthErr::ConfigurationError, "group name must not be empty");
            if (!seen.insert(name).second)
                throw AuthError(AuthErr::ConfigurationError, std::format("duplicate group '{}'", name));

            auto cfg = entry.value("config", nlohmann::json::object());
            out.push_back({ name, create(entry["type"].get<std::string>(), cfg) });
        }
        return out;
    }

}
