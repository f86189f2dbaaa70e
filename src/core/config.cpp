#include "siweauth/core/config.hpp"
#include "siweauth/core/util/error_types.hpp"
#include <format>
#include <fstream>

namespace siweauth {

    namespace {

        [[noreturn]] void bad(const std::string& what) {
            LOG_ERROR(std::format("configuration: {}", what));
            throw AuthError(AuthErr::ConfigurationError, what);
        }

        void readBool(const nlohmann::json& j, const char* key, bool& out) {
            auto it = j.find(key);
            if (it == j.end()) return;
            if (!it->is_boolean()) bad(std::format("'{}' must be a boolean", key));
            out = it->get<bool>();
        }

        void readUint(const nlohmann::json& j, const char* key, std::uint64_t& out) {
            auto it = j.find(key);
            if (it == j.end()) return;
            if (!it->is_number_integer() || it->get<std::int64_t>() < 0)
                bad(std::format("'{}' must be a non-negative integer", key));
            out = it->get<std::uint64_t>();
        }

        void readString(const nlohmann::json& j, const char* key, std::string& out) {
            auto it = j.find(key);
            if (it == j.end()) return;
            if (!it->is_string()) bad(std::format("'{}' must be a string", key));
            out = it->get<std::string>();
        }

    }

    AuthConfig AuthConfig::fromJson(const nlohmann::json& j, const GroupManagerRegistry& registry)
    {
        if (!j.is_object()) bad("configuration must be a JSON object");

        AuthConfig c;
        readString(j, "domain", c.domain);
        readString(j, "provider", c.providerUrl);

        std::string uri;
        readString(j, "uri", uri);
        if (!uri.empty()) c.uri = uri;

        readBool(j, "csrf_exempt", c.csrfExempt);
        readBool(j, "create_groups_on_auth", c.createGroupsOnAuth);
        readBool(j, "create_ens_profile_on_auth", c.createEnsProfileOnAuth);

        readUint(j, "session_lifetime_ms", c.sessionLifetimeMs);
        readUint(j, "session_hard_ceiling_ms", c.sessionHardCeilingMs);
        readUint(j, "nonce_ttl_ms", c.nonceTtlMs);
        readUint(j, "clock_skew_ms", c.clockSkewMs);
        readUint(j, "group_sync_timeout_ms", c.groupSyncTimeoutMs);
        readUint(j, "provider_timeout_ms", c.providerTimeoutMs);

        std::uint64_t threads = 0;
        readUint(j, "worker_threads", threads);
        c.workerThreads = static_cast<std::size_t>(threads);

        std::string level;
        readString(j, "log_level", level);
        if (!level.empty()) {
            auto lvl = parseLogLevel(level);
            if (!lvl) bad(std::format("unknown log_level '{}'", level));
            c.logLevel = *lvl;
        }

        if (auto it = j.find("groups"); it != j.end())
            c.groups = registry.buildAll(*it);

        c.validate();
        return c;
    }

    void AuthConfig::validate() const
    {
        if (domain.empty()) bad("'domain' is required");
        if (providerUrl.empty()) bad("'provider' is required");
        if (sessionLifetimeMs == 0) bad("'session_lifetime_ms' must be positive");
        if (nonceTtlMs == 0) bad("'nonce_ttl_ms' must be positive");
        if (groupSyncTimeoutMs == 0) bad("'group_sync_timeout_ms' must be positive");
        if (providerTimeoutMs == 0) bad("'provider_timeout_ms' must be positive");
        if (sessionHardCeilingMs != 0 && sessionHardCeilingMs < sessionLifetimeMs)
            LOG_WARN("session hard ceiling is shorter than the session lifetime");
    }

    AuthConfig loadConfigFile(const std::string& path, const GroupManagerRegistry& registry)
    {
        std::ifstream in(path);
        if (!in) bad(std::format("cannot open '{}'", path));

        auto j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded()) bad(std::format("'{}' is not valid JSON", path));

        auto cfg = AuthConfig::fromJson(j, registry);
        LOG_INFO(std::format("configuration loaded from {}: domain={}, {} group(s)", path, cfg.domain, cfg.groups.size()));
        return cfg;
    }

}
