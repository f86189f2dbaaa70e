#include "siweauth/core/groups/group_sync.hpp"
#include "siweauth/core/util/error_types.hpp"
#include "siweauth/core/util/logger.hpp"
#include <format>
#include <future>

namespace siweauth {

    GroupSynchronizer::GroupSynchronizer(std::vector<GroupBinding> groups,
                                         std::shared_ptr<IGroupRepository> repo,
                                         std::shared_ptr<IChainProvider> provider,
                                         std::shared_ptr<ThreadPool> pool,
                                         std::chrono::milliseconds timeout)
        : groups_(std::move(groups))
        , repo_(std::move(repo))
        , provider_(std::move(provider))
        , pool_(std::move(pool))
        , timeout_(timeout)
    {
        if (!repo_ || !provider_ || !pool_)
            throw AuthError(AuthErr::ConfigurationError,
                "GroupSynchronizer requires a group repository, a chain provider and a thread pool");
        for (const auto& g : groups_)
            if (!g.manager)
                throw AuthError(AuthErr::ConfigurationError, std::format("group '{}' has no manager", g.name));
    }

    SyncReport GroupSynchronizer::sync(const Wallet& wallet)
    {
        SyncReport report;
        if (groups_.empty()) return report;

        for (const auto& g : groups_)
            if (repo_->ensureGroup(g.name))
                LOG_INFO(std::format("created group '{}'", g.name));

        // Tasks may outlive this call when they miss the deadline, so they own
        // everything they touch.
        std::vector<std::future<bool>> pending;
        pending.reserve(groups_.size());
        for (const auto& g : groups_) {
            pending.push_back(pool_->submit(
                [mgr = g.manager, provider = provider_, w = wallet]() {
                    return mgr->isMember(w, *provider);
                }));
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        for (std::size_t i = 0; i < groups_.size(); ++i) {
            const auto& g = groups_[i];
            auto& fut = pending[i];

            if (fut.wait_until(deadline) != std::future_status::ready) {
                LOG_WARN(std::format("group '{}' ({}): membership check timed out for {}",
                    g.name, g.manager->describe(), wallet.address));
                report.failed.push_back({ g.name, "timeout" });
                continue;
            }

            bool member = false;
            try {
                member = fut.get();
            }
            catch (const std::exception& e) {
                LOG_WARN(std::format("group '{}' ({}): membership check failed for {}: {}",
                    g.name, g.manager->describe(), wallet.address, e.what()));
                report.failed.push_back({ g.name, e.what() });
                continue;
            }

            bool current = repo_->isMember(g.name, wallet.address);
            if (member && !current) {
                repo_->addMember(g.name, wallet.address);
                report.added.push_back(g.name);
                LOG_INFO(std::format("{} added to group '{}'", wallet.address, g.name));
            }
            else if (!member && current) {
                repo_->removeMember(g.name, wallet.address);
                report.removed.push_back(g.name);
                LOG_INFO(std::format("{} removed from group '{}'", wallet.address, g.name));
            }
            else {
                report.kept.push_back(g.name);
            }
        }
        return report;
    }

}
