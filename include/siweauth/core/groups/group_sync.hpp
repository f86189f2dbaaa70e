/**
 * @file group_sync.hpp
 * @brief Recomputes a wallet's strategy-backed group memberships at login.
 */
#pragma once
#include "siweauth/core/groups/group_registry.hpp"
#include "siweauth/core/interfaces/ichain_provider.hpp"
#include "siweauth/core/interfaces/igroup_repository.hpp"
#include "siweauth/core/util/thread_pool.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace siweauth {

    /**
     * @struct SyncFailure
     * @brief A group whose strategy could not be evaluated.
     */
    struct SyncFailure {
        std::string group;
        std::string reason;
    };

    /**
     * @struct SyncReport
     * @brief Outcome of one synchronization.
     */
    struct SyncReport {
        std::vector<std::string> added;      ///< Newly joined groups
        std::vector<std::string> removed;    ///< Groups left because the strategy said no
        std::vector<std::string> kept;       ///< Evaluated, membership unchanged
        std::vector<SyncFailure> failed;     ///< Not evaluated (provider error or timeout), unchanged

        bool ok() const { return failed.empty(); }
    };

    /**
     * @class GroupSynchronizer
     * @brief Evaluates every configured strategy for a wallet and applies the result.
     *
     * Strategies run in parallel on a ThreadPool and share one deadline. A
     * strategy that throws or misses the deadline is reported in
     * SyncReport::failed and its group is left as it was; the other groups are
     * still updated. Removal is eager: a wallet that no longer qualifies is
     * dropped from the group on this login.
     */
    class GroupSynchronizer {
    public:
        GroupSynchronizer(std::vector<GroupBinding> groups,
                          std::shared_ptr<IGroupRepository> repo,
                          std::shared_ptr<IChainProvider> provider,
                          std::shared_ptr<ThreadPool> pool,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

        /**
         * @brief Synchronize the groups of one wallet. Never throws for
         * strategy failures; repository errors propagate.
         */
        SyncReport sync(const Wallet& wallet);

        const std::vector<GroupBinding>& groups() const { return groups_; }

    private:
        std::vector<GroupBinding>         groups_;
        std::shared_ptr<IGroupRepository> repo_;
        std::shared_ptr<IChainProvider>   provider_;
        std::shared_ptr<ThreadPool>       pool_;
        std::chrono::milliseconds         timeout_;
    };

}
