/**
 * @file igroup_repository.hpp
 * @brief Persistence interface for named groups and their wallet members.
 */
#pragma once
#include <string>
#include <vector>

namespace siweauth {

    class IGroupRepository {
    public:
        virtual ~IGroupRepository() = default;

        /**
         * @brief Create a group if it does not exist.
         * @return true if the group was created by this call
         */
        virtual bool ensureGroup(const std::string& name) = 0;

        /// No-op if the wallet is already a member.
        virtual void addMember(const std::string& group, const std::string& address) = 0;
        /// No-op if the wallet is not a member.
        virtual void removeMember(const std::string& group, const std::string& address) = 0;

        virtual bool isMember(const std::string& group, const std::string& address) const = 0;

        /**
         * @brief Names of all groups the wallet belongs to, sorted.
         */
        virtual std::vector<std::string> groupsOf(const std::string& address) const = 0;
    };

}
