/**
 * @file memory_stores.hpp
 * @brief In-process implementations of the storage interfaces.
 *
 * Suitable for tests and single-process deployments. Every operation takes the
 * store's lock, which gives the atomic consume/rotate semantics the
 * interfaces require.
 */
#pragma once
#include "siweauth/core/interfaces/inonce_store.hpp"
#include "siweauth/core/interfaces/isession_store.hpp"
#include "siweauth/core/interfaces/iwallet_repository.hpp"
#include "siweauth/core/interfaces/igroup_repository.hpp"
#include <ankerl/unordered_dense.h>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>

namespace siweauth {

    class MemoryNonceStore : public INonceStore {
    public:
        bool insert(const NonceRecord& rec) override;
        bool consume(const std::string& value, std::uint64_t nowMs) override;
        std::size_t purgeExpired(std::uint64_t nowMs) override;

        /// Number of stored records, consumed ones included.
        std::size_t size() const;

    private:
        ankerl::unordered_dense::map<std::string, NonceRecord> nonces_;
        mutable std::mutex mx_;
    };

    class MemorySessionStore : public ISessionStore {
    public:
        bool insert(const Session& s) override;
        std::optional<Session> find(const std::string& id) const override;
        RotateResult rotate(const std::string& oldId, const Session& next) override;
        void erase(const std::string& id) override;
        std::size_t purgeExpired(std::uint64_t nowMs) override;

        std::size_t size() const;

    private:
        ankerl::unordered_dense::map<std::string, Session> sessions_;
        mutable std::shared_mutex mx_;   // RW-lock
    };

    class MemoryWalletRepository : public IWalletRepository {
    public:
        std::pair<Wallet, bool> getOrCreate(const std::string& address, std::uint64_t nowMs) override;
        std::optional<Wallet> find(const std::string& address) const override;
        void update(const Wallet& wallet) override;

        /**
         * @brief Administrative toggle of the active flag (not used by the core).
         * @return false if the wallet does not exist
         */
        bool setActive(const std::string& address, bool active);

    private:
        ankerl::unordered_dense::map<std::string, Wallet> wallets_;
        mutable std::shared_mutex mx_;
    };

    class MemoryGroupRepository : public IGroupRepository {
    public:
        bool ensureGroup(const std::string& name) override;
        void addMember(const std::string& group, const std::string& address) override;
        void removeMember(const std::string& group, const std::string& address) override;
        bool isMember(const std::string& group, const std::string& address) const override;
        std::vector<std::string> groupsOf(const std::string& address) const override;

        bool hasGroup(const std::string& name) const;

    private:
        // group name -> member addresses
        ankerl::unordered_dense::map<std::string, std::set<std::string>> groups_;
        mutable std::shared_mutex mx_;
    };

}
