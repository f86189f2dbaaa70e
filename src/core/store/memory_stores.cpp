#include "siweauth/core/store/memory_stores.hpp"
#include <algorithm>

namespace siweauth {

    /*──────────────── Nonces ───────────────*/
    bool MemoryNonceStore::insert(const NonceRecord& rec) {
        std::scoped_lock lk(mx_);
        return nonces_.try_emplace(rec.value, rec).second;
    }

    bool MemoryNonceStore::consume(const std::string& value, std::uint64_t nowMs) {
        std::scoped_lock lk(mx_);
        auto it = nonces_.find(value);
        if (it == nonces_.end()) return false;
        auto& rec = it->second;
        if (rec.consumed || nowMs >= rec.expiresMs) return false;
        rec.consumed = true;
        return true;
    }

    std::size_t MemoryNonceStore::purgeExpired(std::uint64_t nowMs) {
        std::scoped_lock lk(mx_);
        return std::erase_if(nonces_, [nowMs](const auto& kv) {
            return kv.second.expiresMs <= nowMs;
        });
    }

    std::size_t MemoryNonceStore::size() const {
        std::scoped_lock lk(mx_);
        return nonces_.size();
    }

    /*──────────────── Sessions ───────────────*/
    bool MemorySessionStore::insert(const Session& s) {
        std::unique_lock lk(mx_);
        return sessions_.try_emplace(s.id, s).second;
    }

    std::optional<Session> MemorySessionStore::find(const std::string& id) const {
        std::shared_lock lk(mx_);
        if (auto it = sessions_.find(id); it != sessions_.end())
            return it->second;
        return std::nullopt;
    }

    RotateResult MemorySessionStore::rotate(const std::string& oldId, const Session& next) {
        std::unique_lock lk(mx_);
        auto it = sessions_.find(oldId);
        if (it == sessions_.end()) return RotateResult::NotFound;
        if (sessions_.contains(next.id)) return RotateResult::IdInUse;
        sessions_.erase(it);
        sessions_.emplace(next.id, next);
        return RotateResult::Ok;
    }

    void MemorySessionStore::erase(const std::string& id) {
        std::unique_lock lk(mx_);
        sessions_.erase(id);
    }

    std::size_t MemorySessionStore::purgeExpired(std::uint64_t nowMs) {
        std::unique_lock lk(mx_);
        return std::erase_if(sessions_, [nowMs](const auto& kv) {
            return kv.second.expiresMs <= nowMs;
        });
    }

    std::size_t MemorySessionStore::size() const {
        std::shared_lock lk(mx_);
        return sessions_.size();
    }

    /*──────────────── Wallets ───────────────*/
    std::pair<Wallet, bool> MemoryWalletRepository::getOrCreate(const std::string& address,
                                                                std::uint64_t nowMs) {
        std::unique_lock lk(mx_);
        if (auto it = wallets_.find(address); it != wallets_.end())
            return { it->second, false };
        Wallet w;
        w.address = address;
        w.createdMs = nowMs;
        wallets_.emplace(address, w);
        return { w, true };
    }

    std::optional<Wallet> MemoryWalletRepository::find(const std::string& address) const {
        std::shared_lock lk(mx_);
        if (auto it = wallets_.find(address); it != wallets_.end())
            return it->second;
        return std::nullopt;
    }

    void MemoryWalletRepository::update(const Wallet& wallet) {
        std::unique_lock lk(mx_);
        wallets_[wallet.address] = wallet;
    }

    bool MemoryWalletRepository::setActive(const std::string& address, bool active) {
        std::unique_lock lk(mx_);
        auto it = wallets_.find(address);
        if (it == wallets_.end()) return false;
        it->second.isActive = active;
        return true;
    }

    /*──────────────── Groups ───────────────*/
    bool MemoryGroupRepository::ensureGroup(const std::string& name) {
        std::unique_lock lk(mx_);
        return groups_.try_emplace(name).second;
    }

    void MemoryGroupRepository::addMember(const std::string& group, const std::string& address) {
        std::unique_lock lk(mx_);
        groups_[group].insert(address);
    }

    void MemoryGroupRepository::removeMember(const std::string& group, const std::string& address) {
        std::unique_lock lk(mx_);
        if (auto it = groups_.find(group); it != groups_.end())
            it->second.erase(address);
    }

    bool MemoryGroupRepository::isMember(const std::string& group, const std::string& address) const {
        std::shared_lock lk(mx_);
        auto it = groups_.find(group);
        return it != groups_.end() && it->second.contains(address);
    }

    std::vector<std::string> MemoryGroupRepository::groupsOf(const std::string& address) const {
        std::vector<std::string> out;
        {
            std::shared_lock lk(mx_);
            for (const auto& [name, members] : groups_)
                if (members.contains(address)) out.push_back(name);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    bool MemoryGroupRepository::hasGroup(const std::string& name) const {
        std::shared_lock lk(mx_);
        return groups_.contains(name);
    }

}
