/**
 * @file isession_store.hpp
 * @brief Storage interface for authenticated sessions.
 */
#pragma once
#include "siweauth/core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace siweauth {

    /**
     * @enum RotateResult
     * @brief Outcome of an atomic session rotation.
     */
    enum class RotateResult {
        Ok,        ///< Old record removed, new record stored
        NotFound,  ///< Old record no longer present (e.g. rotated concurrently)
        IdInUse    ///< New id collides with a stored record; nothing changed
    };

    /**
     * @class ISessionStore
     * @brief Keyed storage of Session records with atomic rotation.
     */
    class ISessionStore {
    public:
        virtual ~ISessionStore() = default;

        /**
         * @brief Store a new session.
         * @return false if the id is already taken
         */
        virtual bool insert(const Session& s) = 0;

        virtual std::optional<Session> find(const std::string& id) const = 0;

        /**
         * @brief Replace oldId by next in one step. Two concurrent rotations of
         * the same id cannot both return Ok.
         */
        virtual RotateResult rotate(const std::string& oldId, const Session& next) = 0;

        /**
         * @brief Remove a session. Unknown ids are ignored.
         */
        virtual void erase(const std::string& id) = 0;

        /**
         * @brief Delete sessions whose expiry is at or before nowMs.
         * @return Number of sessions removed
         */
        virtual std::size_t purgeExpired(std::uint64_t nowMs) = 0;
    };

}
