/**
 * @file time.hpp
 * @brief Time utility functions for siweauth.
 *
 * All timestamps in the core are wall-clock milliseconds since the Unix epoch.
 * SIWE messages carry RFC 3339 timestamps, converted with the helpers below.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace siweauth {

    /**
     * @brief Source of the current time in epoch milliseconds. Injected so that
     * expiry behaviour can be driven deterministically in tests.
     */
    using Clock = std::function<std::uint64_t()>;

    /**
     * @brief Get the current wall-clock time in milliseconds since the Unix epoch.
     *
     * @return Current time in milliseconds since epoch (uint64_t)
     */
    inline std::uint64_t epochMillis()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(
            system_clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Parse an RFC 3339 timestamp ("2021-12-07T18:28:18.807Z",
     * "2021-12-07T20:28:18+02:00") to epoch milliseconds.
     *
     * Fractional seconds beyond millisecond precision are truncated.
     *
     * @return Epoch milliseconds, or std::nullopt if the text is not a valid timestamp
     */
    std::optional<std::int64_t> parseRfc3339(std::string_view text);

    /**
     * @brief Format epoch milliseconds as an RFC 3339 UTC timestamp with millisecond precision.
     */
    std::string formatRfc3339(std::int64_t epochMs);

}
