/**
 * @file ichain_provider.hpp
 * @brief Read-only access to blockchain state.
 */
#pragma once
#include "siweauth/core/chain/abi.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace siweauth {

    /**
     * @class IChainProvider
     * @brief Executes read-only contract calls against the latest block.
     *
     * Used by group membership strategies and the ENS resolver. Calls block
     * and may be issued from several worker threads at once, so
     * implementations must be thread-safe.
     */
    class IChainProvider {
    public:
        virtual ~IChainProvider() = default;

        /**
         * @brief Call a contract method and return the raw ABI-encoded result.
         *
         * @param contract Contract address
         * @param method Canonical method signature, e.g. "balanceOf(address)"
         * @param args Encoded in order after the selector
         * @return Raw return data
         * @throws AuthError with AuthErr::ChainProviderUnavailable on transport,
         *         timeout or node errors
         */
        virtual std::vector<std::uint8_t> call(const std::string& contract,
                                               const std::string& method,
                                               const std::vector<abi::Value>& args) = 0;
    };

}
