/**
 * @file json_rpc_provider.hpp
 * @brief IChainProvider over Ethereum JSON-RPC (`eth_call`).
 */
#pragma once
#include "siweauth/core/interfaces/ichain_provider.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace siweauth {

    /**
     * @class JsonRpcProvider
     * @brief Issues `eth_call` requests against a single HTTP or HTTPS endpoint.
     *
     * Each call opens its own connection, so the provider can be shared by the
     * worker threads of the group synchronizer without locking. Resolve,
     * connect, handshake, write and read share one deadline of `timeout`; a
     * call that misses it fails with ChainProviderUnavailable. A lookup still
     * inside the system resolver is released only when the resolver returns.
     */
    class JsonRpcProvider : public IChainProvider {
    public:
        /**
         * @param url Endpoint such as "https://mainnet.infura.io/v3/<key>" or
         *            "http://127.0.0.1:8545"
         * @param timeout Deadline for a whole call, from resolve to the last byte read
         * @throws AuthError with AuthErr::ConfigurationError for an unusable URL
         */
        explicit JsonRpcProvider(const std::string& url,
                                 std::chrono::milliseconds timeout = std::chrono::milliseconds(10'000));
        ~JsonRpcProvider() override;

        JsonRpcProvider(const JsonRpcProvider&) = delete;
        JsonRpcProvider& operator=(const JsonRpcProvider&) = delete;

        std::vector<std::uint8_t> call(const std::string& contract,
                                       const std::string& method,
                                       const std::vector<abi::Value>& args) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
