#include "siweauth/core/chain/json_rpc_provider.hpp"
#include "siweauth/core/util/error_types.hpp"
#include "siweauth/core/util/hex.hpp"
#include "siweauth/core/util/logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <format>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace siweauth {

    namespace {

        struct Endpoint {
            bool        tls{ false };
            std::string host;
            std::string port;
            std::string target{ "/" };
        };

        Endpoint parseEndpoint(const std::string& url)
        {
            Endpoint ep;
            std::string_view rest(url);
            if (rest.starts_with("https://")) {
                ep.tls = true;
                ep.port = "443";
                rest.remove_prefix(8);
            }
            else if (rest.starts_with("http://")) {
                ep.port = "80";
                rest.remove_prefix(7);
            }
            else {
                throw AuthError(AuthErr::ConfigurationError,
                    std::format("provider URL must start with http:// or https://, got '{}'", url));
            }

            auto slash = rest.find('/');
            std::string_view authority = rest.substr(0, slash);
            if (slash != std::string_view::npos)
                ep.target = std::string(rest.substr(slash));

            if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
                ep.port = std::string(authority.substr(colon + 1));
                authority = authority.substr(0, colon);
            }
            ep.host = std::string(authority);
            if (ep.host.empty() || ep.port.empty())
                throw AuthError(AuthErr::ConfigurationError, std::format("invalid provider URL '{}'", url));
            return ep;
        }

    }

    namespace {

        using Deadline = std::chrono::steady_clock::time_point;

        /**
         * Runs one asynchronous step on a private io_context until it completes
         * or the call's deadline passes. On expiry the step is aborted, its
         * handler is drained and the call fails with ChainProviderUnavailable.
         */
        class Stepper {
        public:
            Stepper(asio::io_context& ioc, Deadline deadline) : ioc_(ioc), deadline_(deadline) {}

            template<class Initiate, class Abort>
            void run(std::string_view what, Initiate&& initiate, Abort&& abort)
            {
                beast::error_code ec;
                bool done = false;
                initiate([&](beast::error_code e, auto&&...) { ec = e; done = true; });

                ioc_.restart();
                ioc_.run_until(deadline_);
                if (!done) {
                    abort();
                    ioc_.restart();
                    ioc_.run();
                    throw AuthError(AuthErr::ChainProviderUnavailable,
                        std::format("provider {} timed out", what));
                }
                if (ec)
                    throw beast::system_error(ec);
            }

        private:
            asio::io_context& ioc_;
            Deadline          deadline_;
        };

    }

    struct JsonRpcProvider::Impl {
        Endpoint                  ep;
        std::chrono::milliseconds timeout;
        ssl::context              sslCtx{ ssl::context::tls_client };
        std::atomic_uint64_t      nextId{ 1 };

        std::string post(const std::string& body);

        template<class Stream>
        std::string exchange(Stream& stream, Stepper& step, const std::string& body);
    };

    template<class Stream>
    std::string JsonRpcProvider::Impl::exchange(Stream& stream, Stepper& step, const std::string& body)
    {
        http::request<http::string_body> req{ http::verb::post, ep.target, 11 };
        req.set(http::field::host, ep.host);
        req.set(http::field::user_agent, "siweauth/" BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();

        auto abort = [&] { beast::get_lowest_layer(stream).close(); };
        step.run("write", [&](auto handler) { http::async_write(stream, req, std::move(handler)); }, abort);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        step.run("read", [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); }, abort);

        if (res.result() != http::status::ok)
            throw AuthError(AuthErr::ChainProviderUnavailable,
                std::format("provider answered HTTP {}", res.result_int()));
        return res.body();
    }

    std::string JsonRpcProvider::Impl::post(const std::string& body)
    {
        asio::io_context ioc;
        Stepper step(ioc, std::chrono::steady_clock::now() + timeout);

        tcp::resolver resolver(ioc);
        tcp::resolver::results_type results;
        step.run("resolve",
            [&](auto handler) {
                resolver.async_resolve(ep.host, ep.port,
                    [&results, handler = std::move(handler)](beast::error_code ec,
                                                            tcp::resolver::results_type r) mutable {
                        results = std::move(r);
                        handler(ec);
                    });
            },
            [&] { resolver.cancel(); });

        if (!ep.tls) {
            beast::tcp_stream stream(ioc);
            auto abort = [&] { stream.close(); };
            step.run("connect", [&](auto handler) { stream.async_connect(results, std::move(handler)); }, abort);
            auto out = exchange(stream, step, body);
            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return out;
        }

        beast::ssl_stream<beast::tcp_stream> stream(ioc, sslCtx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), ep.host.c_str()))
            throw beast::system_error(
                beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));

        auto abort = [&] { beast::get_lowest_layer(stream).close(); };
        step.run("connect",
            [&](auto handler) { beast::get_lowest_layer(stream).async_connect(results, std::move(handler)); },
            abort);
        step.run("handshake",
            [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); },
            abort);
        auto out = exchange(stream, step, body);
        // servers often close without close_notify, so no TLS shutdown round trip
        beast::error_code ec;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
        return out;
    }

    JsonRpcProvider::JsonRpcProvider(const std::string& url, std::chrono::milliseconds timeout)
        : pImpl_(std::make_unique<Impl>())
    {
        pImpl_->ep = parseEndpoint(url);
        pImpl_->timeout = timeout;
        if (pImpl_->ep.tls) {
            pImpl_->sslCtx.set_default_verify_paths();
            pImpl_->sslCtx.set_verify_mode(ssl::verify_peer);
        }
        LOG_INFO(std::format("chain provider {}://{}:{}", pImpl_->ep.tls ? "https" : "http",
            pImpl_->ep.host, pImpl_->ep.port));
    }

    JsonRpcProvider::~JsonRpcProvider() = default;

    std::vector<std::uint8_t> JsonRpcProvider::call(const std::string& contract,
                                                    const std::string& method,
                                                    const std::vector<abi::Value>& args)
    {
        nlohmann::json req = {
            { "jsonrpc", "2.0" },
            { "id", pImpl_->nextId++ },
            { "method", "eth_call" },
            { "params", nlohmann::json::array({
                { { "to", contract }, { "data", toHex0x(abi::encodeCall(method, args)) } },
                "latest" }) },
        };

        std::string raw;
        try {
            raw = pImpl_->post(req.dump());
        }
        catch (const beast::system_error& e) {
            throw AuthError(AuthErr::ChainProviderUnavailable,
                std::format("eth_call {} on {}: {}", method, contract, e.code().message()));
        }

        auto res = nlohmann::json::parse(raw, nullptr, false);
        if (res.is_discarded() || !res.is_object())
            throw AuthError(AuthErr::ChainProviderUnavailable, "provider returned invalid JSON");

        if (auto err = res.find("error"); err != res.end() && !err->is_null()) {
            throw AuthError(AuthErr::ChainProviderUnavailable,
                std::format("eth_call {} on {} failed: {}", method, contract,
                    err->is_object() ? err->value("message", err->dump()) : err->dump()));
        }

        auto result = res.find("result");
        if (result == res.end() || !result->is_string())
            throw AuthError(AuthErr::ChainProviderUnavailable, "provider response has no result");

        try {
            return fromHex(result->get_ref<const std::string&>());
        }
        catch (const std::invalid_argument& e) {
            throw AuthError(AuthErr::ChainProviderUnavailable,
                std::format("provider result is not hex: {}", e.what()));
        }
    }

}
